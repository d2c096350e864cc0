//
// Express Renderer Helpers Implementation
//

#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/type_tables.hh>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace apigen::codegen::express {

namespace {
    bool parses_as_number(const std::string& text, double& value) {
        if (text.empty()) return false;
        std::istringstream in(text);
        in >> value;
        return !in.fail() && in.eof();
    }

    std::string sql_default(const ir::field& f) {
        const std::string& text = *f.default_value;
        double number = 0;
        if (f.type == ir::field_type::boolean && (text == "true" || text == "false")) {
            return text;
        }
        if (is_numeric_type(f.type) && parses_as_number(text, number)) {
            return js_number(number);
        }
        return sql_string(text);
    }
}

std::vector<const ir::field*> record_fields(const ir::model& m) {
    std::vector<const ir::field*> out;
    out.reserve(m.fields.size());
    for (const auto& f : m.fields) {
        if (f.name == "id" || f.name == "createdAt" || f.name == "updatedAt") {
            continue;
        }
        out.push_back(&f);
    }
    return out;
}

std::string column_definition(const ir::field& f, ir::database_engine db) {
    std::string def = column_name(f.name, db) + " " + column_type(f.type, db);
    if (f.required) {
        def += " NOT NULL";
    }
    if (f.unique) {
        def += " UNIQUE";
    }
    if (f.default_value) {
        // MySQL rejects literal defaults on TEXT and JSON columns
        bool blob_column = db == ir::database_engine::mysql &&
                           (f.type == ir::field_type::text || f.type == ir::field_type::json);
        if (!blob_column) {
            def += " DEFAULT " + sql_default(f);
        }
    }
    return def;
}

std::string js_number(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<std::int64_t>(value));
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

std::string js_default(const ir::field& f) {
    const std::string& text = *f.default_value;
    double number = 0;
    if (f.type == ir::field_type::boolean && (text == "true" || text == "false")) {
        return text;
    }
    if (is_numeric_type(f.type) && parses_as_number(text, number)) {
        return js_number(number);
    }
    if (f.type == ir::field_type::json) {
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed.dump();
        }
    }
    return js_string(text);
}

model_names::model_names(const ir::model& m)
    : model(m.name),
      variable(lower_first(m.name)),
      service(m.name + "Service"),
      repository(m.name + "Repository"),
      controller(m.name + "Controller"),
      route(route_segment(m)),
      table(table_name(m))
{
}

} // namespace apigen::codegen::express
