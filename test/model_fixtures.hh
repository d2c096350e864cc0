//
// Model builders shared by the test files
//

#pragma once

#include <apigen/ir.hh>

#include <string>
#include <utility>
#include <vector>

namespace fixtures {

using namespace apigen::ir;

inline field make_field(const std::string& name, field_type type,
                        bool required = false, bool unique = false) {
    field f;
    f.id = "f_" + name;
    f.name = name;
    f.type = type;
    f.required = required;
    f.unique = unique;
    return f;
}

inline relationship make_relationship(const std::string& source, const std::string& target,
                                      relationship_kind kind = relationship_kind::one_to_many,
                                      const std::string& source_field = "id",
                                      const std::string& target_field = "id") {
    relationship r;
    r.id = source + "_" + target;
    r.kind = kind;
    r.source_model = source;
    r.target_model = target;
    r.source_field = source_field;
    r.target_field = target_field;
    return r;
}

inline model make_model(const std::string& name, std::vector<field> fields = {}) {
    model m;
    m.id = "m_" + name;
    m.name = name;
    m.fields = std::move(fields);
    return m;
}

/// Model with an `id` uuid field, so no identifier warning is raised
inline model keyed_model(const std::string& name) {
    return make_model(name, {make_field("id", field_type::uuid, true, true)});
}

/// User { name: string required, email: email required unique }
inline model user_model() {
    return make_model("User", {
        make_field("name", field_type::string, true),
        make_field("email", field_type::email, true, true)
    });
}

inline bool has_path(const std::vector<generated_file>& files, const std::string& path) {
    for (const auto& f : files) {
        if (f.path == path) {
            return true;
        }
    }
    return false;
}

} // namespace fixtures
