//
// Express Renderer - authentication artifacts (jwt and session)
//

#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/ts_code_writer.hh>

#include <sstream>

namespace apigen::codegen {

namespace {
    constexpr const char* DEV_SECRET = "'development-secret'";

    constexpr const char* TOKEN_USER = "{ userId: string; email: string; role: string }";

    std::string request_user(const TsCodeWriter& w) {
        return w.is_typescript() ? "(req as AuthenticatedRequest).user" : "req.user";
    }

    void write_json_error(TsCodeWriter& w, int status, const std::string& message) {
        w.write_line("res.status(" + std::to_string(status) + ").json({ success: false, message: " +
                     js_string(message) + " });");
    }

    std::vector<ts_param> middleware_params() {
        return {{"req", "Request", ""}, {"res", "Response", ""}, {"next", "NextFunction", ""}};
    }
}

// ============================================================================
// Entry
// ============================================================================

void ExpressRenderer::render_auth(const GenerationContext& ctx, std::vector<ir::generated_file>& files) const {
    const ir::model account = account_model(ctx);
    const express::model_names names(account);
    const auto lang = ctx.language_tag();

    auto add = [&](const std::string& stem, std::string content) {
        files.push_back({ctx.source_path(stem), std::move(content), ir::artifact_kind::source, lang});
    };

    add("src/models/" + names.model, account_record(ctx, account));
    if (ctx.options.is_relational()) {
        files.push_back({"src/schemas/" + route_segment(account) + ".sql", table_schema(ctx, account),
                         ir::artifact_kind::source, "sql"});
    }
    add("src/repositories/" + names.repository, repository(ctx, account, true));
    add("src/services/AuthService", auth_service(ctx, account));
    add("src/controllers/AuthController", auth_controller(ctx, account));
    add("src/middleware/auth", auth_middleware(ctx));
    add("src/middleware/authorize", authorize_middleware(ctx));
    add("src/routes/auth", auth_routes(ctx));
    add("src/validation/AuthValidation", auth_validation(ctx));
}

// ============================================================================
// Account Record
// ============================================================================

std::string ExpressRenderer::account_record(const GenerationContext& ctx, const ir::model& account) const {
    const std::string& M = account.name;
    const bool jwt = ctx.options.authentication == ir::auth_strategy::jwt;
    std::ostringstream out;
    out << record_definition(ctx, account) << "\n";

    if (ctx.options.is_typescript()) {
        out << "export interface LoginRequest {\n"
            << "  email: string;\n"
            << "  password: string;\n"
            << "}\n\n"
            << "export interface RegisterRequest {\n"
            << "  email: string;\n"
            << "  password: string;\n"
            << "  name: string;\n"
            << "  role?: string;\n"
            << "}\n\n"
            << "export interface Public" << M << " {\n"
            << "  id: string;\n"
            << "  email: string;\n"
            << "  name: string;\n"
            << "  role: string;\n"
            << "}\n\n"
            << "export interface AuthResult {\n";
        if (jwt) {
            out << "  token: string;\n";
        }
        out << "  user: Public" << M << ";\n"
            << "}\n";
        if (!jwt) {
            out << "\n"
                << "declare module 'express-session' {\n"
                << "  interface SessionData {\n"
                << "    user?: Public" << M << ";\n"
                << "  }\n"
                << "}\n";
        }
    } else {
        out << "/**\n"
            << " * @typedef {Object} LoginRequest\n"
            << " * @property {string} email\n"
            << " * @property {string} password\n"
            << " */\n\n"
            << "/**\n"
            << " * @typedef {Object} AuthResult\n";
        if (jwt) {
            out << " * @property {string} token\n";
        }
        out << " * @property {{ id: string, email: string, name: string, role: string }} user\n"
            << " */\n";
    }
    return out.str();
}

// ============================================================================
// AuthService
// ============================================================================

std::string ExpressRenderer::auth_service(const GenerationContext& ctx, const ir::model& account) const {
    const express::model_names names(account);
    const std::string& M = names.model;
    const std::string repo = "this." + lower_first(names.repository);
    const bool jwt = ctx.options.authentication == ir::auth_strategy::jwt;

    std::string default_role = "user";
    if (const ir::field* role = account.find_field("role"); role && role->default_value) {
        default_role = *role->default_value;
    }

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    if (jwt) {
        w.write_default_import("jwt", "jsonwebtoken");
    }
    w.write_default_import("bcrypt", "bcryptjs");
    w.write_import({names.repository}, "../repositories/" + names.repository);
    w.write_type_import({M, "LoginRequest", "RegisterRequest", "AuthResult", "Public" + M}, "../models/" + M);
    w.write_blank_line();
    w.write_line("const SALT_ROUNDS = 12;");
    w.write_blank_line();

    {
        auto cls = w.write_class("AuthError", "Error");
        cls.write_field("public", "status", "number");
        if (ts) {
            w.write_blank_line();
        }
        {
            auto fn = w.write_method("constructor", {{"status", "number", ""}, {"message", "string", ""}}, "");
            w.write_line("super(message);");
            w.write_line("this.name = 'AuthError';");
            w.write_line("this.status = status;");
        }
    }
    w.write_blank_line();

    {
        auto cls = w.write_class("AuthService");
        if (ts) {
            cls.write_field("private", lower_first(names.repository), names.repository);
            w.write_blank_line();
        }
        {
            auto fn = w.write_method("constructor", {}, "");
            w.write_line(repo + " = new " + names.repository + "();");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("register", {{"data", "RegisterRequest", ""}}, "AuthResult", true);
            w.write_line("const existing = await " + repo + ".findByEmail(data.email);");
            {
                auto taken = w.write_if("existing");
                w.write_line("throw new AuthError(409, 'An account with this email already exists');");
            }
            w.write_line("const password = await bcrypt.hash(data.password, SALT_ROUNDS);");
            w.write_line("const account = await " + repo + ".create({");
            w.indent();
            w.write_line("email: data.email,");
            w.write_line("password,");
            w.write_line("name: data.name,");
            w.write_line("role: data.role || " + js_string(default_role) + ",");
            w.write_line("isActive: true,");
            w.write_line("emailVerified: false");
            w.unindent();
            w.write_line("});");
            w.write_line("return this.buildResult(account);");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("login", {{"credentials", "LoginRequest", ""}}, "AuthResult", true);
            w.write_line("const account = await " + repo + ".findByEmail(credentials.email);");
            {
                auto missing = w.write_if("!account || account.isActive === false");
                w.write_line("throw new AuthError(401, 'Invalid credentials');");
            }
            w.write_line("const valid = await bcrypt.compare(credentials.password, account.password);");
            {
                auto wrong = w.write_if("!valid");
                w.write_line("throw new AuthError(401, 'Invalid credentials');");
            }
            w.write_line("await " + repo + ".updateLastLogin(account.id);");
            w.write_line("return this.buildResult(account);");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method(ts ? "private buildResult" : "buildResult", {{"account", M, ""}}, "AuthResult");
            w.write_line("const user" + w.annotate("Public" + M) +
                         " = { id: account.id, email: account.email, name: account.name, role: account.role };");
            if (jwt) {
                w.write_line("const token = jwt.sign(");
                w.indent();
                w.write_line("{ userId: account.id, email: account.email, role: account.role },");
                w.write_line(std::string("process.env.JWT_SECRET || ") + DEV_SECRET + ",");
                w.write_line(ts ? "{ expiresIn: (process.env.JWT_EXPIRES_IN || '15m') as jwt.SignOptions['expiresIn'] }"
                                : "{ expiresIn: process.env.JWT_EXPIRES_IN || '15m' }");
                w.unindent();
                w.write_line(");");
                w.write_line("return { token, user };");
            } else {
                w.write_line("return { user };");
            }
        }
    }
    w.finish();
    return out.str();
}

// ============================================================================
// AuthController
// ============================================================================

std::string ExpressRenderer::auth_controller(const GenerationContext& ctx, const ir::model&) const {
    const bool session = ctx.options.authentication == ir::auth_strategy::session;

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    w.write_type_import({"Request", "Response", "NextFunction"}, "express");
    w.write_import({"AuthService"}, "../services/AuthService");
    w.write_blank_line();

    auto write_handler = [&](const std::string& name, const std::string& call, int status,
                             const std::string& message) {
        auto fn = w.write_scope(name + " = async " + w.param_list(middleware_params()) +
                                w.annotate("Promise<void>") + " =>", ";");
        auto attempt = w.write_try();
        w.write_line("const result = await this.authService." + call + "(req.body);");
        if (session) {
            w.write_line("req.session.user = result.user;");
        }
        w.write_line("res.status(" + std::to_string(status) + ").json({ success: true, message: " +
                     js_string(message) + ", data: result });");
        auto failure = attempt.write_catch("error");
        w.write_line("next(error);");
    };

    {
        auto cls = w.write_class("AuthController");
        if (ts) {
            cls.write_field("private", "authService", "AuthService");
            w.write_blank_line();
        }
        {
            auto fn = w.write_method("constructor", {}, "");
            w.write_line("this.authService = new AuthService();");
        }
        w.write_blank_line();
        write_handler("register", "register", 201, "Registration successful");
        w.write_blank_line();
        write_handler("login", "login", 200, "Login successful");
    }
    w.finish();
    return out.str();
}

// ============================================================================
// Middleware
// ============================================================================

std::string ExpressRenderer::auth_middleware(const GenerationContext& ctx) const {
    const bool jwt = ctx.options.authentication == ir::auth_strategy::jwt;

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    w.write_type_import({"Request", "Response", "NextFunction"}, "express");
    if (jwt) {
        w.write_default_import("jwt", "jsonwebtoken");
    }
    w.write_blank_line();

    if (ts) {
        w.write_line("export interface AuthenticatedRequest extends Request {");
        w.write_line(std::string("  user?: ") + TOKEN_USER + ";");
        w.write_line("}");
        w.write_blank_line();
    }

    if (jwt) {
        auto fn = w.write_scope(w.export_const("authenticateToken") + " = " + w.param_list(middleware_params()) +
                                w.annotate("void") + " =>", ";");
        w.write_line("const header = req.headers.authorization;");
        w.write_line("const token = header && header.startsWith('Bearer ') ? header.slice(7) : undefined;");
        w.write_blank_line();
        {
            auto missing = w.write_if("!token");
            write_json_error(w, 401, "Access token required");
            w.write_line("return;");
        }
        w.write_blank_line();
        auto attempt = w.write_try();
        w.write_line(std::string("const payload = jwt.verify(token, process.env.JWT_SECRET || ") + DEV_SECRET + ")" +
                     (ts ? std::string(" as ") + TOKEN_USER : "") + ";");
        w.write_line(request_user(w) + " = { userId: payload.userId, email: payload.email, role: payload.role };");
        w.write_line("next();");
        auto failure = attempt.write_catch("");
        write_json_error(w, 403, "Invalid or expired token");
    } else {
        auto fn = w.write_scope(w.export_const("authenticateSession") + " = " + w.param_list(middleware_params()) +
                                w.annotate("void") + " =>", ";");
        w.write_line("const account = req.session.user;");
        {
            auto missing = w.write_if("!account");
            write_json_error(w, 401, "Authentication required");
            w.write_line("return;");
        }
        w.write_line(request_user(w) + " = { userId: account.id, email: account.email, role: account.role };");
        w.write_line("next();");
    }
    w.finish();
    return out.str();
}

std::string ExpressRenderer::authorize_middleware(const GenerationContext& ctx) const {
    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    w.write_type_import({"Request", "Response", "NextFunction"}, "express");
    w.write_type_import({"AuthenticatedRequest"}, "./auth");
    w.write_blank_line();

    w.write_line(std::string("const ROLE_PERMISSIONS") + (ts ? ": Record<string, string[]>" : "") + " = {");
    w.indent();
    for (size_t i = 0; i < ctx.auth.roles.size(); ++i) {
        const auto& r = ctx.auth.roles[i];
        std::string perms;
        for (size_t p = 0; p < r.permissions.size(); ++p) {
            perms += (p > 0 ? ", " : "") + js_string(r.permissions[p]);
        }
        w.write_line(js_string(r.name) + ": [" + perms + "]" + (i + 1 < ctx.auth.roles.size() ? "," : ""));
    }
    w.unindent();
    w.write_line("};");
    w.write_blank_line();

    {
        auto fn = w.write_scope(w.export_const("hasPermission") + " = " +
                                w.param_list({{"role", "string", ""}, {"permission", "string", ""}}) +
                                w.annotate("boolean") + " =>", ";");
        w.write_line("return (ROLE_PERMISSIONS[role] || []).includes(permission);");
    }
    w.write_blank_line();

    w.write_comment("Allow the request when the authenticated account has one of the given roles");
    {
        auto outer = w.write_scope(w.export_const("authorize") + " = (..." + "roles" + w.annotate("string[]") + ") =>");
        auto inner = w.write_scope("return " + w.param_list(middleware_params()) + w.annotate("void") + " =>", ";");
        w.write_line("const user = " + request_user(w) + ";");
        {
            auto missing = w.write_if("!user");
            write_json_error(w, 401, "Authentication required");
            w.write_line("return;");
        }
        {
            auto denied = w.write_if("roles.length > 0 && !roles.includes(user.role)");
            write_json_error(w, 403, "Insufficient permissions");
            w.write_line("return;");
        }
        w.write_line("next();");
    }
    w.write_blank_line();

    {
        auto outer = w.write_scope(w.export_const("requirePermission") + " = " +
                                   w.param_list({{"permission", "string", ""}}) + " =>");
        auto inner = w.write_scope("return " + w.param_list(middleware_params()) + w.annotate("void") + " =>", ";");
        w.write_line("const user = " + request_user(w) + ";");
        {
            auto denied = w.write_if("!user || !hasPermission(user.role, permission)");
            write_json_error(w, 403, "Insufficient permissions");
            w.write_line("return;");
        }
        w.write_line("next();");
    }
    w.finish();
    return out.str();
}

// ============================================================================
// Routes and Validation
// ============================================================================

std::string ExpressRenderer::auth_routes(const GenerationContext& ctx) const {
    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_import({"Router"}, "express");
    w.write_import({"AuthController"}, "../controllers/AuthController");
    w.write_import({"validateRegister", "validateLogin"}, "../validation/AuthValidation");
    w.write_blank_line();
    w.write_line("const router = Router();");
    w.write_line("const authController = new AuthController();");
    w.write_blank_line();
    for (const auto& ep : ctx.endpoints) {
        if (ep.operation == ir::endpoint_operation::registration) {
            w.write_line("router.post('/register', validateRegister, authController.register);");
        } else if (ep.operation == ir::endpoint_operation::login) {
            w.write_line("router.post('/login', validateLogin, authController.login);");
        }
    }
    w.write_blank_line();
    w.write_default_export("router");
    return out.str();
}

std::string ExpressRenderer::auth_validation(const GenerationContext& ctx) const {
    std::string roles;
    for (const auto& name : ctx.auth.role_names()) {
        roles += (roles.empty() ? "" : ", ") + js_string(name);
    }

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_import({"body"}, "express-validator");
    w.write_import({"handleValidationErrors"}, "../middleware/validation");
    w.write_blank_line();

    w.write_line(w.export_const("validateRegister") + " = [");
    w.indent();
    w.write_line("body('email').isEmail().withMessage('A valid email is required'),");
    w.write_line("body('password').isLength({ min: 8 }).withMessage('Password must be at least 8 characters'),");
    w.write_line("body('name').isString().trim().notEmpty().withMessage('Name is required'),");
    w.write_line("body('role').optional().isIn([" + roles + "]).withMessage('Unknown role'),");
    w.write_line("handleValidationErrors");
    w.unindent();
    w.write_line("];");
    w.write_blank_line();

    w.write_line(w.export_const("validateLogin") + " = [");
    w.indent();
    w.write_line("body('email').isEmail().withMessage('A valid email is required'),");
    w.write_line("body('password').notEmpty().withMessage('Password is required'),");
    w.write_line("handleValidationErrors");
    w.unindent();
    w.write_line("];");
    w.finish();
    return out.str();
}

} // namespace apigen::codegen
