//
// Express Renderer - shared middleware and application entry point
//

#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/ts_code_writer.hh>

#include <sstream>

namespace apigen::codegen {

namespace {
    std::vector<ts_param> handler_params(const std::string& req = "req", const std::string& next = "next") {
        return {{req, "Request", ""}, {"res", "Response", ""}, {next, "NextFunction", ""}};
    }
}

// ============================================================================
// Middleware
// ============================================================================

std::string ExpressRenderer::cors_middleware(const GenerationContext& ctx) const {
    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_default_import("cors", "cors");
    w.write_blank_line();
    w.write_line("const allowedOrigins = (process.env.CORS_ORIGIN || '*')");
    w.write_line("  .split(',')");
    w.write_line("  .map((origin" + w.annotate("string") + ") => origin.trim());");
    w.write_blank_line();
    w.write_line(w.export_const("corsMiddleware") + " = cors({");
    w.indent();
    w.write_line("origin: allowedOrigins.includes('*') ? '*' : allowedOrigins,");
    w.write_line("methods: ['GET', 'POST', 'PUT', 'DELETE', 'OPTIONS'],");
    w.write_line("allowedHeaders: ['Content-Type', 'Authorization'],");
    w.write_line("credentials: !allowedOrigins.includes('*')");
    w.unindent();
    w.write_line("});");
    w.finish();
    return out.str();
}

std::string ExpressRenderer::logging_middleware(const GenerationContext& ctx) const {
    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_type_import({"Request", "Response", "NextFunction"}, "express");
    w.write_blank_line();

    w.write_comment("One line per completed request; silent while testing");
    {
        auto fn = w.write_scope(w.export_const("requestLogger") + " = " + w.param_list(handler_params()) +
                                w.annotate("void") + " =>", ";");
        {
            auto quiet = w.write_if("process.env.NODE_ENV === 'test'");
            w.write_line("next();");
            w.write_line("return;");
        }
        w.write_blank_line();
        w.write_line("const started = Date.now();");
        {
            auto done = w.write_scope("res.on('finish', () =>", ");");
            w.write_line("const elapsed = Date.now() - started;");
            w.write_line("console.log(`${new Date().toISOString()} ${req.method} ${req.originalUrl} "
                         "${res.statusCode} ${elapsed}ms`);");
        }
        w.write_line("next();");
    }
    w.finish();
    return out.str();
}

std::string ExpressRenderer::validation_middleware(const GenerationContext& ctx) const {
    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    w.write_type_import({"Request", "Response", "NextFunction"}, "express");
    w.write_import({"validationResult"}, "express-validator");
    w.write_blank_line();

    {
        auto fn = w.write_scope(w.export_const("handleValidationErrors") + " = " +
                                w.param_list(handler_params()) + w.annotate("void") + " =>", ";");
        w.write_line("const errors = validationResult(req);");
        {
            auto failed = w.write_if("!errors.isEmpty()");
            w.write_line("res.status(400).json({");
            w.indent();
            w.write_line("success: false,");
            w.write_line("message: 'Validation failed',");
            w.write_line("errors: errors.array()");
            w.unindent();
            w.write_line("});");
            w.write_line("return;");
        }
        w.write_line("next();");
    }
    w.write_blank_line();

    w.write_comment("Errors carrying a numeric status keep it and their message; anything else is a 500");
    {
        std::vector<ts_param> params = {{"error", ts ? "Error & { status?: number }" : "", ""}};
        for (auto& p : handler_params("_req", "_next")) {
            params.push_back(p);
        }
        auto fn = w.write_scope(w.export_const("errorHandler") + " = " + w.param_list(params) +
                                w.annotate("void") + " =>", ";");
        w.write_line("const status = typeof error.status === 'number' ? error.status : 500;");
        {
            auto internal = w.write_if("status >= 500");
            w.write_line("console.error(error);");
        }
        w.write_line("res.status(status).json({");
        w.indent();
        w.write_line("success: false,");
        w.write_line("message: status >= 500 ? 'Internal server error' : error.message");
        w.unindent();
        w.write_line("});");
    }
    w.finish();
    return out.str();
}

// ============================================================================
// Application
// ============================================================================

std::string ExpressRenderer::application(const GenerationContext& ctx) const {
    const bool session = ctx.options.authentication == ir::auth_strategy::session;

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    // Environment first: the database connection reads it on import
    w.write_line(ts ? "import 'dotenv/config';" : "require('dotenv/config');");
    if (ts) {
        w.write_line("import express, { Request, Response } from 'express';");
    } else {
        w.write_default_import("express", "express");
    }
    if (session) {
        w.write_default_import("session", "express-session");
    }
    w.write_import({"corsMiddleware"}, "./middleware/cors");
    w.write_import({"requestLogger"}, "./middleware/logging");
    w.write_import({"errorHandler"}, "./middleware/validation");
    if (ctx.serves_auth()) {
        w.write_default_import("authRoutes", "./routes/auth");
    }
    for (const auto& m : ctx.models) {
        const express::model_names names(m);
        w.write_default_import(names.variable + "Routes", "./routes/" + names.route);
    }
    w.write_blank_line();

    w.write_line("const app = express();");
    w.write_line("const PORT = Number(process.env.PORT) || 3000;");
    w.write_blank_line();

    w.write_line("app.use(corsMiddleware);");
    w.write_line("app.use(express.json());");
    w.write_line("app.use(express.urlencoded({ extended: true }));");
    w.write_line("app.use(requestLogger);");
    if (session) {
        w.write_line("app.use(session({");
        w.indent();
        w.write_line("secret: process.env.SESSION_SECRET || 'development-secret',");
        w.write_line("resave: false,");
        w.write_line("saveUninitialized: false,");
        w.write_line("cookie: {");
        w.indent();
        w.write_line("httpOnly: true,");
        w.write_line("secure: process.env.NODE_ENV === 'production',");
        w.write_line("maxAge: 24 * 60 * 60 * 1000");
        w.unindent();
        w.write_line("}");
        w.unindent();
        w.write_line("}));");
    }
    w.write_blank_line();

    {
        auto health = w.write_scope("app.get('/health', (_req" + w.annotate("Request") + ", res" +
                                    w.annotate("Response") + ") =>", ");");
        w.write_line("res.json({ status: 'ok', timestamp: new Date().toISOString() });");
    }
    w.write_blank_line();

    if (ctx.serves_auth()) {
        w.write_line("app.use('/auth', authRoutes);");
    }
    for (const auto& m : ctx.models) {
        const express::model_names names(m);
        w.write_line("app.use('/" + route_segment(m) + "', " + names.variable + "Routes);");
    }
    w.write_blank_line();

    {
        auto missing = w.write_scope("app.use((req" + w.annotate("Request") + ", res" +
                                     w.annotate("Response") + ") =>", ");");
        w.write_line("res.status(404).json({ success: false, message: `Route ${req.method} ${req.originalUrl} not found` });");
    }
    w.write_blank_line();
    w.write_line("app.use(errorHandler);");
    w.write_blank_line();

    {
        auto serve = w.write_if("process.env.NODE_ENV !== 'test'");
        auto listen = w.write_scope("app.listen(PORT, () =>", ");");
        w.write_line("console.log(`Server listening on port ${PORT}`);");
    }
    w.write_blank_line();
    w.write_default_export("app");
    return out.str();
}

} // namespace apigen::codegen
