//
// Built-in artifact templates
//
// Context keys expected by each template are listed above it. Field lists
// always carry every key the template reads so that per-element values
// shadow the outer context inside #each blocks.
//

#include <apigen/template_engine.hh>

namespace apigen::tmpl {

namespace {

// modelName, description, fields[{name, optional, tsType, doc}],
// inputFields[{name, optional, tsType}]
const char* const RECORD_INTERFACE = R"TPL({{#if description}}/**
 * {{description}}
 */
{{/if}}export interface {{modelName}} {
  id: string;
{{#each fields}}{{#if doc}}  /** {{doc}} */
{{/if}}  {{name}}{{optional}}: {{tsType}};
{{/each}}  createdAt: Date;
  updatedAt: Date;
}

export interface Create{{modelName}}Request {
{{#each inputFields}}  {{name}}{{optional}}: {{tsType}};
{{/each}}}

export interface Update{{modelName}}Request {
{{#each inputFields}}  {{name}}?: {{tsType}};
{{/each}}}
)TPL";

// modelName, description, fields[{jsDocType, jsDocName}],
// inputFields[{name, jsDocType, jsDocName}]
const char* const RECORD_TYPEDEF = R"TPL(/**
 * @typedef {Object} {{modelName}}
{{#if description}} * @description {{description}}
{{/if}} * @property {string} id
{{#each fields}} * @property {{jsDocType}} {{jsDocName}}
{{/each}} * @property {Date} createdAt
 * @property {Date} updatedAt
 */

/**
 * @typedef {Object} Create{{modelName}}Request
{{#each inputFields}} * @property {{jsDocType}} {{jsDocName}}
{{/each}} */

/**
 * @typedef {Object} Update{{modelName}}Request
{{#each inputFields}} * @property {{jsDocType}} [{{name}}]
{{/each}} */

module.exports = {};
)TPL";

// modelName, serviceName, serviceVar
const char* const EXPRESS_CONTROLLER = R"TPL(import { Request, Response, NextFunction } from 'express';
import { {{serviceName}} } from '../services/{{serviceName}}';
import { Create{{modelName}}Request, Update{{modelName}}Request } from '../models/{{modelName}}';

export class {{modelName}}Controller {
  private {{serviceVar}}: {{serviceName}};

  constructor() {
    this.{{serviceVar}} = new {{serviceName}}();
  }

  create = async (req: Request, res: Response, next: NextFunction): Promise<void> => {
    try {
      const data: Create{{modelName}}Request = req.body;
      const result = await this.{{serviceVar}}.create(data);
      res.status(201).json({
        success: true,
        data: result
      });
    } catch (error) {
      next(error);
    }
  };

  getById = async (req: Request, res: Response, next: NextFunction): Promise<void> => {
    try {
      const { id } = req.params;
      const result = await this.{{serviceVar}}.getById(id);

      if (!result) {
        res.status(404).json({
          success: false,
          message: '{{modelName}} not found'
        });
        return;
      }

      res.json({
        success: true,
        data: result
      });
    } catch (error) {
      next(error);
    }
  };

  getAll = async (req: Request, res: Response, next: NextFunction): Promise<void> => {
    try {
      const page = Math.max(Number(req.query.page) || 1, 1);
      const limit = Math.min(Math.max(Number(req.query.limit) || 10, 1), 100);
      const result = await this.{{serviceVar}}.getAll(page, limit);

      res.json({
        success: true,
        data: result.items,
        pagination: {
          page,
          limit,
          total: result.total,
          pages: Math.ceil(result.total / limit)
        }
      });
    } catch (error) {
      next(error);
    }
  };

  update = async (req: Request, res: Response, next: NextFunction): Promise<void> => {
    try {
      const { id } = req.params;
      const data: Update{{modelName}}Request = req.body;
      const result = await this.{{serviceVar}}.update(id, data);

      if (!result) {
        res.status(404).json({
          success: false,
          message: '{{modelName}} not found'
        });
        return;
      }

      res.json({
        success: true,
        data: result
      });
    } catch (error) {
      next(error);
    }
  };

  delete = async (req: Request, res: Response, next: NextFunction): Promise<void> => {
    try {
      const { id } = req.params;
      const deleted = await this.{{serviceVar}}.delete(id);

      if (!deleted) {
        res.status(404).json({
          success: false,
          message: '{{modelName}} not found'
        });
        return;
      }

      res.status(204).send();
    } catch (error) {
      next(error);
    }
  };
}
)TPL";

// modelName, serviceName, serviceVar
const char* const EXPRESS_CONTROLLER_JS = R"TPL(const { {{serviceName}} } = require('../services/{{serviceName}}');

class {{modelName}}Controller {
  constructor() {
    this.{{serviceVar}} = new {{serviceName}}();
  }

  create = async (req, res, next) => {
    try {
      const result = await this.{{serviceVar}}.create(req.body);
      res.status(201).json({
        success: true,
        data: result
      });
    } catch (error) {
      next(error);
    }
  };

  getById = async (req, res, next) => {
    try {
      const result = await this.{{serviceVar}}.getById(req.params.id);

      if (!result) {
        res.status(404).json({
          success: false,
          message: '{{modelName}} not found'
        });
        return;
      }

      res.json({
        success: true,
        data: result
      });
    } catch (error) {
      next(error);
    }
  };

  getAll = async (req, res, next) => {
    try {
      const page = Math.max(Number(req.query.page) || 1, 1);
      const limit = Math.min(Math.max(Number(req.query.limit) || 10, 1), 100);
      const result = await this.{{serviceVar}}.getAll(page, limit);

      res.json({
        success: true,
        data: result.items,
        pagination: {
          page,
          limit,
          total: result.total,
          pages: Math.ceil(result.total / limit)
        }
      });
    } catch (error) {
      next(error);
    }
  };

  update = async (req, res, next) => {
    try {
      const result = await this.{{serviceVar}}.update(req.params.id, req.body);

      if (!result) {
        res.status(404).json({
          success: false,
          message: '{{modelName}} not found'
        });
        return;
      }

      res.json({
        success: true,
        data: result
      });
    } catch (error) {
      next(error);
    }
  };

  delete = async (req, res, next) => {
    try {
      const deleted = await this.{{serviceVar}}.delete(req.params.id);

      if (!deleted) {
        res.status(404).json({
          success: false,
          message: '{{modelName}} not found'
        });
        return;
      }

      res.status(204).send();
    } catch (error) {
      next(error);
    }
  };
}

module.exports = { {{modelName}}Controller };
)TPL";

// tableName, description, columns[{definition}]
const char* const POSTGRESQL_SCHEMA = R"TPL({{#if description}}-- {{description}}
{{/if}}CREATE TABLE IF NOT EXISTS {{tableName}} (
  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),
{{#each columns}}  {{definition}},
{{/each}}  created_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),
  updated_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()
);

-- Keep updated_at current on every update
CREATE OR REPLACE FUNCTION update_updated_at_column()
RETURNS TRIGGER AS $$
BEGIN
  NEW.updated_at = NOW();
  RETURN NEW;
END;
$$ LANGUAGE plpgsql;

DROP TRIGGER IF EXISTS update_{{tableName}}_updated_at ON {{tableName}};

CREATE TRIGGER update_{{tableName}}_updated_at
  BEFORE UPDATE ON {{tableName}}
  FOR EACH ROW
  EXECUTE FUNCTION update_updated_at_column();
)TPL";

// tableName, description, columns[{definition}]
const char* const MYSQL_SCHEMA = R"TPL({{#if description}}-- {{description}}
{{/if}}CREATE TABLE IF NOT EXISTS {{tableName}} (
  id CHAR(36) PRIMARY KEY DEFAULT (UUID()),
{{#each columns}}  {{definition}},
{{/each}}  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
  updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

-- Keep updated_at current on every update
DROP TRIGGER IF EXISTS update_{{tableName}}_updated_at;

CREATE TRIGGER update_{{tableName}}_updated_at
  BEFORE UPDATE ON {{tableName}}
  FOR EACH ROW
  SET NEW.updated_at = CURRENT_TIMESTAMP;
)TPL";

} // anonymous namespace

void register_builtin_templates(TemplateEngine& engine) {
    engine.add_template("record-interface", RECORD_INTERFACE);
    engine.add_template("record-typedef", RECORD_TYPEDEF);
    engine.add_template("express-controller", EXPRESS_CONTROLLER);
    engine.add_template("express-controller-js", EXPRESS_CONTROLLER_JS);
    engine.add_template("postgresql-schema", POSTGRESQL_SCHEMA);
    engine.add_template("mysql-schema", MYSQL_SCHEMA);
}

} // namespace apigen::tmpl
