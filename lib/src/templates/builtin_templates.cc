//
// Built-in template set
//
// One Express + TypeScript backend: a data model, a request handler and a test
// per model, plus the project scaffolding around them. See context_builder.hh
// for the keys every template can use.
//

#include <quickform/builtin_templates.hh>

namespace quickform::templates {

namespace {

// ============================================================================
// Per-model templates
// ============================================================================

constexpr std::string_view model_mongoose = R"tmpl(
import mongoose, { Schema, Document, Model } from 'mongoose';
{{#if hashes_password}}
import bcrypt from 'bcryptjs';

const SALT_ROUNDS = 10;
{{/if}}

{{#if description}}
/** {{description}} */
{{/if}}
export interface {{class_name}}Document extends Document {
{{#each fields}}
  {{name}}{{#unless required}}?{{/unless}}: {{ts_type}};
{{/each}}
{{#each relations}}
{{#if many}}
  {{name}}: mongoose.Types.ObjectId[];
{{else}}
  {{name}}?: mongoose.Types.ObjectId;
{{/if}}
{{/each}}
{{#each methods}}
  {{name}}({{signature}}): {{returns}};
{{/each}}
{{#if hashes_password}}
  comparePassword(candidate: string): Promise<boolean>;
{{/if}}
}

const {{var_name}}Schema = new Schema<{{class_name}}Document>(
  {
{{#each fields}}
    {{name}}: {
      type: {{mongoose_type}},
{{#if required}}
      required: true,
{{/if}}
{{#if unique}}
      unique: true,
{{/if}}
{{#if is_enum}}
      enum: [{{values_literal}}],
{{/if}}
{{#if is_reference}}
      ref: '{{target_class}}',
{{/if}}
{{#if has_default}}
      default: {{default_literal}},
{{/if}}
{{#if is_password}}
      select: false,
{{/if}}
    },
{{/each}}
{{#each relations}}
{{#if many}}
    {{name}}: [{ type: Schema.Types.ObjectId, ref: '{{target_class}}' }],
{{else}}
    {{name}}: { type: Schema.Types.ObjectId, ref: '{{target_class}}' },
{{/if}}
{{/each}}
  },
  { timestamps: true },
);
{{#if features.search}}

{{var_name}}Schema.index({ {{#each search_fields}}{{this}}: 'text'{{#unless @last}}, {{/unless}}{{/each}} });
{{/if}}
{{#each hooks}}

{{#if description}}
// {{description}}
{{/if}}
{{#if phase == "pre"}}
{{var_name}}Schema.pre('{{mongoose_hook}}', async function () {
{{body | indent:2}}
});
{{else}}
{{var_name}}Schema.post('{{mongoose_hook}}', async function () {
{{body | indent:2}}
});
{{/if}}
{{/each}}
{{#each methods}}

{{#if description}}
/** {{description}} */
{{/if}}
{{var_name}}Schema.methods.{{name}} = function (this: {{class_name}}Document{{#if signature}}, {{signature}}{{/if}}): {{returns}} {
{{body | indent:2}}
};
{{/each}}
{{#if hashes_password}}

{{var_name}}Schema.methods.comparePassword = function (
  this: {{class_name}}Document,
  candidate: string,
): Promise<boolean> {
  return bcrypt.compare(candidate, String(this.password ?? ''));
};
{{/if}}

export const {{class_name}}: Model<{{class_name}}Document> =
  (mongoose.models.{{class_name}} as Model<{{class_name}}Document>) ||
  mongoose.model<{{class_name}}Document>('{{class_name}}', {{var_name}}Schema);
)tmpl";

constexpr std::string_view model_sequelize = R"tmpl(
import { DataTypes, Model, Optional } from 'sequelize';
import { sequelize } from '../database';
{{#each relations}}
import { {{target_class}} } from './{{target_file}}.model';
{{/each}}
{{#if hashes_password}}
import bcrypt from 'bcryptjs';

const SALT_ROUNDS = 10;
{{/if}}

export interface {{class_name}}Attributes {
  id: string;
{{#each fields}}
  {{name}}{{#unless required}}?{{/unless}}: {{ts_type}};
{{/each}}
}

export type {{class_name}}CreationAttributes = Optional<{{class_name}}Attributes, 'id'>;

{{#if description}}
/** {{description}} */
{{/if}}
export class {{class_name}}
  extends Model<{{class_name}}Attributes, {{class_name}}CreationAttributes>
  implements {{class_name}}Attributes
{
  declare id: string;
{{#each fields}}
  declare {{name}}{{#unless required}}?{{/unless}}: {{ts_type}};
{{/each}}
{{#each methods}}

{{#if description}}
  /** {{description}} */
{{/if}}
  {{name}}({{signature}}): {{returns}} {
{{body | indent:4}}
  }
{{/each}}
{{#if hashes_password}}

  comparePassword(candidate: string): Promise<boolean> {
    return bcrypt.compare(candidate, String(this.password ?? ''));
  }
{{/if}}
}

{{class_name}}.init(
  {
    id: { type: DataTypes.UUID, defaultValue: DataTypes.UUIDV4, primaryKey: true },
{{#each fields}}
    {{name}}: {
      type: {{sequelize_type}},
      allowNull: {{#if required}}false{{else}}true{{/if}},
{{#if unique}}
      unique: true,
{{/if}}
{{#if has_default}}
      defaultValue: {{default_literal}},
{{/if}}
    },
{{/each}}
  },
  { sequelize, tableName: '{{table_name}}', timestamps: true },
);
{{#each hooks}}

{{#if description}}
// {{description}}
{{/if}}
{{class_name}}.addHook('{{sequelize_hook}}', async (instance: {{class_name}}) => {
  await async function (this: {{class_name}}) {
{{body | indent:4}}
  }.call(instance);
});
{{/each}}

export function associate{{class_name}}(): void {
{{#each relations}}
{{#if owning}}
  {{class_name}}.{{#if many}}hasMany{{else}}hasOne{{/if}}({{target_class}}, { as: '{{name}}' });
{{else}}
  {{class_name}}.belongsTo({{target_class}}, { as: '{{name}}' });
{{/if}}
{{/each}}
}
)tmpl";

constexpr std::string_view credential_hook = R"tmpl(
{{#if config.sql}}
if (!this.changed('password')) return;
{{else}}
if (!this.isModified('password')) return;
{{/if}}
this.password = await bcrypt.hash(String(this.password), SALT_ROUNDS);
)tmpl";

constexpr std::string_view audit_hook = R"tmpl(
console.info('[audit] {{class_name}} saved', { id: String(this.id) });
)tmpl";

constexpr std::string_view handler = R"tmpl(
import { Router, Request, Response, NextFunction } from 'express';
import { {{class_name}} } from '../models/{{file_name}}.model';
{{#if features.search}}
import { search{{class_name}} } from '../search/{{file_name}}.search';
{{/if}}

const router = Router();

type Handler = (req: Request, res: Response, next: NextFunction) => Promise<void>;

const wrap = (handler: Handler) => (req: Request, res: Response, next: NextFunction) => {
  handler(req, res, next).catch(next);
};

const writableFields = [{{#each fields}}'{{name}}'{{#unless @last}}, {{/unless}}{{/each}}] as const;

function pickWritable(body: Record<string, unknown>): Record<string, unknown> {
  const data: Record<string, unknown> = {};
  for (const key of writableFields) {
    if (body[key] !== undefined) {
      data[key] = body[key];
    }
  }
  return data;
}
{{#if features.search}}

router.get(
  '/search',
  wrap(async (req, res) => {
    res.json(await search{{class_name}}(String(req.query.q ?? '')));
  }),
);
{{/if}}

router.get(
  '/',
  wrap(async (_req, res) => {
{{#if config.sql}}
    res.json(await {{class_name}}.findAll());
{{else}}
    res.json(await {{class_name}}.find().lean());
{{/if}}
  }),
);

router.get(
  '/:id',
  wrap(async (req, res) => {
{{#if config.sql}}
    const item = await {{class_name}}.findByPk(req.params.id);
{{else}}
    const item = await {{class_name}}.findById(req.params.id).lean();
{{/if}}
    if (!item) {
      res.status(404).json({ error: '{{class_name}} not found' });
      return;
    }
    res.json(item);
  }),
);

router.post(
  '/',
  wrap(async (req, res) => {
    const item = await {{class_name}}.create(pickWritable(req.body));
    res.status(201).json(item);
  }),
);

router.put(
  '/:id',
  wrap(async (req, res) => {
{{#if config.sql}}
    const item = await {{class_name}}.findByPk(req.params.id);
{{else}}
    const item = await {{class_name}}.findById(req.params.id);
{{/if}}
    if (!item) {
      res.status(404).json({ error: '{{class_name}} not found' });
      return;
    }
{{#if config.sql}}
    await item.update(pickWritable(req.body));
{{else}}
    item.set(pickWritable(req.body));
    await item.save();
{{/if}}
    res.json(item);
  }),
);

router.delete(
  '/:id',
  wrap(async (req, res) => {
{{#if config.sql}}
    const deleted = await {{class_name}}.destroy({ where: { id: req.params.id } });
{{else}}
    const deleted = await {{class_name}}.findByIdAndDelete(req.params.id);
{{/if}}
    if (!deleted) {
      res.status(404).json({ error: '{{class_name}} not found' });
      return;
    }
    res.status(204).end();
  }),
);

export default router;
)tmpl";

constexpr std::string_view test = R"tmpl(
import request from 'supertest';
import { app } from '../src/app';

const sample = {
{{#each fields}}
  {{name}}: {{sample}},
{{/each}}
};

describe('{{class_name}} API', () => {
  it('creates a {{var_name}}', async () => {
    const res = await request(app).post('/api/{{route}}').send(sample);
    expect(res.status).toBe(201);
  });

  it('lists {{plural}}', async () => {
    const res = await request(app).get('/api/{{route}}');
    expect(res.status).toBe(200);
    expect(Array.isArray(res.body)).toBe(true);
  });

  it('returns 404 for an unknown {{var_name}}', async () => {
{{#if config.sql}}
    const res = await request(app).get('/api/{{route}}/00000000-0000-0000-0000-000000000000');
{{else}}
    const res = await request(app).get('/api/{{route}}/000000000000000000000000');
{{/if}}
    expect(res.status).toBe(404);
  });
});
)tmpl";

constexpr std::string_view search_index = R"tmpl(
{{#if config.sql}}
import { Op } from 'sequelize';
{{/if}}
import { {{class_name}} } from '../models/{{file_name}}.model';

const SEARCH_FIELDS = [{{#each search_fields}}'{{this}}'{{#unless @last}}, {{/unless}}{{/each}}];

export async function search{{class_name}}(query: string, limit = 20) {
  if (!query.trim()) {
    return [];
  }
{{#if config.sql}}
  return {{class_name}}.findAll({
    where: {
      [Op.or]: SEARCH_FIELDS.map((field) => ({
        [field]: { [{{#if config.dialect == "postgres"}}Op.iLike{{else}}Op.like{{/if}}]: `%${query}%` },
      })),
    },
    limit,
  });
{{else}}
  void SEARCH_FIELDS;
  return {{class_name}}.find({ $text: { $search: query } }).limit(limit).lean();
{{/if}}
}
)tmpl";

// ============================================================================
// Project templates
// ============================================================================

constexpr std::string_view app = R"tmpl(
import express from 'express';
{{#if config.cors.enabled}}
import cors from 'cors';
{{/if}}
{{#if config.auth == "session"}}
import session from 'express-session';
{{/if}}
import { config } from './config';
import { routes } from './routes';

export const app = express();

app.use(express.json());
{{#if config.cors.enabled}}
app.use(cors({ origin: config.corsOrigins.length > 0 ? config.corsOrigins : true }));
{{/if}}
{{#if config.auth == "session"}}
app.use(
  session({
    secret: config.sessionSecret,
    resave: false,
    saveUninitialized: false,
  }),
);
{{/if}}

app.get('/health', (_req, res) => {
  res.json({ status: 'ok' });
});

app.use('/api', routes);

app.use((err: Error, _req: express.Request, res: express.Response, _next: express.NextFunction) => {
  console.error(err);
  res.status(500).json({ error: err.message });
});
)tmpl";

constexpr std::string_view server = R"tmpl(
import { app } from './app';
import { config } from './config';
import { connectDatabase } from './database';

async function main(): Promise<void> {
  await connectDatabase();
  app.listen(config.port, () => {
    console.log(`{{project.name}} listening on port ${config.port}`);
  });
}

main().catch((err) => {
  console.error(err);
  process.exit(1);
});
)tmpl";

constexpr std::string_view routes = R"tmpl(
import { Router } from 'express';
{{#if has_auth_models}}
{{#if config.auth_enabled}}
import { authRouter } from './middleware/auth';
{{/if}}
{{/if}}
{{#each models}}
import {{var_name}}Handler from './handlers/{{file_name}}.handler';
{{/each}}
{{#if config.sql}}
{{#each models}}
import { associate{{class_name}} } from './models/{{file_name}}.model';
{{/each}}

{{#each models}}
associate{{class_name}}();
{{/each}}
{{/if}}

export const routes = Router();

{{#each models}}
routes.use('/{{route}}', {{var_name}}Handler);
{{/each}}
{{#if has_auth_models}}
{{#if config.auth_enabled}}
routes.use('/auth', authRouter);
{{/if}}
{{/if}}
)tmpl";

constexpr std::string_view config = R"tmpl(
import 'dotenv/config';

function required(name: string, fallback?: string): string {
  const value = process.env[name] ?? fallback;
  if (value === undefined) {
    throw new Error(`Missing environment variable ${name}`);
  }
  return value;
}

export const config = {
  port: Number(process.env.PORT ?? {{project.port}}),
{{#if config.sql}}
{{#if config.dialect == "sqlite"}}
  databaseUrl: required('DATABASE_URL', 'sqlite:./{{project.package_name}}.sqlite'),
{{else}}
  databaseUrl: required('DATABASE_URL', 'postgres://localhost:5432/{{project.package_name}}'),
{{/if}}
{{else}}
  databaseUrl: required('DATABASE_URL', 'mongodb://localhost:27017/{{project.package_name}}'),
{{/if}}
{{#if config.auth == "jwt"}}
  jwtSecret: required('JWT_SECRET', 'change-me'),
  jwtExpiresIn: process.env.JWT_EXPIRES_IN ?? '1h',
{{/if}}
{{#if config.auth == "session"}}
  sessionSecret: required('SESSION_SECRET', 'change-me'),
{{/if}}
{{#if config.email_enabled}}
  emailApiKey: required('EMAIL_API_KEY', ''),
  emailFrom: process.env.EMAIL_FROM ?? 'no-reply@example.com',
{{/if}}
  corsOrigins: (process.env.CORS_ORIGINS ?? '{{config.cors.origins | join:","}}')
    .split(',')
    .filter((origin) => origin.length > 0),
};
)tmpl";

constexpr std::string_view database = R"tmpl(
{{#if config.sql}}
import { Sequelize } from 'sequelize';
import { config } from './config';

export const sequelize = new Sequelize(config.databaseUrl, { logging: false });

export async function connectDatabase(): Promise<void> {
  await sequelize.authenticate();
  await sequelize.sync();
}
{{else}}
import mongoose from 'mongoose';
import { config } from './config';

export async function connectDatabase(): Promise<void> {
  await mongoose.connect(config.databaseUrl);
}
{{/if}}
)tmpl";

constexpr std::string_view package = R"tmpl(
{
  "name": "{{project.package_name}}",
  "version": "0.1.0",
  "private": true,
  "description": "{{project.description}}",
  "scripts": {
    "build": "tsc",
    "start": "node dist/src/server.js",
    "dev": "ts-node src/server.ts",
    "test": "jest"
  },
  "dependencies": {
{{#if config.cors.enabled}}
    "cors": "^2.8.5",
{{/if}}
{{#if has_auth_models}}
    "bcryptjs": "^2.4.3",
{{/if}}
{{#if config.auth == "jwt"}}
    "jsonwebtoken": "^9.0.2",
{{/if}}
{{#if config.auth == "session"}}
    "express-session": "^1.18.0",
{{/if}}
{{#if config.sql}}
    "sequelize": "^6.37.3",
{{#if config.dialect == "postgres"}}
    "pg": "^8.12.0",
{{else}}
    "sqlite3": "^5.1.7",
{{/if}}
{{else}}
    "mongoose": "^8.5.1",
{{/if}}
{{#if config.email == "resend"}}
    "resend": "^3.5.0",
{{/if}}
{{#if config.email == "sendgrid"}}
    "@sendgrid/mail": "^8.1.3",
{{/if}}
{{#if config.email == "mailgun"}}
    "form-data": "^4.0.0",
    "mailgun.js": "^10.2.1",
{{/if}}
    "dotenv": "^16.4.5",
    "express": "^4.19.2"
  },
  "devDependencies": {
{{#if config.cors.enabled}}
    "@types/cors": "^2.8.17",
{{/if}}
{{#if has_auth_models}}
    "@types/bcryptjs": "^2.4.6",
{{/if}}
{{#if config.auth == "jwt"}}
    "@types/jsonwebtoken": "^9.0.6",
{{/if}}
{{#if config.auth == "session"}}
    "@types/express-session": "^1.18.0",
{{/if}}
    "@types/express": "^4.17.21",
    "@types/jest": "^29.5.12",
    "@types/node": "^20.14.10",
    "@types/supertest": "^6.0.2",
    "jest": "^29.7.0",
    "supertest": "^7.0.0",
    "ts-jest": "^29.2.3",
    "ts-node": "^10.9.2",
    "typescript": "^5.5.3"
  },
  "jest": {
    "preset": "ts-jest",
    "testEnvironment": "node"
  }
}
)tmpl";

constexpr std::string_view tsconfig = R"tmpl(
{
  "compilerOptions": {
    "target": "ES2020",
    "module": "commonjs",
    "outDir": "dist",
    "strict": true,
    "esModuleInterop": true,
    "skipLibCheck": true
  },
  "include": ["src", "tests"]
}
)tmpl";

constexpr std::string_view env = R"tmpl(
PORT={{project.port}}
{{#if config.sql}}
{{#if config.dialect == "sqlite"}}
DATABASE_URL=sqlite:./{{project.package_name}}.sqlite
{{else}}
DATABASE_URL=postgres://localhost:5432/{{project.package_name}}
{{/if}}
{{else}}
DATABASE_URL=mongodb://localhost:27017/{{project.package_name}}
{{/if}}
{{#if config.auth == "jwt"}}
JWT_SECRET=change-me
JWT_EXPIRES_IN=1h
{{/if}}
{{#if config.auth == "session"}}
SESSION_SECRET=change-me
{{/if}}
{{#if config.email_enabled}}
EMAIL_API_KEY=
EMAIL_FROM=no-reply@example.com
{{/if}}
CORS_ORIGINS={{config.cors.origins | join:","}}
)tmpl";

constexpr std::string_view openapi = R"tmpl(
openapi: 3.0.3
info:
  title: {{project.name}}
  version: 0.1.0
{{#if project.description}}
  description: {{project.description}}
{{/if}}
paths:
{{#each models}}
  /api/{{route}}:
    get:
      summary: List {{plural}}
      tags: [{{class_name}}]
      responses:
        '200':
          description: OK
          content:
            application/json:
              schema:
                type: array
                items:
                  $ref: '#/components/schemas/{{class_name}}'
    post:
      summary: Create a {{var_name}}
      tags: [{{class_name}}]
      requestBody:
        required: true
        content:
          application/json:
            schema:
              $ref: '#/components/schemas/{{class_name}}'
      responses:
        '201':
          description: Created
  /api/{{route}}/{id}:
    parameters:
      - name: id
        in: path
        required: true
        schema:
          type: string
    get:
      summary: Get a {{var_name}}
      tags: [{{class_name}}]
      responses:
        '200':
          description: OK
        '404':
          description: Not found
    put:
      summary: Update a {{var_name}}
      tags: [{{class_name}}]
      responses:
        '200':
          description: OK
        '404':
          description: Not found
    delete:
      summary: Delete a {{var_name}}
      tags: [{{class_name}}]
      responses:
        '204':
          description: Deleted
        '404':
          description: Not found
{{/each}}
components:
  schemas:
{{#each models}}
    {{class_name}}:
      type: object
{{#if required_fields}}
      required: [{{required_fields | join:", "}}]
{{/if}}
      properties:
{{#each fields}}
        {{name}}:
          type: {{openapi_type}}
{{#if openapi_format}}
          format: {{openapi_format}}
{{/if}}
{{#if is_enum}}
          enum: [{{values | join:", "}}]
{{/if}}
{{/each}}
{{/each}}
)tmpl";

constexpr std::string_view readme = R"tmpl(
# {{project.name}}

{{#if project.description}}
{{project.description}}

{{/if}}
Generated by {{generator.name}} {{generator.version}}.

## Stack

- Express + TypeScript
{{#if config.sql}}
- Sequelize ({{config.dialect}})
{{else}}
- MongoDB via Mongoose
{{/if}}
{{#if config.auth_enabled}}
- Authentication: {{config.auth}}
{{/if}}
{{#if config.email_enabled}}
- Email: {{config.email}}
{{/if}}

## Getting started

```sh
npm install
cp .env.example .env
npm run dev
```

## Resources

| Model | Route | Fields |
|---|---|---|
{{#each models}}
| {{class_name}} | `/api/{{route}}` | {{#each fields}}{{name}}{{#unless @last}}, {{/unless}}{{/each}} |
{{/each}}
)tmpl";

constexpr std::string_view auth_middleware = R"tmpl(
import { Router, Request, Response, NextFunction } from 'express';
{{#if config.auth == "jwt"}}
import jwt from 'jsonwebtoken';
import { config } from '../config';
{{/if}}
{{#each auth_models}}
import { {{class_name}} } from '../models/{{file_name}}.model';
{{/each}}

export interface AuthUser {
  id: string;
  model: string;
}
{{#if config.auth == "jwt"}}

export interface AuthenticatedRequest extends Request {
  user?: AuthUser;
}

export function requireAuth(req: AuthenticatedRequest, res: Response, next: NextFunction): void {
  const header = req.headers.authorization ?? '';
  const token = header.startsWith('Bearer ') ? header.slice(7) : '';
  try {
    req.user = jwt.verify(token, config.jwtSecret) as AuthUser;
    next();
  } catch {
    res.status(401).json({ error: 'Unauthorized' });
  }
}
{{else}}

declare module 'express-session' {
  interface SessionData {
    user?: AuthUser;
  }
}

export function requireAuth(req: Request, res: Response, next: NextFunction): void {
  if (!req.session.user) {
    res.status(401).json({ error: 'Unauthorized' });
    return;
  }
  next();
}
{{/if}}

export const authRouter = Router();
{{#each auth_models}}
{{#if has_password}}

authRouter.post('/{{route}}/login', async (req: Request, res: Response, next: NextFunction) => {
  try {
    const { {{login_field}}: login, password } = req.body ?? {};
{{#if config.sql}}
    const account = await {{class_name}}.findOne({ where: { {{login_field}}: login } });
{{else}}
    const account = await {{class_name}}.findOne({ {{login_field}}: login }).select('+password');
{{/if}}
    if (!account || !(await account.comparePassword(String(password ?? '')))) {
      res.status(401).json({ error: 'Invalid credentials' });
      return;
    }
    const user: AuthUser = { id: String(account.id), model: '{{class_name}}' };
{{#if config.auth == "jwt"}}
    const token = jwt.sign(user, config.jwtSecret, { expiresIn: config.jwtExpiresIn } as jwt.SignOptions);
    res.json({ token });
{{else}}
    req.session.user = user;
    res.json({ ok: true });
{{/if}}
  } catch (err) {
    next(err);
  }
});
{{/if}}
{{/each}}
)tmpl";

constexpr std::string_view mailer = R"tmpl(
import { config } from '../config';
{{#if config.email == "resend"}}
import { Resend } from 'resend';

const client = new Resend(config.emailApiKey);

export async function sendMail(to: string, subject: string, html: string): Promise<void> {
  await client.emails.send({ from: config.emailFrom, to, subject, html });
}
{{/if}}
{{#if config.email == "sendgrid"}}
import sgMail from '@sendgrid/mail';

sgMail.setApiKey(config.emailApiKey);

export async function sendMail(to: string, subject: string, html: string): Promise<void> {
  await sgMail.send({ from: config.emailFrom, to, subject, html });
}
{{/if}}
{{#if config.email == "mailgun"}}
import formData from 'form-data';
import Mailgun from 'mailgun.js';

const client = new Mailgun(formData).client({ username: 'api', key: config.emailApiKey });
const domain = config.emailFrom.split('@')[1] ?? '';

export async function sendMail(to: string, subject: string, html: string): Promise<void> {
  await client.messages.create(domain, { from: config.emailFrom, to, subject, html });
}
{{/if}}
)tmpl";

// Raw strings open with a newline for readability
constexpr std::string_view body(std::string_view text) {
    return text.substr(text.front() == '\n' ? 1 : 0);
}

} // anonymous namespace

const std::map<std::string, std::string_view>& builtin_templates() {
    static const std::map<std::string, std::string_view> templates = {
        {"model.mongoose", body(model_mongoose)},
        {"model.sequelize", body(model_sequelize)},
        {"credential-hook", body(credential_hook)},
        {"audit-hook", body(audit_hook)},
        {"handler", body(handler)},
        {"test", body(test)},
        {"search-index", body(search_index)},
        {"app", body(app)},
        {"server", body(server)},
        {"routes", body(routes)},
        {"config", body(config)},
        {"database", body(database)},
        {"package", body(package)},
        {"tsconfig", body(tsconfig)},
        {"env", body(env)},
        {"openapi", body(openapi)},
        {"readme", body(readme)},
        {"auth-middleware", body(auth_middleware)},
        {"mailer", body(mailer)},
    };
    return templates;
}

std::vector<std::string> list_builtin_templates() {
    std::vector<std::string> ids;
    for (const auto& [id, _] : builtin_templates()) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace quickform::templates
