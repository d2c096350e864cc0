//
// Deployment files per template tier
//

#include <apigen/packaging.hh>

#include <sstream>

namespace apigen::packaging {

namespace {
    ir::generated_file config_file(std::string path, std::string content, std::string language) {
        return {std::move(path), std::move(content), ir::artifact_kind::config, std::move(language)};
    }

    const char* const GITIGNORE = R"(# Dependencies
node_modules/
npm-debug.log*
yarn-debug.log*
yarn-error.log*

# Coverage
coverage/
*.lcov

# Environment
.env
.env.local
.env.*.local

# Build output
dist/
build/

# Editors
.vscode/
.idea/
*.swp

# OS files
.DS_Store
Thumbs.db

# Logs
logs/
*.log
)";

    std::string dockerfile(const ir::generation_options& options) {
        std::ostringstream out;
        out << "FROM node:18-alpine\n"
            << "\n"
            << "WORKDIR /app\n"
            << "\n"
            << "COPY package*.json ./\n"
            << "RUN npm ci\n"
            << "\n"
            << "COPY . .\n";
        if (options.is_typescript()) {
            out << "RUN npm run build\n";
        }
        out << "RUN npm prune --omit=dev\n"
            << "\n"
            << "ENV NODE_ENV=production\n"
            << "EXPOSE 3000\n"
            << "\n"
            << "CMD [\"npm\", \"start\"]\n";
        return out.str();
    }

    std::string docker_compose(const ir::generation_options& options) {
        std::ostringstream out;
        out << "version: '3.8'\n"
            << "\n"
            << "services:\n"
            << "  app:\n"
            << "    build: .\n"
            << "    ports:\n"
            << "      - \"3000:3000\"\n"
            << "    environment:\n"
            << "      - NODE_ENV=development\n"
            << "      - DATABASE_URL=${DATABASE_URL}\n";
        if (options.authentication == ir::auth_strategy::jwt) {
            out << "      - JWT_SECRET=${JWT_SECRET}\n"
                << "      - JWT_EXPIRES_IN=${JWT_EXPIRES_IN:-15m}\n";
        } else if (options.authentication == ir::auth_strategy::session) {
            out << "      - SESSION_SECRET=${SESSION_SECRET}\n";
        }
        out << "    depends_on:\n"
            << "      - db\n"
            << "\n"
            << "  db:\n";

        switch (options.database) {
            case ir::database_engine::postgresql:
                out << "    image: postgres:15\n"
                    << "    environment:\n"
                    << "      - POSTGRES_DB=${DB_NAME:-api_db}\n"
                    << "      - POSTGRES_USER=${DB_USER:-postgres}\n"
                    << "      - POSTGRES_PASSWORD=${DB_PASSWORD:-password}\n"
                    << "    ports:\n"
                    << "      - \"5432:5432\"\n"
                    << "    volumes:\n"
                    << "      - postgres_data:/var/lib/postgresql/data\n"
                    << "\n"
                    << "volumes:\n"
                    << "  postgres_data:\n";
                break;
            case ir::database_engine::mysql:
                out << "    image: mysql:8.0\n"
                    << "    environment:\n"
                    << "      - MYSQL_DATABASE=${DB_NAME:-api_db}\n"
                    << "      - MYSQL_USER=${DB_USER:-mysql}\n"
                    << "      - MYSQL_PASSWORD=${DB_PASSWORD:-password}\n"
                    << "      - MYSQL_ROOT_PASSWORD=${DB_ROOT_PASSWORD:-rootpassword}\n"
                    << "    ports:\n"
                    << "      - \"3306:3306\"\n"
                    << "    volumes:\n"
                    << "      - mysql_data:/var/lib/mysql\n"
                    << "\n"
                    << "volumes:\n"
                    << "  mysql_data:\n";
                break;
            case ir::database_engine::mongodb:
                out << "    image: mongo:6.0\n"
                    << "    environment:\n"
                    << "      - MONGO_INITDB_DATABASE=${DB_NAME:-api_db}\n"
                    << "    ports:\n"
                    << "      - \"27017:27017\"\n"
                    << "    volumes:\n"
                    << "      - mongo_data:/data/db\n"
                    << "\n"
                    << "volumes:\n"
                    << "  mongo_data:\n";
                break;
        }
        return out.str();
    }

    std::string ci_workflow(const ir::generation_options& options) {
        std::ostringstream out;
        out << "name: CI\n"
            << "\n"
            << "on:\n"
            << "  push:\n"
            << "    branches: [ main, develop ]\n"
            << "  pull_request:\n"
            << "    branches: [ main ]\n"
            << "\n"
            << "jobs:\n"
            << "  test:\n"
            << "    runs-on: ubuntu-latest\n"
            << "\n"
            << "    strategy:\n"
            << "      matrix:\n"
            << "        node-version: [18.x, 20.x]\n"
            << "\n"
            << "    steps:\n"
            << "      - uses: actions/checkout@v4\n"
            << "      - name: Use Node.js ${{ matrix.node-version }}\n"
            << "        uses: actions/setup-node@v4\n"
            << "        with:\n"
            << "          node-version: ${{ matrix.node-version }}\n"
            << "          cache: 'npm'\n"
            << "      - run: npm ci\n"
            << "      - run: npm run build --if-present\n";
        if (options.include_tests) {
            out << "      - run: npm test\n";
        }
        return out.str();
    }

    std::string eslint_config(const ir::generation_options& options) {
        std::ostringstream out;
        out << "module.exports = {\n"
            << "  env: {\n"
            << "    node: true,\n"
            << "    es2021: true,\n"
            << "    jest: true\n"
            << "  },\n";
        if (options.is_typescript()) {
            out << "  extends: ['eslint:recommended', 'plugin:@typescript-eslint/recommended'],\n"
                << "  parser: '@typescript-eslint/parser',\n"
                << "  plugins: ['@typescript-eslint'],\n";
        } else {
            out << "  extends: ['eslint:recommended'],\n";
        }
        out << "  parserOptions: {\n"
            << "    ecmaVersion: 2021,\n"
            << "    sourceType: '" << (options.is_typescript() ? "module" : "script") << "'\n"
            << "  },\n"
            << "  rules: {\n"
            << "    indent: ['error', 2],\n"
            << "    'linebreak-style': ['error', 'unix'],\n"
            << "    quotes: ['error', 'single'],\n"
            << "    semi: ['error', 'always']\n"
            << "  }\n"
            << "};\n";
        return out.str();
    }

    const char* const PRETTIER_CONFIG = R"({
  "semi": true,
  "trailingComma": "none",
  "singleQuote": true,
  "printWidth": 100,
  "tabWidth": 2
}
)";

    std::string k8s_deployment(const ir::generated_project& project) {
        const std::string& name = project.name;
        std::ostringstream out;
        out << "apiVersion: apps/v1\n"
            << "kind: Deployment\n"
            << "metadata:\n"
            << "  name: " << name << "\n"
            << "  labels:\n"
            << "    app: " << name << "\n"
            << "spec:\n"
            << "  replicas: 3\n"
            << "  selector:\n"
            << "    matchLabels:\n"
            << "      app: " << name << "\n"
            << "  template:\n"
            << "    metadata:\n"
            << "      labels:\n"
            << "        app: " << name << "\n"
            << "    spec:\n"
            << "      containers:\n"
            << "        - name: " << name << "\n"
            << "          image: " << name << ":latest\n"
            << "          ports:\n"
            << "            - containerPort: 3000\n"
            << "          env:\n"
            << "            - name: NODE_ENV\n"
            << "              value: \"production\"\n"
            << "            - name: DATABASE_URL\n"
            << "              valueFrom:\n"
            << "                secretKeyRef:\n"
            << "                  name: " << name << "-secrets\n"
            << "                  key: database-url\n";
        if (project.options.authentication == ir::auth_strategy::jwt) {
            out << "            - name: JWT_SECRET\n"
                << "              valueFrom:\n"
                << "                secretKeyRef:\n"
                << "                  name: " << name << "-secrets\n"
                << "                  key: jwt-secret\n";
        } else if (project.options.authentication == ir::auth_strategy::session) {
            out << "            - name: SESSION_SECRET\n"
                << "              valueFrom:\n"
                << "                secretKeyRef:\n"
                << "                  name: " << name << "-secrets\n"
                << "                  key: session-secret\n";
        }
        out << "          readinessProbe:\n"
            << "            httpGet:\n"
            << "              path: /health\n"
            << "              port: 3000\n"
            << "---\n"
            << "apiVersion: v1\n"
            << "kind: Service\n"
            << "metadata:\n"
            << "  name: " << name << "-service\n"
            << "spec:\n"
            << "  selector:\n"
            << "    app: " << name << "\n"
            << "  ports:\n"
            << "    - protocol: TCP\n"
            << "      port: 80\n"
            << "      targetPort: 3000\n"
            << "  type: LoadBalancer\n";
        return out.str();
    }

    std::string helm_chart(const ir::generated_project& project) {
        std::ostringstream out;
        out << "apiVersion: v2\n"
            << "name: " << project.name << "\n"
            << "description: A Helm chart for " << project.name << "\n"
            << "type: application\n"
            << "version: 0.1.0\n"
            << "appVersion: \"1.0.0\"\n";
        return out.str();
    }

    std::string prometheus_config(const ir::generated_project& project) {
        std::ostringstream out;
        out << "global:\n"
            << "  scrape_interval: 15s\n"
            << "\n"
            << "scrape_configs:\n"
            << "  - job_name: '" << project.name << "'\n"
            << "    static_configs:\n"
            << "      - targets: ['localhost:3000']\n"
            << "    metrics_path: '/metrics'\n";
        return out.str();
    }
}

std::vector<ir::generated_file> tier_files(const ir::generated_project& project, template_tier tier) {
    const auto& options = project.options;
    std::vector<ir::generated_file> files;

    // basic
    files.push_back(config_file(".gitignore", GITIGNORE, ""));
    files.push_back(config_file("Dockerfile", dockerfile(options), ""));
    files.push_back(config_file("docker-compose.yml", docker_compose(options), "yaml"));
    if (tier == template_tier::basic) {
        return files;
    }

    // advanced
    files.push_back(config_file(".github/workflows/ci.yml", ci_workflow(options), "yaml"));
    files.push_back(config_file(".eslintrc.js", eslint_config(options), "javascript"));
    files.push_back(config_file(".prettierrc", PRETTIER_CONFIG, "json"));
    if (tier == template_tier::advanced) {
        return files;
    }

    // enterprise
    files.push_back(config_file("k8s/deployment.yml", k8s_deployment(project), "yaml"));
    files.push_back(config_file("helm/Chart.yaml", helm_chart(project), "yaml"));
    files.push_back(config_file("monitoring/prometheus.yml", prometheus_config(project), "yaml"));
    return files;
}

} // namespace apigen::packaging
