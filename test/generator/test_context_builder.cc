//
// Tests for render context construction
//

#include <doctest/doctest.h>
#include <quickform/context_builder.hh>
#include <quickform/schema_parser.hh>
#include <quickform/validation.hh>
#include <quickform/version.hh>

using namespace quickform;
using namespace quickform::generator;

namespace {
    ir::schema load(const std::string& text) {
        schema::SchemaParser parser;
        auto result = validation::validate(parser.build_from_string(text));
        REQUIRE(result.validated.has_value());
        return *result.validated;
    }

    const value& get(const value& v, const std::string& key) {
        const value* found = v.find(key);
        REQUIRE_MESSAGE(found != nullptr, "missing key: " << key);
        return *found;
    }

    const std::string bank = R"(
config:
  storage: postgres
  project:
    name: Bank Service
    port: 8080
models:
  Account:
    features: [auth, search]
    fields:
      username:
        type: string
        required: true
        unique: true
      password: string
      balance:
        type: decimal
        default: 0
        storage:
          postgres:
            precision: 12
            scale: 2
      status:
        type: enum
        values: [open, frozen]
        default: open
      branch:
        type: reference
        target: BranchOffice
    methods:
      - name: deposit
        params:
          - name: amount
            type: number
        returns: Promise<void>
        body: this.balance += amount;
  BranchOffice:
    fields:
      city: string
)";
}

TEST_SUITE("Context Builder") {
    TEST_CASE("Model naming keys") {
        auto s = load(bank);
        auto ctx = build_model_context(s, s.models[1]);

        CHECK(get(ctx, "name").as_string() == "BranchOffice");
        CHECK(get(ctx, "class_name").as_string() == "BranchOffice");
        CHECK(get(ctx, "file_name").as_string() == "branch-office");
        CHECK(get(ctx, "var_name").as_string() == "branchOffice");
        CHECK(get(ctx, "plural").as_string() == "branchOffices");
        CHECK(get(ctx, "route").as_string() == "branch-offices");
        CHECK(get(ctx, "table_name").as_string() == "branch_offices");
        CHECK(get(ctx, "description").as_string().empty());
    }

    TEST_CASE("Field keys follow the storage backend") {
        auto s = load(bank);
        auto ctx = build_model_context(s, s.models[0]);
        const auto& fields = get(ctx, "fields").as_list();
        REQUIRE(fields.size() == 5);

        const value& username = fields[0];
        CHECK(get(username, "ts_type").as_string() == "string");
        CHECK(get(username, "required").as_bool());
        CHECK(get(username, "unique").as_bool());
        CHECK(get(username, "is_string").as_bool());
        CHECK(get(username, "sample").as_string() == "'sample username'");

        const value& password = fields[1];
        CHECK(get(password, "is_password").as_bool());

        const value& balance = fields[2];
        CHECK(get(balance, "sequelize_type").as_string() == "DataTypes.DECIMAL(12, 2)");
        CHECK(get(balance, "mongoose_type").as_string() == "mongoose.Schema.Types.Decimal128");
        CHECK(get(balance, "openapi_type").as_string() == "number");
        CHECK(get(balance, "openapi_format").as_string() == "double");
        CHECK(get(balance, "has_default").as_bool());
        CHECK(get(balance, "default_literal").as_string() == "0");
        REQUIRE(get(balance, "storage_options").as_list().size() == 2);
        CHECK(get(get(balance, "storage_options").as_list()[0], "name").as_string() == "precision");

        const value& status = fields[3];
        CHECK(get(status, "is_enum").as_bool());
        CHECK(get(status, "ts_type").as_string() == "'open' | 'frozen'");
        CHECK(get(status, "sequelize_type").as_string() == "DataTypes.ENUM('open', 'frozen')");
        CHECK(get(status, "default_literal").as_string() == "'open'");
        CHECK(get(status, "values").as_list().size() == 2);

        const value& branch = fields[4];
        CHECK(get(branch, "is_reference").as_bool());
        CHECK(get(branch, "target_class").as_string() == "BranchOffice");
        CHECK(get(branch, "target_file").as_string() == "branch-office");
        CHECK(get(branch, "sequelize_type").as_string() == "DataTypes.UUID");
        CHECK(get(branch, "openapi_format").as_string() == "uuid");
    }

    TEST_CASE("Options of other backends are ignored") {
        auto s = load(R"(
config:
  storage: sqlite
models:
  Item:
    fields:
      price:
        type: decimal
        storage:
          postgres:
            precision: 12
            scale: 2
)");
        auto ctx = build_model_context(s, s.models[0]);
        const value& price = get(ctx, "fields").as_list()[0];
        CHECK(get(price, "sequelize_type").as_string() == "DataTypes.DECIMAL");
        CHECK(get(price, "storage_options").as_list().empty());
    }

    TEST_CASE("Methods, features and derived lists") {
        auto s = load(bank);
        auto ctx = build_model_context(s, s.models[0]);

        const auto& methods = get(ctx, "methods").as_list();
        REQUIRE(methods.size() == 1);
        CHECK(get(methods[0], "signature").as_string() == "amount: number");
        CHECK(get(methods[0], "args").as_string() == "amount");
        CHECK(get(methods[0], "returns").as_string() == "Promise<void>");

        CHECK(get(get(ctx, "features"), "auth").as_bool());
        CHECK(get(get(ctx, "features"), "search").as_bool());
        CHECK_FALSE(get(get(ctx, "features"), "audit").as_bool());

        CHECK(get(ctx, "has_password").as_bool());
        CHECK(get(ctx, "hashes_password").as_bool());
        CHECK(get(ctx, "login_field").as_string() == "username");

        const auto& search = get(ctx, "search_fields").as_list();
        REQUIRE(search.size() == 1);
        CHECK(search[0].as_string() == "username");

        const auto& required = get(ctx, "required_fields").as_list();
        REQUIRE(required.size() == 1);
        CHECK(required[0].as_string() == "username");

        CHECK(get(get(ctx, "config"), "dialect").as_string() == "postgres");
        CHECK(get(get(ctx, "project"), "port").as_int() == 8080);
        CHECK(get(get(ctx, "project"), "package_name").as_string() == "bank-service");
    }

    TEST_CASE("Synthesized hooks follow declared hooks") {
        auto s = load(R"(
models:
  Note:
    fields:
      text: string
    hooks:
      - event: pre-remove
        body: console.log('bye');
)");
        ir::hook extra{"post-save", "Record an audit entry", "audit();", s.models[0].source};
        auto ctx = build_model_context(s, s.models[0], {extra});

        const auto& hooks = get(ctx, "hooks").as_list();
        REQUIRE(hooks.size() == 2);
        CHECK(get(hooks[0], "event").as_string() == "pre-remove");
        CHECK(get(hooks[0], "phase").as_string() == "pre");
        CHECK(get(hooks[0], "mongoose_hook").as_string() == "deleteOne");
        CHECK(get(hooks[0], "sequelize_hook").as_string() == "beforeDestroy");
        CHECK_FALSE(get(hooks[0], "synthesized").as_bool());

        CHECK(get(hooks[1], "event").as_string() == "post-save");
        CHECK(get(hooks[1], "sequelize_hook").as_string() == "afterSave");
        CHECK(get(hooks[1], "synthesized").as_bool());
    }

    TEST_CASE("Project context") {
        auto s = load(bank);
        std::vector<value> models;
        for (const auto& m : s.models) {
            models.push_back(build_model_context(s, m));
        }
        auto ctx = build_project_context(s, models);

        CHECK(get(ctx, "models").as_list().size() == 2);
        REQUIRE(get(ctx, "auth_models").as_list().size() == 1);
        CHECK(get(get(ctx, "auth_models").as_list()[0], "name").as_string() == "Account");
        CHECK(get(ctx, "search_models").as_list().size() == 1);
        CHECK(get(ctx, "has_auth_models").as_bool());

        const value& config = get(ctx, "config");
        CHECK(get(config, "auth").as_string() == "jwt");
        CHECK(get(config, "auth_enabled").as_bool());
        CHECK(get(config, "sql").as_bool());
        CHECK_FALSE(get(config, "email_enabled").as_bool());

        CHECK(get(get(ctx, "generator"), "name").as_string() == generator_name);
    }

    TEST_CASE("TypeScript literals") {
        CHECK(typescript_literal(ir::field_type::number, "42") == "42");
        CHECK(typescript_literal(ir::field_type::boolean, "false") == "false");
        CHECK(typescript_literal(ir::field_type::string, "it's") == "'it\\'s'");
        CHECK(typescript_literal(ir::field_type::date, "2024-01-01") == "'2024-01-01'");
    }
}
