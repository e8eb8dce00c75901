//
// Tests for the generation orchestrator
//

#include <doctest/doctest.h>
#include <quickform/generator.hh>
#include <quickform/schema_parser.hh>
#include <quickform/validation.hh>
#include "../test_support.hh"
#include <algorithm>
#include <stdexcept>

using namespace quickform;
using namespace quickform::generator;

namespace {
    ir::schema load(const std::string& text) {
        schema::SchemaParser parser;
        auto result = validation::validate(parser.build_from_string(text));
        REQUIRE(result.validated.has_value());
        return *result.validated;
    }

    std::vector<std::string> ids(const std::vector<planned_artifact>& plan) {
        std::vector<std::string> out;
        for (const auto& p : plan) {
            out.push_back(p.template_id);
        }
        return out;
    }

    std::vector<std::string> paths(const generation_result& result) {
        std::vector<std::string> out;
        for (const auto& a : result.artifacts) {
            out.push_back(a.path());
        }
        return out;
    }

    const artifact* find(const generation_result& result, const std::string& path) {
        for (const auto& a : result.artifacts) {
            if (a.path() == path) {
                return &a;
            }
        }
        return nullptr;
    }

    const std::string shop = R"(
config:
  email: resend
models:
  Customer:
    features: [auth, audit]
    fields:
      email:
        type: string
        required: true
        unique: true
      password: string
  Product:
    features: [search]
    fields:
      title: string
      price: decimal
    relations:
      - target: Customer
        cardinality: one
        ownership: owned
)";
}

TEST_SUITE("Generator") {
    TEST_CASE("Model plan follows storage and features") {
        auto s = load(shop);
        CHECK(ids(plan_model_artifacts(s.models[0], s.config)) ==
              std::vector<std::string>{"model.mongoose", "handler", "test"});
        CHECK(ids(plan_model_artifacts(s.models[1], s.config)) ==
              std::vector<std::string>{"model.mongoose", "handler", "test", "search-index"});

        ir::config sql = s.config;
        sql.storage = ir::storage_backend::sqlite;
        CHECK(ids(plan_model_artifacts(s.models[0], sql)).front() == "model.sequelize");
    }

    TEST_CASE("Project plan follows config and models") {
        auto s = load(shop);
        auto plan = ids(plan_project_artifacts(s));
        CHECK(std::count(plan.begin(), plan.end(), "auth-middleware") == 1);
        CHECK(std::count(plan.begin(), plan.end(), "mailer") == 1);

        auto plain = load("models:\n  Item:\n    fields:\n      name: string\n");
        auto basic = ids(plan_project_artifacts(plain));
        CHECK(std::count(basic.begin(), basic.end(), "auth-middleware") == 0);
        CHECK(std::count(basic.begin(), basic.end(), "mailer") == 0);
        CHECK(std::count(basic.begin(), basic.end(), "readme") == 1);
    }

    TEST_CASE("Every planned artifact is rendered, sorted by path") {
        auto s = load(shop);
        Generator gen;
        auto result = gen.generate(s);

        REQUIRE(result.ok());
        auto p = paths(result);
        CHECK(std::is_sorted(p.begin(), p.end()));
        CHECK(std::adjacent_find(p.begin(), p.end()) == p.end());

        for (const char* expected : {
                 "src/models/customer.model.ts", "src/handlers/customer.handler.ts",
                 "tests/customer.test.ts", "src/models/product.model.ts",
                 "src/search/product.search.ts", "src/middleware/auth.ts",
                 "src/services/mailer.ts", "src/app.ts", "package.json",
                 ".env.example", "docs/openapi.yaml", "README.md"}) {
            CAPTURE(expected);
            CHECK(find(result, expected) != nullptr);
        }

        const artifact* customer = find(result, "src/models/customer.model.ts");
        REQUIRE(customer != nullptr);
        CHECK(customer->template_id() == "model.mongoose");
        CHECK(customer->content().find("bcrypt.hash") != std::string::npos);
        CHECK(customer->content().find("[audit]") != std::string::npos);
    }

    TEST_CASE("A failing template is recorded and generation continues") {
        test::temp_dir dir;
        test::write_file(dir / "handler.tmpl", "export default {{missing_key}};\n");

        auto s = load(shop);
        Generator gen(generator_options{0, dir.path()});
        auto result = gen.generate(s);

        CHECK_FALSE(result.ok());
        REQUIRE(result.failures.size() == 2);
        for (const auto& f : result.failures) {
            CHECK(f.kind == failure_kind::render);
            CHECK(f.template_id == "handler");
            CHECK(f.message.find("missing_key") != std::string::npos);
        }
        CHECK(result.failures[0].model == "Customer");
        CHECK(result.failures[1].model == "Product");
        CHECK(result.failures[0].format().find("for model 'Customer'") != std::string::npos);

        CHECK(find(result, "src/handlers/customer.handler.ts") == nullptr);
        CHECK(find(result, "src/models/customer.model.ts") != nullptr);
        CHECK(find(result, "README.md") != nullptr);
    }

    TEST_CASE("Context added by a before-model hook reaches the templates") {
        test::temp_dir dir;
        test::write_file(dir / "test.tmpl", "// {{class_name}} owned by {{owner}}\n");

        auto s = load(shop);
        Generator gen(generator_options{0, dir.path()});
        gen.hooks().add(extension_point::before_model, "owner", [](hook_context& ctx) {
            REQUIRE(ctx.model() != nullptr);
            ctx.add_context("owner", ctx.model()->name == "Customer" ? "accounts" : "catalog");
        });

        auto result = gen.generate(s);
        REQUIRE(result.ok());

        const artifact* test_file = find(result, "tests/product.test.ts");
        REQUIRE(test_file != nullptr);
        CHECK(test_file->content() == "// Product owned by catalog\n");
    }

    TEST_CASE("Context added by an after-model hook reaches the project templates") {
        test::temp_dir dir;
        test::write_file(dir / "readme.tmpl", "{{#each models}}{{class_name}}={{tier}};{{/each}}\n");

        auto s = load(shop);
        Generator gen(generator_options{0, dir.path()});
        gen.hooks().add(extension_point::after_model, "tier", [](hook_context& ctx) {
            ctx.add_context("tier", ctx.model()->name == "Customer" ? "gold" : "silver");
        });

        auto result = gen.generate(s);
        REQUIRE(result.ok());

        const artifact* readme = find(result, "README.md");
        REQUIRE(readme != nullptr);
        CHECK(readme->content() == "Customer=gold;Product=silver;\n");
    }

    TEST_CASE("Hooks emit extra artifacts") {
        auto s = load(shop);
        Generator gen;

        std::vector<std::string> seen_models;
        gen.hooks().add(extension_point::after_model, "collect", [&](hook_context& ctx) {
            seen_models.push_back(ctx.model()->name);
        });
        gen.hooks().add(extension_point::after_project, "licence", [](hook_context& ctx) {
            CHECK(ctx.model() == nullptr);
            ctx.emit(artifact("LICENSE", "MIT\n", "hook:licence"));
        });

        auto result = gen.generate(s);
        REQUIRE(result.ok());

        CHECK(seen_models == std::vector<std::string>{"Customer", "Product"});
        const artifact* licence = find(result, "LICENSE");
        REQUIRE(licence != nullptr);
        CHECK(licence->content() == "MIT\n");

        auto p = paths(result);
        CHECK(std::is_sorted(p.begin(), p.end()));
    }

    TEST_CASE("A throwing hook is reported as an extension failure") {
        auto s = load(shop);
        Generator gen;
        gen.hooks().add(extension_point::before_model, "picky", [](hook_context& ctx) {
            if (ctx.model()->name == "Product") {
                throw std::runtime_error("products are not allowed");
            }
        });

        auto result = gen.generate(s);
        REQUIRE(result.failures.size() == 1);
        CHECK(result.failures[0].kind == failure_kind::extension);
        CHECK(result.failures[0].template_id == "picky");
        CHECK(result.failures[0].model == "Product");
        CHECK(result.failures[0].message.find("products are not allowed") != std::string::npos);

        CHECK(find(result, "src/models/product.model.ts") == nullptr);
        CHECK(find(result, "src/models/customer.model.ts") != nullptr);
    }

    TEST_CASE("Output does not depend on the number of workers") {
        auto s = load(shop);
        Generator serial(generator_options{1, std::nullopt});
        Generator parallel(generator_options{8, std::nullopt});

        auto a = serial.generate(s);
        auto b = parallel.generate(s);
        REQUIRE(a.ok());
        REQUIRE(b.ok());
        CHECK(a.artifacts == b.artifacts);
    }
}
