//
// End-to-end generation scenarios
//

#include <doctest/doctest.h>
#include <quickform/generator.hh>
#include <quickform/output_manager.hh>
#include <quickform/validation.hh>
#include "../test_support.hh"
#include "driver.hh"
#include <stdexcept>

using namespace quickform;

namespace {
    const char* catalog_schema = R"(
models:
  Item:
    fields:
      name: string
      price: decimal
)";

    const char* accounts_schema = R"(
config:
  auth: jwt
models:
  Item:
    fields:
      name: string
      price: decimal
  User:
    features: [auth]
    fields:
      email: string
      password: string
)";

    size_t count_prefix(const generator::generation_result& result, const std::string& prefix) {
        size_t n = 0;
        for (const auto& a : result.artifacts) {
            if (a.path().rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    const artifact& by_path(const generator::generation_result& result, const std::string& path) {
        for (const auto& a : result.artifacts) {
            if (a.path() == path) {
                return a;
            }
        }
        FAIL("no artifact at " << path);
        throw std::logic_error("unreachable");
    }

    generator::generation_result generate_file(const test::temp_dir& dir, const char* text) {
        test::write_file(dir / "schema.yaml", text);
        auto schema = validation::load_schema(dir / "schema.yaml");
        generator::Generator gen;
        return gen.generate(schema);
    }
}

TEST_SUITE("Scenarios") {
    TEST_CASE("Single model without features") {
        test::temp_dir dir;
        auto result = generate_file(dir, catalog_schema);
        REQUIRE(result.ok());

        CHECK(count_prefix(result, "src/models/") == 1);
        CHECK(count_prefix(result, "src/handlers/") == 1);

        const auto& model = by_path(result, "src/models/item.model.ts");
        CHECK(model.content().find("price") != std::string::npos);
        CHECK(model.content().find("bcrypt") == std::string::npos);
        CHECK(model.content().find("Hash the password") == std::string::npos);

        const auto& handler = by_path(result, "src/handlers/item.handler.ts");
        CHECK(handler.content().find("Item") != std::string::npos);
    }

    TEST_CASE("Auth feature hashes the password of that model only") {
        test::temp_dir dir;
        auto result = generate_file(dir, accounts_schema);
        REQUIRE(result.ok());

        const auto& user = by_path(result, "src/models/user.model.ts");
        CHECK(user.content().find("bcrypt.hash") != std::string::npos);
        CHECK(user.content().find("Hash the password before it is stored") != std::string::npos);

        const auto& item = by_path(result, "src/models/item.model.ts");
        CHECK(item.content().find("bcrypt") == std::string::npos);

        // Item renders exactly as it does without the User model
        test::temp_dir other;
        auto alone = generate_file(other, catalog_schema);
        REQUIRE(alone.ok());
        CHECK(by_path(alone, "src/models/item.model.ts").content() == item.content());
        CHECK(by_path(alone, "src/handlers/item.handler.ts").content() ==
              by_path(result, "src/handlers/item.handler.ts").content());
    }

    TEST_CASE("Generation is idempotent") {
        test::temp_dir dir;
        auto first = generate_file(dir, accounts_schema);
        auto second = generate_file(dir, accounts_schema);
        REQUIRE(first.ok());
        CHECK(first.artifacts == second.artifacts);

        // Committing the same run twice leaves nothing to change
        test::temp_dir out;
        output::OutputManager manager(out.path());
        CHECK(manager.commit(first).changed() == first.artifacts.size());
        auto again = manager.commit(second);
        CHECK(again.changed() == 0);
        CHECK(again.count(output::commit_action::unchanged) == first.artifacts.size());
    }

    TEST_CASE("Dangling relation is rejected before anything is written") {
        test::temp_dir dir;
        test::write_file(dir / "schema.yaml", R"(
models:
  Order:
    fields:
      total: decimal
    relations:
      - target: Shipment
)");
        test::write_file(dir / "out/keep.txt", "untouched\n");
        auto before = test::snapshot(dir / "out");

        try {
            validation::load_schema(dir / "schema.yaml");
            FAIL("expected schema_error");
        } catch (const schema_error& e) {
            REQUIRE(e.diagnostics().size() == 1);
            CHECK(e.diagnostics()[0].code == "E004");
            CHECK(e.diagnostics()[0].message.find("'Order' -> 'Shipment'") != std::string::npos);
        }

        driver::GeneratorOptions opts;
        opts.schema_file = dir / "schema.yaml";
        opts.output_dir = dir / "out";
        driver::Logger logger(driver::LogLevel::Quiet, driver::ColorMode::Never);
        driver::Driver drv(opts, logger);

        CHECK(drv.run() == driver::exit_schema_failure);
        CHECK(test::snapshot(dir / "out") == before);
    }
}
