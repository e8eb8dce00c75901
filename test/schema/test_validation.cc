//
// Tests for schema validation
//

#include <doctest/doctest.h>
#include <quickform/schema_parser.hh>
#include <quickform/validation.hh>
#include "../test_support.hh"
#include <algorithm>

using namespace quickform;
using namespace quickform::validation;

namespace {
    validation_result check(const std::string& text, const validation_options& opts = {}) {
        schema::SchemaParser parser;
        return validate(parser.build_from_string(text), opts);
    }

    std::vector<std::string> codes(const validation_result& result) {
        std::vector<std::string> out;
        for (const auto& d : result.diagnostics) {
            out.push_back(d.code);
        }
        return out;
    }
}

TEST_SUITE("Validation") {
    TEST_CASE("Valid schema resolves config and features") {
        auto result = check(R"(
config:
  auth: session
  storage: postgres
  email: mailgun
models:
  User:
    features: [auth, audit]
    fields:
      email: string
      password: string
  Post:
    features: [search]
    fields:
      title: string
      author:
        type: reference
        target: User
    relations:
      - target: Comment
        cardinality: many
  Comment:
    fields:
      body: string
)");

        CHECK(result.diagnostics.empty());
        REQUIRE(result.validated.has_value());

        const auto& s = *result.validated;
        CHECK(s.config.auth == ir::auth_mode::session);
        CHECK(s.config.storage == ir::storage_backend::postgres);
        CHECK(s.config.email == ir::email_service::mailgun);

        CHECK(s.models[0].features.auth);
        CHECK(s.models[0].features.audit);
        CHECK_FALSE(s.models[0].features.search);
        CHECK(s.models[1].features.search);

        CHECK(s.models[1].fields[1].type == ir::field_type::reference);

        const auto& rel = s.models[1].relations[0];
        CHECK(rel.kind == ir::cardinality::many);
        CHECK(rel.owner == ir::ownership::owning);
        CHECK(rel.name == "comments");
    }

    TEST_CASE("The input schema is not modified") {
        schema::SchemaParser parser;
        auto parsed = parser.build_from_string("config:\n  storage: sqlite\nmodels:\n  Item:\n    features: [audit]\n    fields:\n      name: string\n");

        auto result = validate(parsed);
        REQUIRE(result.validated.has_value());
        CHECK(result.validated->config.storage == ir::storage_backend::sqlite);
        CHECK(result.validated->models[0].features.audit);

        CHECK(parsed.config.storage == ir::storage_backend::mongodb);
        CHECK_FALSE(parsed.models[0].features.audit);
    }

    TEST_CASE("Every independent violation is reported") {
        auto result = check(R"(
models:
  Item:
    features: [serch]
    fields:
      name: strng
    hooks:
      - event: pre-sav
  Empty: {}
)");

        CHECK_FALSE(result.validated.has_value());
        REQUIRE(result.diagnostics.size() == 4);
        CHECK(result.error_count() == 4);

        auto found = codes(result);
        std::sort(found.begin(), found.end());
        CHECK(found == std::vector<std::string>{"E001", "E005", "E007", "E012"});

        for (const auto& d : result.diagnostics) {
            if (d.code == "E007") {
                CHECK(d.location.path == "models.Item.fields.name");
                CHECK(d.suggestion == std::optional<std::string>("did you mean 'string'?"));
            }
            if (d.code == "E012") {
                CHECK(d.suggestion == std::optional<std::string>("did you mean 'search'?"));
            }
            if (d.code == "E005") {
                CHECK(d.suggestion == std::optional<std::string>("did you mean 'pre-save'?"));
            }
            if (d.code == "E001") {
                CHECK(d.message.find("'Empty'") != std::string::npos);
            }
        }
    }

    TEST_CASE("Dangling relation names both models") {
        auto result = check(R"(
models:
  Order:
    fields:
      total: decimal
    relations:
      - target: Shipment
)");

        REQUIRE(result.diagnostics.size() == 1);
        const auto& d = result.diagnostics[0];
        CHECK(d.code == diag_codes::E_UNRESOLVED_TARGET);
        CHECK(d.level == diagnostic_level::error);
        CHECK(d.message.find("'Order' -> 'Shipment'") != std::string::npos);
        CHECK(d.location.path == "models.Order.relations[0]");
        CHECK_FALSE(result.validated.has_value());
    }

    TEST_CASE("Reference field targets") {
        auto result = check(R"(
models:
  Order:
    fields:
      customer:
        type: reference
        target: Custmer
      coupon:
        type: reference
  Customer:
    fields:
      name: string
)");

        REQUIRE(result.diagnostics.size() == 2);
        CHECK(result.diagnostics[0].code == "E004");
        CHECK(result.diagnostics[0].suggestion == std::optional<std::string>("did you mean 'Customer'?"));
        CHECK(result.diagnostics[1].code == "E004");
        CHECK(result.diagnostics[1].location.path == "models.Order.fields.coupon");
    }

    TEST_CASE("Config selectors outside their enumeration") {
        auto result = check(R"(
config:
  auth: oauth
  storage: postgress
  email: none
models:
  Item:
    fields:
      name: string
)");

        REQUIRE(result.diagnostics.size() == 2);
        CHECK(result.diagnostics[0].code == "E006");
        CHECK(result.diagnostics[0].location.path == "config.auth");
        CHECK(result.diagnostics[1].code == "E006");
        CHECK(result.diagnostics[1].location.path == "config.storage");
        CHECK(result.diagnostics[1].suggestion == std::optional<std::string>("did you mean 'postgres'?"));
    }

    TEST_CASE("Enum rules") {
        auto result = check(R"(
models:
  Task:
    fields:
      state:
        type: enum
        values: [open, closed]
        default: archived
      kind:
        type: enum
)");

        auto found = codes(result);
        CHECK(found == std::vector<std::string>{"E013", "E003"});
    }

    TEST_CASE("Duplicates") {
        auto result = check(R"(
models:
  OrderItem:
    fields:
      - name: sku
        type: string
      - name: sku
        type: string
    methods:
      - name: total
      - name: total
  order_item:
    fields:
      qty: number
)");

        auto found = codes(result);
        CHECK(found == std::vector<std::string>{"E002", "E009", "E008"});
    }

    TEST_CASE("Model names must yield a file name") {
        auto result = check(R"(
models:
  "__":
    fields:
      title: string
  "Ñú":
    fields:
      title: string
  "9Lives":
    fields:
      title: string
  _Basket:
    fields:
      title: string
)");

        auto found = codes(result);
        CHECK(found == std::vector<std::string>{"E015", "E015", "E015"});
        CHECK_FALSE(result.validated.has_value());
        CHECK(result.diagnostics[0].location.path == "models.__");
        CHECK(result.diagnostics[2].message.find("'9-lives'") != std::string::npos);
    }

    TEST_CASE("Storage options for unknown backends") {
        auto result = check(R"(
models:
  Item:
    fields:
      price:
        type: decimal
        storage:
          postgre:
            precision: 10
)");

        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "E011");
        CHECK(result.diagnostics[0].location.path == "models.Item.fields.price.storage.postgre");
    }

    TEST_CASE("Relation cardinality and ownership") {
        auto result = check(R"(
models:
  Order:
    fields:
      total: number
    relations:
      - target: Item
        cardinality: several
        ownership: shared
  Item:
    fields:
      name: string
)");

        auto found = codes(result);
        CHECK(found == std::vector<std::string>{"E010", "E010"});
    }

    TEST_CASE("Auth feature requires auth in config") {
        auto result = check(R"(
config:
  auth: none
models:
  User:
    features: [auth]
    fields:
      email: string
      password: string
)");

        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "E014");
    }

    TEST_CASE("Warnings do not block validation") {
        const std::string text = R"(
models:
  User:
    features: [auth]
    fields:
      email: string
  Counter:
    features: [search]
    fields:
      value: number
)";

        auto result = check(text);
        CHECK(result.validated.has_value());
        CHECK(result.warning_count() == 2);
        CHECK(codes(result) == std::vector<std::string>{"W001", "W002"});

        SUBCASE("warnings as errors") {
            validation_options opts;
            opts.warnings_as_errors = true;
            auto strict = check(text, opts);
            CHECK_FALSE(strict.validated.has_value());
            CHECK(strict.error_count() == 2);
        }

        SUBCASE("suppressed") {
            validation_options opts;
            opts.suppress_warnings = true;
            auto quiet = check(text, opts);
            CHECK(quiet.diagnostics.empty());
        }

        SUBCASE("one code disabled") {
            validation_options opts;
            opts.disabled_warnings = {"W001"};
            auto partial = check(text, opts);
            CHECK(codes(partial) == std::vector<std::string>{"W002"});
        }
    }

    TEST_CASE("load_schema aggregates diagnostics into one schema_error") {
        test::temp_dir dir;
        test::write_file(dir / "bad.yaml", R"(
models:
  Order:
    fields:
      total: money
    relations:
      - target: Shipment
)");

        try {
            load_schema(dir / "bad.yaml");
            FAIL("expected schema_error");
        } catch (const schema_error& e) {
            CHECK_FALSE(e.is_structural());
            CHECK(e.diagnostics().size() == 2);
        }
    }

    TEST_CASE("load_schema applies a separate config document") {
        test::temp_dir dir;
        test::write_file(dir / "shop.yaml", "models:\n  Item:\n    fields:\n      name: string\n");
        test::write_file(dir / "config.yaml", "storage: sqlite\nemail: resend\n");

        auto s = load_schema(dir / "shop.yaml", dir / "config.yaml");
        CHECK(s.config.storage == ir::storage_backend::sqlite);
        CHECK(s.config.email == ir::email_service::resend);

        CHECK_THROWS_AS(load_schema(dir / "shop.yaml", dir / "missing.yaml"), schema_error);
    }

    TEST_CASE("Suggestions") {
        CHECK(suggest("mongo", {"mongodb", "postgres", "sqlite"}) ==
              std::optional<std::string>("did you mean 'mongodb'?"));
        CHECK_FALSE(suggest("cassandra", {"mongodb", "postgres", "sqlite"}).has_value());
    }
}
