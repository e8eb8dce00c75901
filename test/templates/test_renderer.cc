//
// Tests for the template rendering engine
//

#include <doctest/doctest.h>
#include <quickform/renderer.hh>
#include <map>

using namespace quickform;
using namespace quickform::templates;

namespace {
    value strings(std::initializer_list<const char*> items) {
        value::list_type list;
        for (const char* item : items) {
            list.emplace_back(item);
        }
        return value::make_list(std::move(list));
    }

    value sample_context() {
        return value::make_map({
            {"name", "order item"},
            {"count", 3},
            {"enabled", true},
            {"empty", ""},
            {"storage", "postgres"},
            {"tags", strings({"a", "b", "c"})},
            {"none", value::make_list({})},
            {"owner", value::make_map({
                {"name", "Ada"},
                {"address", value::make_map({{"city", "London"}})},
            })},
            {"fields", value::make_list({
                value::make_map({{"name", "email"}, {"required", true}}),
                value::make_map({{"name", "age"}, {"required", false}}),
            })},
        });
    }

    std::string render(const std::string& source, const value& ctx = sample_context()) {
        Renderer renderer;
        return renderer.render("test", source, ctx);
    }
}

TEST_SUITE("Renderer") {
    TEST_CASE("Substitution") {
        CHECK(render("Hello {{owner.name}}!") == "Hello Ada!");
        CHECK(render("{{ owner.address.city }}") == "London");
        CHECK(render("{{count}} items, enabled={{enabled}}") == "3 items, enabled=true");
        CHECK(render("[{{empty}}]") == "[]");
        CHECK(render("{{tags.1}}") == "b");
        CHECK(render("no tags here") == "no tags here");
    }

    TEST_CASE("Filters") {
        CHECK(render("{{name | pascal}}") == "OrderItem");
        CHECK(render("{{name | camel}}") == "orderItem");
        CHECK(render("{{name | snake}}") == "order_item");
        CHECK(render("{{name | kebab}}") == "order-item");
        CHECK(render("{{name | upper}}") == "ORDER ITEM");
        CHECK(render("{{owner.name | lower}}") == "ada");
        CHECK(render("{{name | pascal | plural}}") == "OrderItems");
    }

    TEST_CASE("Join and indent") {
        CHECK(render("{{tags | join}}") == "a, b, c");
        CHECK(render("{{tags | join:\"|\"}}") == "a|b|c");
        CHECK(render("{{none | join}}") == "");

        auto ctx = value::make_map({{"body", "a();\nb();"}});
        CHECK(render("{\n{{body | indent:2}}\n}", ctx) == "{\n  a();\n  b();\n}");
    }

    TEST_CASE("Conditionals") {
        CHECK(render("{{#if enabled}}on{{/if}}") == "on");
        CHECK(render("{{#if empty}}yes{{else}}no{{/if}}") == "no");
        CHECK(render("{{#unless empty}}filled{{/unless}}") == "filled");
        CHECK(render("{{#if none}}some{{else}}none{{/if}}") == "none");
        CHECK(render("{{#if storage == \"postgres\"}}sql{{else}}doc{{/if}}") == "sql");
        CHECK(render("{{#if storage != \"postgres\"}}doc{{else}}sql{{/if}}") == "sql");
        CHECK(render("{{#if storage == 'mongodb'}}doc{{/if}}") == "");
    }

    TEST_CASE("Iteration") {
        CHECK(render("{{#each tags}}{{@index}}:{{this}}{{#unless @last}},{{/unless}}{{/each}}")
              == "0:a,1:b,2:c");
        CHECK(render("{{#each tags}}{{#if @first}}^{{/if}}{{this}}{{/each}}") == "^abc");
        CHECK(render("{{#each fields}}{{name}}{{#if required}}*{{/if}} {{/each}}") == "email* age ");
        CHECK(render("{{#each none}}x{{else}}empty{{/each}}") == "empty");
        CHECK(render("{{#each owner.address}}{{@key}}={{this}}{{/each}}") == "city=London");
    }

    TEST_CASE("Names fall back to enclosing scopes") {
        CHECK(render("{{#each fields}}{{owner.name}}.{{name}} {{/each}}") == "Ada.email Ada.age ");
        CHECK(render("{{#each tags}}{{count}}{{/each}}") == "333");
    }

    TEST_CASE("Standalone block lines leave no blank lines") {
        const std::string source =
            "start\n"
            "{{#each tags}}\n"
            "  - {{this}}\n"
            "{{/each}}\n"
            "{{#if empty}}\n"
            "hidden\n"
            "{{/if}}\n"
            "end\n";

        CHECK(render(source) == "start\n  - a\n  - b\n  - c\nend\n");
    }

    TEST_CASE("Comments") {
        CHECK(render("a{{! ignored }}b") == "ab");
        CHECK(render("{{! header }}\nbody\n") == "body\n");
    }

    TEST_CASE("Partials") {
        std::map<std::string, std::string> partials = {
            {"greeting", "Hi {{owner.name}}"},
            {"loop", "{{> loop}}"},
        };
        Renderer renderer([&](const std::string& id) -> const std::string& {
            auto it = partials.find(id);
            if (it == partials.end()) {
                throw template_error::unresolved(id, {"<test>/" + id});
            }
            return it->second;
        });

        CHECK(renderer.render("page", "{{> greeting}}!", sample_context()) == "Hi Ada!");
        CHECK_THROWS_AS(renderer.render("page", "{{> missing}}", sample_context()), template_error);
        CHECK_THROWS_AS(renderer.render("page", "{{> loop}}", sample_context()), template_error);
    }

    TEST_CASE("Undefined paths are errors") {
        try {
            render("{{owner.phone}}");
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.template_id() == "test");
            CHECK(e.path() == "owner.phone");
        }

        CHECK_THROWS_AS(render("{{#if missing}}x{{/if}}"), template_error);
        CHECK_THROWS_AS(render("{{#each missing}}x{{/each}}"), template_error);
        CHECK_THROWS_AS(render("{{tags.7}}"), template_error);
        CHECK_THROWS_AS(render("{{@index}}"), template_error);

        try {
            render("{{tags.99999999999999999999999}}");
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.path() == "tags.99999999999999999999999");
        }
    }

    TEST_CASE("Rendering errors") {
        CHECK_THROWS_AS(render("{{tags}}"), template_error);
        CHECK_THROWS_AS(render("{{owner}}"), template_error);
        CHECK_THROWS_AS(render("{{#each count}}x{{/each}}"), template_error);
        CHECK_THROWS_AS(render("{{count | join}}"), template_error);
    }

    TEST_CASE("Syntax errors") {
        Renderer renderer;
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{name | shout}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{#if a}}unclosed"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{#if a}}x{{/each}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{/if}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{else}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{#with a}}{{/with}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{#if}}{{/if}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{name"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{body | indent}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{body | indent:257}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{body | indent:4000000000}}"), template_error);
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{body | indent:99999999999999999999999}}"), template_error);
        CHECK_NOTHROW(renderer.check_syntax("t", "{{body | indent:256}}"));
        CHECK_THROWS_AS(renderer.check_syntax("t", "{{#if a == b}}{{/if}}"), template_error);
        CHECK_NOTHROW(renderer.check_syntax("t", "{{#if a}}{{b | upper}}{{else}}c{{/if}}"));
    }

    TEST_CASE("Syntax errors report the line") {
        Renderer renderer;
        try {
            renderer.check_syntax("page", "line one\nline two\n{{#each items}}\n");
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(std::string(e.what()).find("line 3") != std::string::npos);
        }
    }

    TEST_CASE("Rendering is deterministic") {
        const std::string source = "{{#each fields}}{{name | pascal}};{{/each}}{{tags | join}}";
        CHECK(render(source) == render(source));
    }
}
