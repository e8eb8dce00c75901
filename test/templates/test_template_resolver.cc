//
// Tests for template resolution and the built-in template set
//

#include <doctest/doctest.h>
#include <quickform/builtin_templates.hh>
#include <quickform/generator.hh>
#include <quickform/renderer.hh>
#include <quickform/template_resolver.hh>
#include "../test_support.hh"
#include <algorithm>
#include <thread>

using namespace quickform;
using namespace quickform::templates;

TEST_SUITE("Template Resolver") {
    TEST_CASE("Built-in templates resolve by identifier") {
        TemplateResolver resolver;
        CHECK(resolver.source_names() == std::vector<std::string>{"builtin"});
        CHECK(resolver.resolve("handler").find("Router") != std::string::npos);
        CHECK(resolver.has("model.mongoose"));
        CHECK_FALSE(resolver.has("model.cassandra"));
    }

    TEST_CASE("Override directory wins over the built-in set") {
        test::temp_dir dir;
        test::write_file(dir / "handler.tmpl", "// custom handler for {{class_name}}\n");

        TemplateResolver resolver(dir.path());
        CHECK(resolver.source_names() == std::vector<std::string>{"overrides", "builtin"});
        CHECK(resolver.resolve("handler") == "// custom handler for {{class_name}}\n");

        // Identifiers without an override still come from the built-in set
        CHECK(resolver.resolve("app") == std::string(builtin_templates().at("app")));
    }

    TEST_CASE("Unresolvable identifiers name every searched location") {
        test::temp_dir dir;
        TemplateResolver resolver(dir.path());

        try {
            (void)resolver.resolve("nonexistent");
            FAIL("expected template_error");
        } catch (const template_error& e) {
            CHECK(e.template_id() == "nonexistent");
            REQUIRE(e.searched().size() == 2);
            CHECK(e.searched()[0] == (dir / "nonexistent.tmpl").string());
            CHECK(e.searched()[1] == "<builtin>/nonexistent");
        }
    }

    TEST_CASE("Identifiers cannot escape the override directory") {
        CHECK(TemplateResolver::is_valid_identifier("model.mongoose"));
        CHECK(TemplateResolver::is_valid_identifier("auth-middleware"));
        CHECK(TemplateResolver::is_valid_identifier("search_index"));
        CHECK_FALSE(TemplateResolver::is_valid_identifier(""));
        CHECK_FALSE(TemplateResolver::is_valid_identifier("../secret"));
        CHECK_FALSE(TemplateResolver::is_valid_identifier("a/b"));
        CHECK_FALSE(TemplateResolver::is_valid_identifier(".hidden"));

        TemplateResolver resolver;
        CHECK_THROWS_AS((void)resolver.resolve("../etc/passwd"), template_error);
    }

    TEST_CASE("Additional sources are searched by priority") {
        auto memory = std::make_unique<MemoryTemplateSource>("project");
        memory->add("readme", "# {{project.name}}\n");
        memory->add("changelog", "## Unreleased\n");

        TemplateResolver resolver;
        resolver.add_source("project", 50, std::move(memory));

        CHECK(resolver.source_names() == std::vector<std::string>{"project", "builtin"});
        CHECK(resolver.resolve("readme") == "# {{project.name}}\n");
        CHECK(resolver.resolve("changelog") == "## Unreleased\n");
        CHECK(resolver.searched_locations("x") == std::vector<std::string>{"<project>/x", "<builtin>/x"});
    }

    TEST_CASE("Loaded templates are cached") {
        test::temp_dir dir;
        test::write_file(dir / "server.tmpl", "first\n");

        TemplateResolver resolver(dir.path());
        const std::string& first = resolver.resolve("server");
        CHECK(resolver.cached_count() == 1);

        // The file changes on disk; the cached text is kept
        test::write_file(dir / "server.tmpl", "second\n");
        const std::string& again = resolver.resolve("server");
        CHECK(&first == &again);
        CHECK(again == "first\n");
    }

    TEST_CASE("Concurrent resolution loads each identifier once") {
        TemplateResolver resolver;
        std::vector<const std::string*> seen(8, nullptr);

        std::vector<std::thread> threads;
        for (size_t i = 0; i < seen.size(); ++i) {
            threads.emplace_back([&resolver, &seen, i] {
                seen[i] = &resolver.resolve("model.sequelize");
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        CHECK(resolver.cached_count() == 1);
        for (const auto* p : seen) {
            CHECK(p == seen[0]);
        }
    }
}

TEST_SUITE("Built-in Templates") {
    TEST_CASE("Every template the generator can plan is built in") {
        auto ids = list_builtin_templates();
        CHECK(std::is_sorted(ids.begin(), ids.end()));
        CHECK(ids == generator::known_template_ids());
    }

    TEST_CASE("Every built-in template parses") {
        Renderer renderer;
        for (const auto& entry : builtin_templates()) {
            const std::string& id = entry.first;
            const std::string_view text = entry.second;
            CAPTURE(id);
            CHECK_FALSE(text.empty());
            CHECK(text.front() != '\n');
            CHECK_NOTHROW(renderer.check_syntax(id, std::string(text)));
        }
    }
}
