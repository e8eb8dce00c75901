//
// Tests for extension points and the hook registry
//

#include <doctest/doctest.h>
#include <quickform/extension_chain.hh>
#include <quickform/hook_registry.hh>
#include <stdexcept>

using namespace quickform;
using namespace quickform::generator;

namespace {
    value base_context() {
        return value::make_map({{"name", "Item"}});
    }
}

TEST_SUITE("Extension Chain") {
    TEST_CASE("Lower priority values come first, ties keep registration order") {
        ExtensionChain<int> chain;
        chain.add("late", 100, 1);
        chain.add("first", 0, 2);
        chain.add("second", 0, 3);
        chain.add("middle", 50, 4);

        CHECK(chain.names() == std::vector<std::string>{"first", "second", "middle", "late"});
        CHECK(chain.size() == 4);
    }

    TEST_CASE("first_of stops at the first engaged result") {
        ExtensionChain<int> chain;
        chain.add("a", 0, 1);
        chain.add("b", 1, 2);
        chain.add("c", 2, 3);

        int visited = 0;
        auto found = chain.first_of([&](int item) -> std::optional<int> {
            ++visited;
            if (item >= 2) {
                return item * 10;
            }
            return std::nullopt;
        });

        CHECK(found == std::optional<int>(20));
        CHECK(visited == 2);
    }
}

TEST_SUITE("Hook Registry") {
    TEST_CASE("Extension point names") {
        CHECK(std::string(to_string(extension_point::before_model)) == "before-model");
        CHECK(std::string(to_string(extension_point::after_model)) == "after-model");
        CHECK(std::string(to_string(extension_point::before_project)) == "before-project");
        CHECK(std::string(to_string(extension_point::after_project)) == "after-project");
    }

    TEST_CASE("Hooks run in priority order per extension point") {
        HookRegistry hooks;
        std::vector<std::string> calls;

        hooks.add(extension_point::before_model, "b", [&](hook_context&) { calls.push_back("b"); }, 10);
        hooks.add(extension_point::before_model, "a", [&](hook_context&) { calls.push_back("a"); }, -5);
        hooks.add(extension_point::before_model, "c", [&](hook_context&) { calls.push_back("c"); }, 10);
        hooks.add(extension_point::after_project, "other", [&](hook_context&) { calls.push_back("other"); });

        CHECK(hooks.count(extension_point::before_model) == 3);
        CHECK(hooks.count(extension_point::after_model) == 0);
        CHECK(hooks.names(extension_point::before_model) == std::vector<std::string>{"a", "b", "c"});

        ir::schema schema;
        ArtifactSink sink;
        hook_context ctx(extension_point::before_model, schema, nullptr, base_context(), sink);
        hooks.run(ctx);

        CHECK(calls == std::vector<std::string>{"a", "b", "c"});
    }

    TEST_CASE("Hooks add context keys and emit artifacts") {
        HookRegistry hooks;
        hooks.add(extension_point::before_project, "banner", [](hook_context& ctx) {
            ctx.add_context("banner", "generated");
        });
        hooks.add(extension_point::before_project, "licence", [](hook_context& ctx) {
            ctx.emit(artifact("LICENSE", "MIT\n", "hook:licence"));
        });

        ir::schema schema;
        ArtifactSink sink;
        hook_context ctx(extension_point::before_project, schema, nullptr, base_context(), sink);
        hooks.run(ctx);

        REQUIRE(ctx.context().find("banner") != nullptr);
        CHECK(ctx.context().find("banner")->as_string() == "generated");
        CHECK(ctx.context().find("name")->as_string() == "Item");

        REQUIRE(sink.artifacts().size() == 1);
        CHECK(sink.artifacts()[0].path() == "LICENSE");
        CHECK(sink.artifacts()[0].template_id() == "hook:licence");
    }

    TEST_CASE("Existing context keys cannot be replaced") {
        ir::schema schema;
        ArtifactSink sink;
        hook_context ctx(extension_point::before_model, schema, nullptr, base_context(), sink);
        CHECK_THROWS_AS(ctx.add_context("name", "Other"), std::invalid_argument);

        HookRegistry hooks;
        hooks.add(extension_point::before_model, "rename", [](hook_context& c) {
            c.add_context("name", "Other");
        });

        try {
            hooks.run(ctx);
            FAIL("expected extension_error");
        } catch (const extension_error& e) {
            CHECK(e.hook_name() == "rename");
            CHECK(e.point() == "before-model");
        }
        CHECK(ctx.context().find("name")->as_string() == "Item");
    }

    TEST_CASE("A failing hook stops the chain and is named") {
        HookRegistry hooks;
        bool later_ran = false;
        hooks.add(extension_point::after_model, "broken", [](hook_context&) {
            throw std::runtime_error("disk full");
        });
        hooks.add(extension_point::after_model, "later", [&](hook_context&) { later_ran = true; });

        ir::schema schema;
        ArtifactSink sink;
        hook_context ctx(extension_point::after_model, schema, nullptr, base_context(), sink);

        try {
            hooks.run(ctx);
            FAIL("expected extension_error");
        } catch (const extension_error& e) {
            CHECK(e.hook_name() == "broken");
            CHECK(e.point() == "after-model");
            CHECK(std::string(e.what()).find("disk full") != std::string::npos);
        }
        CHECK_FALSE(later_ran);
    }
}
