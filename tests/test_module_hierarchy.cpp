#include <catch2/catch_test_macros.hpp>
#include "module_hierarchy.hpp"

using namespace logwindow;

TEST_CASE("ModuleHierarchy builds parent to child edges", "[hierarchy]") {
    ModuleHierarchy hierarchy;

    SECTION("Sibling paths share a parent") {
        hierarchy.observe("auth.login");
        hierarchy.observe("auth.logout");

        auto snapshot = hierarchy.snapshot();
        REQUIRE(snapshot.size() == 2);
        REQUIRE(snapshot["root"] == std::set<std::string>{"auth"});
        REQUIRE(snapshot["auth"] == std::set<std::string>{"auth.login", "auth.logout"});
    }

    SECTION("Deep path creates every intermediate edge") {
        hierarchy.observe("a.b.c");

        auto snapshot = hierarchy.snapshot();
        REQUIRE(snapshot["root"] == std::set<std::string>{"a"});
        REQUIRE(snapshot["a"] == std::set<std::string>{"a.b"});
        REQUIRE(snapshot["a.b"] == std::set<std::string>{"a.b.c"});
        REQUIRE(snapshot.count("a.b.c") == 0);
    }

    SECTION("Repeated paths are idempotent") {
        hierarchy.observe("db.pool");
        auto first = hierarchy.snapshot();
        hierarchy.observe("db.pool");
        hierarchy.observe("db.pool");

        REQUIRE(hierarchy.snapshot() == first);
        REQUIRE(hierarchy.path_count() == 1);
    }

    SECTION("Empty segments are skipped") {
        hierarchy.observe("a..b");
        auto snapshot = hierarchy.snapshot();
        REQUIRE(snapshot["root"] == std::set<std::string>{"a"});
        REQUIRE(snapshot["a"] == std::set<std::string>{"a.b"});
    }

    SECTION("Empty path is ignored") {
        hierarchy.observe("");
        REQUIRE(hierarchy.empty());
    }

    SECTION("Clear forgets paths so they are indexed again") {
        hierarchy.observe("x.y");
        hierarchy.clear();
        REQUIRE(hierarchy.empty());
        REQUIRE(hierarchy.path_count() == 0);

        hierarchy.observe("x.y");
        REQUIRE(hierarchy.snapshot()["x"] == std::set<std::string>{"x.y"});
    }

    SECTION("Snapshot is detached from later growth") {
        hierarchy.observe("one");
        auto snapshot = hierarchy.snapshot();
        hierarchy.observe("two");
        REQUIRE(snapshot["root"] == std::set<std::string>{"one"});
    }
}

TEST_CASE("Hierarchy JSON lists children per parent", "[hierarchy]") {
    ModuleHierarchy hierarchy;
    hierarchy.observe("auth.login");

    auto json = hierarchy_to_json(hierarchy.snapshot());
    REQUIRE(json["root"] == nlohmann::json::array({"auth"}));
    REQUIRE(json["auth"] == nlohmann::json::array({"auth.login"}));
    REQUIRE(hierarchy_to_json({}).is_object());
}
