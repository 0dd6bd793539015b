#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <dicon.hpp>

#include <stdexcept>
#include <string>
#include <typeindex>
#include <vector>

using Catch::Matchers::ContainsSubstring;

namespace {

struct Database {};

struct Repository {
    Database* db;
};

} // namespace

TEST_CASE("not_found names the component", "[diagnostics]") {
    dicon::container c;
    try {
        c.get("mailer");
        FAIL("Expected not_found");
    } catch (const dicon::not_found& e) {
        REQUIRE(e.name() == "mailer");
        REQUIRE_THAT(e.what(), ContainsSubstring("Component not found: mailer"));
        REQUIRE_THAT(e.what(), ContainsSubstring("test_diagnostics.cpp"));
    }
}

TEST_CASE("lifecycle_error names the component and the reason", "[diagnostics]") {
    dicon::container c;
    c.register_factory("x", dicon::fn([] { return 1; }));
    c.get("x");

    try {
        c.set("x", 2);
        FAIL("Expected lifecycle_error");
    } catch (const dicon::lifecycle_error& e) {
        REQUIRE(e.name() == "x");
        REQUIRE_THAT(e.what(), ContainsSubstring("attempted overwrite of initialized component: x"));
    }
}

TEST_CASE("resolution_error names the parameter and its type", "[diagnostics]") {
    dicon::container c;
    auto f = dicon::fn({"db"}, [](Database&) { return 0; });

    try {
        c.call(f);
        FAIL("Expected resolution_error");
    } catch (const dicon::resolution_error& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("for parameter: db"));
        REQUIRE_THAT(e.what(), ContainsSubstring(dicon::type_name<Database>()));
    }
}

TEST_CASE("cycles are reported with the full chain", "[diagnostics]") {
    dicon::container c;
    c.register_factory("a", dicon::fn({"b"}, [](int b) { return b; }));
    c.register_factory("b", dicon::fn({"c"}, [](int c) { return c; }));
    c.register_factory("c", dicon::fn({"a"}, [](int a) { return a; }));

    try {
        c.get("a");
        FAIL("Expected cyclic_dependency");
    } catch (const dicon::cyclic_dependency& e) {
        REQUIRE(e.cycle() == std::vector<std::string>{"a", "b", "c", "a"});
        REQUIRE_THAT(e.what(), ContainsSubstring("Cyclic dependency detected: a -> b -> c -> a"));
    }

    REQUIRE_FALSE(c.is_active("a"));
    REQUIRE_FALSE(c.is_active("b"));
    REQUIRE_FALSE(c.is_active("c"));
}

TEST_CASE("self-dependency is a cycle", "[diagnostics]") {
    dicon::container c;
    c.register_factory("loop", dicon::fn({"loop"}, [](int loop) { return loop; }));
    REQUIRE_THROWS_AS(c.get("loop"), dicon::cyclic_dependency);
}

TEST_CASE("errors carry the chain of components being resolved", "[diagnostics]") {
    dicon::container c;
    c.register_factory("repository",
        dicon::fn({"db"}, [](Database& db) { return Repository{&db}; }));
    c.register_factory("service",
        dicon::fn({"repository"}, [](Repository& r) { return r.db != nullptr; }));

    try {
        c.get("service");
        FAIL("Expected resolution_error");
    } catch (const dicon::resolution_error& e) {
        REQUIRE(e.parameter_name() == "db");
        REQUIRE_THAT(e.what(), ContainsSubstring("(while resolving repository -> service)"));
    }
}

TEST_CASE("factory exceptions are wrapped in activation_error", "[diagnostics]") {
    dicon::container c;
    c.register_factory("broken", dicon::fn([]() -> int {
        throw std::runtime_error("factory boom");
    }));

    try {
        c.get("broken");
        FAIL("Expected activation_error");
    } catch (const dicon::activation_error& e) {
        REQUIRE(e.name() == "broken");
        REQUIRE_THAT(e.what(), ContainsSubstring("Failed to activate component broken"));
        REQUIRE_THAT(e.what(), ContainsSubstring("factory boom"));
        REQUIRE_THAT(e.what(), ContainsSubstring("registered at"));
        REQUIRE_THAT(e.what(), ContainsSubstring("test_diagnostics.cpp"));
    }
}

TEST_CASE("bad_value_cast names both types", "[diagnostics]") {
    dicon::value v = 1;
    try {
        v.as<std::string>();
        FAIL("Expected bad_value_cast");
    } catch (const dicon::bad_value_cast& e) {
        REQUIRE(e.held_type() == std::type_index(typeid(int)));
        REQUIRE(e.requested_type() == std::type_index(typeid(std::string)));
        REQUIRE_THAT(e.what(), ContainsSubstring("Value of type int is not convertible to"));
    }

    try {
        dicon::value{}.as<int>();
        FAIL("Expected bad_value_cast");
    } catch (const dicon::bad_value_cast& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("Cannot convert null value to int"));
    }
}

TEST_CASE("full_diagnostic appends the detail when present", "[diagnostics]") {
    dicon::invalid_argument e("bad input");
    REQUIRE(e.full_diagnostic() == std::string(e.what()));

    e.set_diagnostic_detail("extra context");
    REQUIRE(e.diagnostic_detail() == "extra context");
    REQUIRE(e.full_diagnostic() == std::string(e.what()) + "\nextra context");
}

TEST_CASE("di_error records the throw location", "[diagnostics]") {
    dicon::invalid_argument e("bad input");
    REQUIRE_THAT(std::string(e.location().file_name()), ContainsSubstring("test_diagnostics.cpp"));
    REQUIRE_THAT(e.what(), ContainsSubstring("bad input [at "));
}

TEST_CASE("resolution context accumulates in order", "[diagnostics]") {
    dicon::not_found e("x");
    e.append_resolution_context("inner");
    e.append_resolution_context("outer");
    REQUIRE_THAT(e.what(), ContainsSubstring("(while resolving inner -> outer)"));
}

TEST_CASE("stacktrace capture can be enabled per container", "[diagnostics]") {
    dicon::container_options options;
    options.capture_stacktraces = true;
    dicon::container c(options);
    REQUIRE(c.options().capture_stacktraces);
    c.register_factory("broken", dicon::fn([]() -> int {
        throw std::runtime_error("boom");
    }));

    try {
        c.get("broken");
        FAIL("Expected activation_error");
    } catch (const dicon::activation_error& e) {
        // Detail is only populated when built with stacktrace support.
        if (!e.diagnostic_detail().empty()) {
            REQUIRE_THAT(e.diagnostic_detail(),
                         ContainsSubstring("Registration stacktrace for broken"));
        }
        REQUIRE_THAT(e.full_diagnostic(), ContainsSubstring("boom"));
    }
}
