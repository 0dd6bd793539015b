#include <catch2/catch_test_macros.hpp>
#include <dicon/container.hpp>

#include <algorithm>
#include <memory>
#include <string>

namespace {

struct Connection {
    std::string dsn;
};

struct ICache {
    virtual ~ICache() = default;
    virtual std::string kind() const = 0;
};

struct MemoryCache : ICache {
    std::string kind() const override { return "memory"; }
};

dicon::callable counting_factory(int& counter) {
    return dicon::fn([&counter] {
        ++counter;
        return Connection{"db://main"};
    });
}

} // namespace

TEST_CASE("never registered names are absent and not found", "[lifecycle]") {
    dicon::container c;
    REQUIRE_FALSE(c.has("db"));
    REQUIRE_FALSE(c.is_active("db"));
    REQUIRE_THROWS_AS(c.get("db"), dicon::not_found);
}

TEST_CASE("registration does not construct anything", "[lifecycle]") {
    dicon::container c;
    int built = 0;
    c.register_factory("db", counting_factory(built));

    REQUIRE(c.has("db"));
    REQUIRE_FALSE(c.is_active("db"));
    REQUIRE(built == 0);
}

TEST_CASE("get constructs once and returns the identical value", "[lifecycle]") {
    dicon::container c;
    int built = 0;
    c.register_factory("db", counting_factory(built));

    auto first = c.get("db");
    for (int i = 0; i < 10; ++i) {
        REQUIRE(c.get("db").same(first));
    }
    REQUIRE(built == 1);
    REQUIRE(c.is_active("db"));
    REQUIRE(c.is_initialized("db"));
    REQUIRE(c.get<Connection>("db").dsn == "db://main");
}

TEST_CASE("register after activation throws lifecycle_error", "[lifecycle]") {
    dicon::container c;
    int built = 0;
    c.register_factory("db", counting_factory(built));
    c.get("db");

    REQUIRE_THROWS_AS(c.register_factory("db", counting_factory(built)),
                      dicon::lifecycle_error);
    REQUIRE_THROWS_AS(c.register_type("db"), dicon::lifecycle_error);
    REQUIRE(built == 1);
}

TEST_CASE("set after activation throws lifecycle_error", "[lifecycle]") {
    dicon::container c;
    int built = 0;
    c.register_factory("db", counting_factory(built));
    auto original = c.get("db");

    REQUIRE_THROWS_AS(c.set("db", Connection{"db://other"}), dicon::lifecycle_error);
    REQUIRE(c.get("db").same(original));
}

TEST_CASE("re-registration before activation replaces the factory", "[lifecycle]") {
    dicon::container c;
    c.register_factory("port", dicon::fn([] { return 80; }));
    c.register_factory("port", dicon::fn([] { return 8080; }));
    REQUIRE(c.get<int>("port") == 8080);
}

TEST_CASE("registration clears an injected raw value", "[lifecycle]") {
    dicon::container c;
    c.set("port", 80);
    REQUIRE(c.is_active("port"));

    c.register_factory("port", dicon::fn([] { return 8080; }));
    REQUIRE_FALSE(c.is_active("port"));
    REQUIRE(c.get<int>("port") == 8080);
}

TEST_CASE("injected values can be replaced until something freezes them", "[lifecycle]") {
    dicon::container c;
    c.set("port", 80);
    c.set("port", 81);
    REQUIRE(c.get<int>("port") == 81);
    REQUIRE_FALSE(c.is_initialized("port"));
}

TEST_CASE("set values are active without a factory", "[lifecycle]") {
    dicon::container c;
    c.set("name", "dicon");
    REQUIRE(c.has("name"));
    REQUIRE(c.is_active("name"));
    REQUIRE(c.get<std::string>("name") == "dicon");
}

TEST_CASE("container registers itself under its capability names", "[lifecycle]") {
    dicon::container c;

    for (const auto& name : {dicon::type_name<dicon::container>(),
                             dicon::type_name<dicon::component_lookup>(),
                             dicon::type_name<dicon::factory>()}) {
        REQUIRE(c.has(name));
        REQUIRE(c.is_active(name));
        REQUIRE(c.is_initialized(name));
        REQUIRE_THROWS_AS(c.set(name, 1), dicon::lifecycle_error);
        REQUIRE_THROWS_AS(c.register_type(name), dicon::lifecycle_error);
    }

    REQUIRE(&c.get<dicon::container>(dicon::type_name<dicon::container>()) == &c);
    REQUIRE(&c.get<dicon::component_lookup>(dicon::type_name<dicon::component_lookup>())
            == static_cast<dicon::component_lookup*>(&c));
    REQUIRE(&c.get<dicon::factory>(dicon::type_name<dicon::factory>())
            == static_cast<dicon::factory*>(&c));
}

TEST_CASE("a container& parameter receives the container", "[lifecycle]") {
    dicon::container c;
    auto f = dicon::fn({"c"}, [](dicon::container& injected) { return &injected; });
    REQUIRE(c.call(f).as<dicon::container*>() == &c);
}

TEST_CASE("alias resolves lazily to the identical target value", "[lifecycle]") {
    dicon::container c;
    int built = 0;
    c.register_factory("db", counting_factory(built));
    c.alias("database", "db");

    REQUIRE(c.has("database"));
    REQUIRE(built == 0);

    auto via_alias = c.get("database");
    REQUIRE(built == 1);
    REQUIRE(via_alias.same(c.get("db")));
}

TEST_CASE("alias may be defined before its target", "[lifecycle]") {
    dicon::container c;
    c.alias("cache", dicon::type_name<ICache>());
    c.register_factory(dicon::type_name<ICache>(),
        dicon::fn([] { return dicon::value::make<MemoryCache, ICache>(); }));

    REQUIRE(c.get<ICache>("cache").kind() == "memory");
}

TEST_CASE("registration calls chain", "[lifecycle]") {
    dicon::container c;
    c.set("a", 1)
     .set("b", 2)
     .register_factory("sum", dicon::fn({"a", "b"}, [](int a, int b) { return a + b; }));

    REQUIRE(c.get<int>("sum") == 3);
}

TEST_CASE("names lists every known component", "[lifecycle]") {
    dicon::container c;
    c.set("x", 1);
    c.register_factory("y", dicon::fn([] { return 2; }));

    auto names = c.names();
    REQUIRE(std::find(names.begin(), names.end(), "x") != names.end());
    REQUIRE(std::find(names.begin(), names.end(), "y") != names.end());
    REQUIRE(std::find(names.begin(), names.end(), dicon::type_name<dicon::container>())
            != names.end());
}
