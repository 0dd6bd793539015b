/// basic_usage.cpp — dicon introductory example.
///
/// Demonstrates the register → get → configure workflow:
///   1. Define interfaces and implementations (no framework base classes).
///   2. Describe constructors in the type catalog, factories with fn().
///   3. Components are built on first get() and frozen afterwards.
///   4. Configuration functions and boxed references defer work until needed.

#include <dicon.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace dicon;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    std::string prefix = "[LOG] ";

    void log(const std::string& message) override {
        std::cout << prefix << message << '\n';
    }
};

struct greeter : i_greeter {
    greeter(i_logger& logger, std::string punctuation)
        : logger_(&logger), punctuation_(std::move(punctuation)) {}

    std::string greet(const std::string& name) override {
        const auto msg = "Hello, " + name + punctuation_;
        logger_->log(msg);
        return msg;
    }

private:
    i_logger* logger_;
    std::string punctuation_;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    container c;

    // ── Catalog: how to construct each concrete type ──────────────────
    c.types()
        .add<console_logger, i_logger>()
        .add<greeter, i_greeter>(deps<i_logger&, std::string>,
                                 {"logger", {"punctuation", "!"}});

    // ── Registration: nothing is constructed yet ──────────────────────
    c.register_type_as(type_name<i_logger>(), type_name<console_logger>());
    c.register_type_as(type_name<i_greeter>(), type_name<greeter>());
    c.alias("greeter", type_name<i_greeter>());

    // Runs once, right after the logger is built.
    c.configure(type_name<i_logger>(), fn({"logger"}, [](console_logger& logger) {
        logger.prefix = "[app] ";
    }));

    // ── Resolution ────────────────────────────────────────────────────
    auto& g1 = c.get<i_greeter>("greeter");
    auto& g2 = c.get<i_greeter>(type_name<i_greeter>());
    assert(&g1 == &g2 && "components are built once");
    std::cout << g1.greet("World") << '\n';

    // Built components are frozen.
    try {
        c.set(type_name<i_greeter>(), nullptr);
    } catch (const lifecycle_error& e) {
        std::cout << "expected: " << e.what() << '\n';
    }

    // ── call / create with overrides ──────────────────────────────────
    auto excited = c.create(type_name<greeter>(), {{"punctuation", "!!!"}});
    excited.as<i_greeter>().greet("dicon");

    auto shout = fn({"g", "who"}, [](i_greeter& g, const std::string& who) {
        return g.greet(who);
    });
    c.set("who", "reader");
    std::cout << c.call(shout).as<std::string>() << '\n';

    // A boxed reference resolves only when consumed.
    c.register_factory("banner", fn([] { return std::string("=== dicon ==="); }));
    auto banner = c.ref("banner");
    std::cout << "banner active before use: " << std::boolalpha << c.is_active("banner") << '\n';
    c.call(fn({"logger", "text"}, [](i_logger& logger, const std::string& text) {
        logger.log(text);
    }), {{"text", banner}});

    std::cout << "Done.\n";
    return 0;
}
