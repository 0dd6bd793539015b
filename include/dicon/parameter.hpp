#pragma once

#include "export.hpp"
#include "value.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dicon {

// ---------------------------------------------------------------
// parameter — one entry of a callable's descriptor list
// ---------------------------------------------------------------

struct parameter {
    std::string name;
    std::string type_name;      // empty = no declared type
    bool        is_optional = false;
    value       default_value;
};

// ---------------------------------------------------------------
// arg — caller-side description of a parameter for fn()/method()
// ---------------------------------------------------------------

/// Names a parameter and optionally gives it a default value:
///   fn({"a", "b", {"d", 9}}, [](int a, int b, int d) { ... })
struct DICON_EXPORT arg {
    arg(const char* n) : name(n) {}
    arg(std::string n) : name(std::move(n)) {}

    template <typename T>
    arg(std::string n, T&& default_val)
        : name(std::move(n)), default_value(value(std::forward<T>(default_val))) {}

    /// Override the declared type name derived from the C++ type.  An
    /// empty string disables type-directed lookup for this parameter.
    arg& typed(std::string type) {
        type_name = std::move(type);
        return *this;
    }

    std::string name;
    std::optional<value> default_value;
    std::optional<std::string> type_name;
};

// ---------------------------------------------------------------
// parameter_map — mixed named/positional overrides
// ---------------------------------------------------------------

class DICON_EXPORT parameter_key {
public:
    /// Throws invalid_argument for a negative index.
    parameter_key(int index);
    parameter_key(std::size_t index) : index_(index), is_index_(true) {}
    parameter_key(const char* name) : name_(name) {}
    parameter_key(std::string name) : name_(std::move(name)) {}

    bool is_index() const noexcept { return is_index_; }
    std::size_t index() const noexcept { return index_; }
    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::size_t index_ = 0;
    bool is_index_ = false;
};

/// Override values for a parameter list, keyed by parameter name or by
/// zero-based position.  Values may be boxed (see container::ref()); they
/// stay boxed until the resolver consumes them.
class DICON_EXPORT parameter_map {
public:
    struct entry {
        parameter_key key;
        value val;
    };

    parameter_map() = default;
    parameter_map(std::initializer_list<entry> entries);

    parameter_map& set(std::string name, value v);
    parameter_map& set(std::size_t index, value v);

    const value* find(std::string_view name) const;
    const value* find(std::size_t index) const;

    bool empty() const noexcept { return named_.empty() && positional_.empty(); }
    std::size_t size() const noexcept { return named_.size() + positional_.size(); }

private:
    std::map<std::string, value, std::less<>> named_;
    std::map<std::size_t, value> positional_;
};

} // namespace dicon
