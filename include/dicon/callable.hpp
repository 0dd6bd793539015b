#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "parameter.hpp"
#include "type_traits.hpp"
#include "value.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace dicon {

// ---------------------------------------------------------------
// callable — descriptor list + type-erased invoker
// ---------------------------------------------------------------

/// Anything the container can invoke with resolved arguments: a factory,
/// a configuration function, or the target of container::call().
///
/// The parameter list is the only thing the resolver inspects.  Declared
/// type names are plain strings; nothing is instantiated to produce them.
class DICON_EXPORT callable {
public:
    using invoker = std::function<value(std::vector<value>&)>;

    callable() = default;
    callable(std::vector<parameter> parameters, invoker fn,
             std::source_location loc = std::source_location::current());

    const std::vector<parameter>& parameters() const noexcept { return parameters_; }

    /// Best-effort "file:line" of the place the callable was described.
    std::string location() const;

    explicit operator bool() const noexcept { return static_cast<bool>(invoke_); }

    /// Invoke with a complete, positional argument list.
    value operator()(std::vector<value>& args) const;

private:
    std::vector<parameter> parameters_;
    invoker invoke_;
    std::source_location location_;
};

namespace detail {

template <typename F, typename Args, std::size_t... I>
value invoke_with(F& f, std::vector<value>& args, std::index_sequence<I...>) {
    using R = std::invoke_result_t<F&, std::tuple_element_t<I, Args>...>;
    if constexpr (std::is_void_v<R>) {
        std::invoke(f, inject<std::tuple_element_t<I, Args>>(args[I])...);
        return {};
    } else {
        return value(std::invoke(f, inject<std::tuple_element_t<I, Args>>(args[I])...));
    }
}

template <typename Args, std::size_t... I>
std::vector<parameter> describe(std::vector<arg>& names, std::index_sequence<I...>) {
    std::vector<parameter> params;
    params.reserve(sizeof...(I));
    (params.push_back(parameter{
        std::move(names[I].name),
        names[I].type_name.has_value()
            ? std::move(*names[I].type_name)
            : declared_type_name<std::tuple_element_t<I, Args>>(),
        names[I].default_value.has_value(),
        names[I].default_value.value_or(value{})
    }), ...);
    return params;
}

DICON_EXPORT void check_arity(std::size_t expected, std::size_t given,
                              std::source_location loc);

} // namespace detail

// ---------------------------------------------------------------
// fn / method — describe C++ invocables
// ---------------------------------------------------------------

/// Describe a function, lambda or function object.  One `arg` per C++
/// parameter, in declaration order:
///
///   fn({"mailer", {"retries", 3}},
///      [](mailer& m, int retries) { return user_service(m, retries); })
template <typename F>
callable fn(std::vector<arg> names, F&& f,
            std::source_location loc = std::source_location::current()) {
    using traits = detail::fn_traits<std::decay_t<F>>;
    using args_tuple = typename traits::args_tuple;
    constexpr std::size_t arity = traits::arity;

    detail::check_arity(arity, names.size(), loc);

    auto params = detail::describe<args_tuple>(names, std::make_index_sequence<arity>{});
    return callable(
        std::move(params),
        [f = std::decay_t<F>(std::forward<F>(f))](std::vector<value>& args) mutable -> value {
            return detail::invoke_with<std::decay_t<F>, args_tuple>(
                f, args, std::make_index_sequence<arity>{});
        },
        loc);
}

/// Describe a parameterless function.
template <typename F>
callable fn(F&& f, std::source_location loc = std::source_location::current()) {
    static_assert(detail::fn_traits<std::decay_t<F>>::arity == 0,
        "fn(f): functions with parameters need a list of parameter names");
    return fn(std::vector<arg>{}, std::forward<F>(f), loc);
}

/// Describe a member function bound to an instance.  The instance must
/// outlive the callable.
template <typename C, typename M>
    requires std::is_member_function_pointer_v<M>
callable method(C& instance, M member, std::vector<arg> names = {},
                std::source_location loc = std::source_location::current()) {
    using traits = detail::fn_traits<M>;
    using args_tuple = typename traits::args_tuple;
    constexpr std::size_t arity = traits::arity;

    detail::check_arity(arity, names.size(), loc);

    auto params = detail::describe<args_tuple>(names, std::make_index_sequence<arity>{});
    C* self = &instance;
    return callable(
        std::move(params),
        [self, member](std::vector<value>& args) -> value {
            auto bound = [self, member](auto&&... a) -> decltype(auto) {
                return std::invoke(member, self, std::forward<decltype(a)>(a)...);
            };
            return detail::invoke_with<decltype(bound), args_tuple>(
                bound, args, std::make_index_sequence<arity>{});
        },
        loc);
}

} // namespace dicon
