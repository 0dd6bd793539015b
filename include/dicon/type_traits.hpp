#pragma once

#include "exceptions.hpp"
#include "value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>

namespace dicon {

// ---------------------------------------------------------------
// Type names
// ---------------------------------------------------------------

/// Registry name of a C++ type: its demangled name, e.g. "app::mailer".
template <typename T>
std::string type_name() {
    return internal::demangle(typeid(std::remove_cvref_t<T>));
}

/// A zero-size tag type that carries a compile-time constructor argument
/// list, e.g. `deps<logger&, int>`.
template <typename... Args>
struct deps_tag {
    using type_list = std::tuple<Args...>;
    static constexpr std::size_t count = sizeof...(Args);
};

template <typename... Args>
inline constexpr deps_tag<Args...> deps{};

// ---------------------------------------------------------------
// Concepts
// ---------------------------------------------------------------

/// TImpl is constructible from the declared constructor arguments.
template <typename TImpl, typename... Args>
concept constructible_from_deps = std::is_constructible_v<TImpl, Args...>;

namespace detail {

// ---------------------------------------------------------------
// fn_traits — parameter/return types of any invocable
// ---------------------------------------------------------------

template <typename F>
struct fn_traits : fn_traits<decltype(&std::remove_cvref_t<F>::operator())> {};

template <typename R, typename... A>
struct fn_traits<R(A...)> {
    using args_tuple  = std::tuple<A...>;
    static constexpr std::size_t arity = sizeof...(A);
};

template <typename R, typename... A>
struct fn_traits<R(*)(A...)> : fn_traits<R(A...)> {};

template <typename R, typename... A>
struct fn_traits<R(*)(A...) noexcept> : fn_traits<R(A...)> {};

template <typename C, typename R, typename... A>
struct fn_traits<R(C::*)(A...)> : fn_traits<R(A...)> {};

template <typename C, typename R, typename... A>
struct fn_traits<R(C::*)(A...) const> : fn_traits<R(A...)> {};

template <typename C, typename R, typename... A>
struct fn_traits<R(C::*)(A...) noexcept> : fn_traits<R(A...)> {};

template <typename C, typename R, typename... A>
struct fn_traits<R(C::*)(A...) const noexcept> : fn_traits<R(A...)> {};

// ---------------------------------------------------------------
// Declared type name of a C++ parameter type
// ---------------------------------------------------------------

/// Class types (seen through `T&`, `T*` and `shared_ptr<T>`) declare
/// their type name; `value`, `std::string` and scalars declare none.
template <typename A>
std::string declared_type_name() {
    using U = std::remove_cvref_t<A>;
    if constexpr (std::is_pointer_v<U>) {
        return declared_type_name<std::remove_pointer_t<U>>();
    } else if constexpr (is_shared_ptr_v<U>) {
        return declared_type_name<typename U::element_type>();
    } else if constexpr (std::is_same_v<U, value>
                      || std::is_same_v<U, std::string>
                      || !std::is_class_v<U>) {
        return {};
    } else {
        return type_name<U>();
    }
}

// ---------------------------------------------------------------
// inject — convert a resolved value to a C++ parameter
// ---------------------------------------------------------------

/// `value`            → the handle itself
/// `shared_ptr<T>`    → shared view (null stays null)
/// `T*`               → raw view (null stays null)
/// `T&` / `const T&`  → reference to the stored object
/// `T`                → copy of the stored object
template <typename A>
decltype(auto) inject(const value& v) {
    using U = std::remove_cvref_t<A>;
    if constexpr (std::is_same_v<U, value>) {
        return U(v);
    } else if constexpr (is_shared_ptr_v<U>) {
        return v.pointer<typename U::element_type>();
    } else if constexpr (std::is_pointer_v<U>) {
        using P = std::remove_pointer_t<U>;
        return v.has_value() ? &v.as<P>() : static_cast<P*>(nullptr);
    } else if constexpr (std::is_lvalue_reference_v<A>) {
        return v.as<std::remove_reference_t<A>>();
    } else {
        return U(v.as<U>());
    }
}

} // namespace detail

} // namespace dicon
