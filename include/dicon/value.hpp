#pragma once

#include "export.hpp"
#include "exceptions.hpp"

#include <cstddef>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace dicon {

class value;

// ---------------------------------------------------------------
// boxed_value — payload expanded only when consumed as an argument
// ---------------------------------------------------------------

/// A value marked "defer expansion until consumed".  The resolver calls
/// unbox() exactly once, at the moment it places the argument.
class DICON_EXPORT boxed_value {
public:
    virtual ~boxed_value() = default;

    virtual value unbox() = 0;
};

namespace detail {

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_shared_ptr_v = is_shared_ptr<std::remove_cvref_t<T>>::value;

/// Upcast table for a stored `T`.  Returns the address of the requested
/// view (T itself or one of Bases), or nullptr.
template <typename T, typename... Bases>
void* upcast(void* p, std::type_index want) noexcept {
    auto* self = static_cast<T*>(p);
    if (want == std::type_index(typeid(T))) return self;
    void* out = nullptr;
    ((out == nullptr && want == std::type_index(typeid(Bases))
          ? (out = static_cast<Bases*>(self), true)
          : false), ...);
    return out;
}

/// Copy of a stored `T`, as a new value.
template <typename T>
value copy_stored(const void* p);

} // namespace detail

// ---------------------------------------------------------------
// value — type-erased shared handle
// ---------------------------------------------------------------

/// Type-erased, shared-ownership handle to a component value.  An empty
/// handle is the null value.  Copies share the same object, so identity
/// survives being passed through the container (`same()`).
///
/// A value can be viewed as its stored type or as any base declared when
/// it was created (`make<T, Bases...>`, `wrap<T, Bases...>`).
class DICON_EXPORT value {
public:
    value() noexcept = default;
    value(std::nullptr_t) noexcept {}

    /// String literals are stored as std::string.
    value(const char* text)
        : value(std::string(text)) {}

    /// Store a shared object; derived boxed_value types are recognised.
    template <typename U>
    value(std::shared_ptr<U> p) noexcept {
        if (!p) return;
        using V = std::remove_cv_t<U>;
        auto mutable_p = std::const_pointer_cast<V>(std::move(p));
        if constexpr (std::is_base_of_v<boxed_value, V>) {
            boxed_ = mutable_p;
        }
        type_ = typeid(V);
        cast_ = &detail::upcast<V>;
        ptr_ = std::move(mutable_p);
    }

    /// Store a copy (or moved instance) of any other object.
    template <typename T>
        requires (!std::is_same_v<std::remove_cvref_t<T>, value>
               && !detail::is_shared_ptr_v<T>
               && !std::is_same_v<std::remove_cvref_t<T>, std::nullptr_t>
               && !std::is_convertible_v<T, const char*>)
    value(T&& object)
        : value(std::make_shared<std::remove_cvref_t<T>>(std::forward<T>(object))) {
        using U = std::remove_cvref_t<T>;
        if constexpr (std::is_copy_constructible_v<U>) {
            copy_ = &detail::copy_stored<U>;
        }
    }

    /// Construct a new `T`, viewable as T or any of Bases.
    template <typename T, typename... Bases, typename... Args>
    static value make(Args&&... args) {
        return wrap<T, Bases...>(std::make_shared<T>(std::forward<Args>(args)...));
    }

    /// Adopt an existing shared object, viewable as T or any of Bases.
    template <typename T, typename... Bases>
    static value wrap(std::shared_ptr<T> p) {
        static_assert((std::is_base_of_v<Bases, T> && ...),
            "value::wrap<T, Bases...>: every base must be a base class of T");
        value v(std::move(p));
        if (v.ptr_) v.cast_ = &detail::upcast<T, Bases...>;
        return v;
    }

    bool has_value() const noexcept { return static_cast<bool>(ptr_); }
    explicit operator bool() const noexcept { return has_value(); }

    bool is_boxed() const noexcept { return static_cast<bool>(boxed_); }

    /// Expand a boxed value; non-boxed values are returned unchanged.
    value unbox() const;

    /// Independent copy of an object stored by value.  Shared objects
    /// (make, wrap, shared_ptr) and non-copyable types return *this.
    value clone() const {
        if (!copy_ || !ptr_) return *this;
        return copy_(ptr_.get());
    }

    /// Stored type; typeid(void) for the null value.
    std::type_index type() const noexcept { return type_; }
    std::string type_name() const { return internal::demangle(type_); }

    /// True when both handles refer to the same object (or both are null).
    bool same(const value& other) const noexcept { return ptr_ == other.ptr_; }

    const void* address() const noexcept { return ptr_.get(); }

    /// View as T; nullptr if null or not convertible.
    template <typename T>
    T* try_as() const noexcept {
        using U = std::remove_cv_t<T>;
        if (!ptr_ || !cast_) return nullptr;
        return static_cast<U*>(cast_(ptr_.get(), typeid(U)));
    }

    /// View as T.  Throws bad_value_cast if null or not convertible.
    template <typename T>
    T& as(std::source_location loc = std::source_location::current()) const {
        T* p = try_as<T>();
        if (!p) throw bad_value_cast(type_, typeid(std::remove_cv_t<T>), loc);
        return *p;
    }

    /// Shared view as T (aliasing the stored object).  Null for the null
    /// value; throws bad_value_cast if not convertible.
    template <typename T>
    std::shared_ptr<T> pointer(std::source_location loc = std::source_location::current()) const {
        if (!ptr_) return nullptr;
        return std::shared_ptr<T>(ptr_, &as<T>(loc));
    }

private:
    using cast_fn = void* (*)(void*, std::type_index) noexcept;
    using copy_fn = value (*)(const void*);

    std::shared_ptr<void> ptr_;
    std::type_index type_ = std::type_index(typeid(void));
    cast_fn cast_ = nullptr;
    copy_fn copy_ = nullptr;
    std::shared_ptr<boxed_value> boxed_;
};

template <typename T>
value detail::copy_stored(const void* p) {
    return value(T(*static_cast<const T*>(p)));
}

} // namespace dicon
