#pragma once

/// @file fwd.hpp
/// Forward declarations for all public dicon symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <cstddef>

namespace dicon {

// value.hpp
class boxed_value;
class value;

// boxed.hpp
class boxed_reference;
class boxed_callback;

// parameter.hpp
struct parameter;
struct arg;
class parameter_key;
class parameter_map;

// callable.hpp
class callable;

// type_traits.hpp
template <typename... Args>
struct deps_tag;

// type_catalog.hpp
class type_catalog;

// exceptions.hpp
class di_error;
class not_found;
class lifecycle_error;
class resolution_error;
class invalid_argument;
class cyclic_dependency;
class activation_error;
class bad_value_cast;

// interfaces.hpp
class component_lookup;
class factory;
class provider;

// registry.hpp
struct configuration_entry;
struct component_record;
class registry;

// resolver.hpp
class resolver;

// container.hpp
struct container_options;
class container;

} // namespace dicon
