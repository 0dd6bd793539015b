#pragma once

#include "export.hpp"
#include "value.hpp"

#include <functional>
#include <string>

namespace dicon {

class component_lookup;

/// Deferred reference to "the value bound to name" in a container.
/// Nothing is looked up or activated until unbox().
class DICON_EXPORT boxed_reference : public boxed_value {
public:
    boxed_reference(component_lookup& lookup, std::string name);

    const std::string& name() const noexcept { return name_; }

    value unbox() override;

private:
    component_lookup* lookup_;
    std::string name_;
};

/// Arbitrary deferred payload: the producer runs when the box is consumed.
class DICON_EXPORT boxed_callback : public boxed_value {
public:
    explicit boxed_callback(std::function<value()> producer);

    value unbox() override;

private:
    std::function<value()> producer_;
};

} // namespace dicon
