#include "dicon/boxed.hpp"
#include "dicon/interfaces.hpp"

namespace dicon {

boxed_reference::boxed_reference(component_lookup& lookup, std::string name)
    : lookup_(&lookup)
    , name_(std::move(name))
{}

value boxed_reference::unbox() {
    return lookup_->get(name_);
}

boxed_callback::boxed_callback(std::function<value()> producer)
    : producer_(std::move(producer))
{}

value boxed_callback::unbox() {
    return producer_();
}

} // namespace dicon
