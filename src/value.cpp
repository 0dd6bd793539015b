#include "dicon/value.hpp"

namespace dicon {

value value::unbox() const {
    if (!boxed_) return *this;
    return boxed_->unbox();
}

} // namespace dicon
