#include "dicon/parameter.hpp"
#include "dicon/exceptions.hpp"

#include <string>

namespace dicon {

parameter_key::parameter_key(int index)
    : index_(static_cast<std::size_t>(index))
    , is_index_(true)
{
    if (index < 0) {
        throw invalid_argument("negative parameter index: " + std::to_string(index));
    }
}

parameter_map::parameter_map(std::initializer_list<entry> entries) {
    for (const auto& e : entries) {
        if (e.key.is_index()) {
            positional_.insert_or_assign(e.key.index(), e.val);
        } else {
            named_.insert_or_assign(e.key.name(), e.val);
        }
    }
}

parameter_map& parameter_map::set(std::string name, value v) {
    named_.insert_or_assign(std::move(name), std::move(v));
    return *this;
}

parameter_map& parameter_map::set(std::size_t index, value v) {
    positional_.insert_or_assign(index, std::move(v));
    return *this;
}

const value* parameter_map::find(std::string_view name) const {
    auto it = named_.find(name);
    if (it == named_.end()) return nullptr;
    return &it->second;
}

const value* parameter_map::find(std::size_t index) const {
    auto it = positional_.find(index);
    if (it == positional_.end()) return nullptr;
    return &it->second;
}

} // namespace dicon
