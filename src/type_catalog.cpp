#include "dicon/type_catalog.hpp"
#include "dicon/exceptions.hpp"

namespace dicon {

type_catalog& type_catalog::add(std::string name, callable constructor) {
    if (!constructor) {
        throw invalid_argument("constructor for type " + name + " cannot be empty");
    }
    entry e{name, std::move(constructor), true};
    entries_.insert_or_assign(std::move(name), std::move(e));
    return *this;
}

type_catalog& type_catalog::add_abstract(std::string name) {
    entry e{name, callable{}, false};
    entries_.insert_or_assign(std::move(name), std::move(e));
    return *this;
}

bool type_catalog::contains(std::string_view name) const {
    return entries_.find(name) != entries_.end();
}

const type_catalog::entry* type_catalog::find(std::string_view name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

} // namespace dicon
