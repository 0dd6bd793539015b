#include "dicon/callable.hpp"

#include <string>

namespace dicon {

callable::callable(std::vector<parameter> parameters, invoker fn,
                   std::source_location loc)
    : parameters_(std::move(parameters))
    , invoke_(std::move(fn))
    , location_(loc)
{}

std::string callable::location() const {
    if (!location_.file_name()[0]) return {};
    return std::string(location_.file_name()) + ":" + std::to_string(location_.line());
}

value callable::operator()(std::vector<value>& args) const {
    if (!invoke_) {
        throw invalid_argument("expected callable");
    }
    if (args.size() != parameters_.size()) {
        throw invalid_argument("callable at " + location() + " expects "
                               + std::to_string(parameters_.size())
                               + " arguments, got " + std::to_string(args.size()));
    }
    return invoke_(args);
}

namespace detail {

void check_arity(std::size_t expected, std::size_t given, std::source_location loc) {
    if (expected != given) {
        throw invalid_argument("function takes " + std::to_string(expected)
                               + " parameters but " + std::to_string(given)
                               + " parameter names were given", loc);
    }
}

} // namespace detail

} // namespace dicon
