#include "sh/content/TransitionTarget.hpp"

#include <fmt/format.h>

namespace sh::content {

std::string Describe(const TransitionTarget& target) {
    return std::visit(Overloaded{
        [](const AlreadyBuilt& built) {
            return built.node ? fmt::format("node '{}'", built.node->GetName()) : std::string("node <null>");
        },
        [](const Identifier& identifier) {
            return fmt::format("identifier '{}'", identifier.id);
        },
        [](const Template& tmpl) {
            return tmpl.resource ? fmt::format("template '{}'", tmpl.resource->GetName())
                                 : std::string("template <null>");
        },
    }, target);
}

} // namespace sh::content
