#pragma once

#include <string>
#include <variant>

#include "sh/content/ContentNode.hpp"
#include "sh/content/ContentTemplate.hpp"

namespace sh::content {

// Node constructed by the caller; used as-is.
struct AlreadyBuilt {
    ContentNodePtr node;
};

// Symbolic name or fully qualified address; loaded in the background.
struct Identifier {
    std::string id;
};

// Prebuilt resource; instantiated synchronously.
struct Template {
    ContentTemplatePtr resource;
};

using TransitionTarget = std::variant<AlreadyBuilt, Identifier, Template>;

// Short human-readable form for logs and error messages.
std::string Describe(const TransitionTarget& target);

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace sh::content
