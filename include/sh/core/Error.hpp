#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sh::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

class ContentLoadError : public Error {
public:
    ContentLoadError(std::string_view address, std::string details);

    std::string_view address() const noexcept { return m_address; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view address, const std::string& details);

    std::string m_address;
    std::string m_details;
};

inline std::string ContentLoadError::BuildMessage(std::string_view address,
                                                  const std::string& details) {
    std::string message;
    message.reserve(address.size() + details.size() + 24);
    message.append("Content load failed [");
    message.append(address);
    message.append("]");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline ContentLoadError::ContentLoadError(std::string_view address, std::string details)
    : Error(BuildMessage(address, details)),
      m_address(address),
      m_details(std::move(details)) {}

class HookError : public Error {
public:
    HookError(std::string_view hook, std::string_view nodeName, std::string details);

    std::string_view hook() const noexcept { return m_hook; }
    std::string_view nodeName() const noexcept { return m_nodeName; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view hook,
                                    std::string_view nodeName,
                                    const std::string& details);

    std::string m_hook;
    std::string m_nodeName;
    std::string m_details;
};

inline std::string HookError::BuildMessage(std::string_view hook,
                                           std::string_view nodeName,
                                           const std::string& details) {
    std::string message;
    message.reserve(hook.size() + nodeName.size() + details.size() + 24);
    message.append("Hook '");
    message.append(hook);
    message.append("' failed on '");
    message.append(nodeName);
    message.append("'");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline HookError::HookError(std::string_view hook, std::string_view nodeName, std::string details)
    : Error(BuildMessage(hook, nodeName, details)),
      m_hook(hook),
      m_nodeName(nodeName),
      m_details(std::move(details)) {}

class TransitionBusyError : public Error {
public:
    explicit TransitionBusyError(std::string_view requestedTarget)
        : Error(std::string("Transition already in progress, rejected request for '")
                    .append(requestedTarget)
                    .append("'")) {}
};

} // namespace sh::core
