#include "sh/content/ContentTemplate.hpp"

#include "sh/content/BehaviourRegistry.hpp"
#include "sh/core/Error.hpp"
#include "sh/core/Logger.hpp"

#include <fstream>
#include <unordered_set>

#include <fmt/format.h>

namespace sh::content {

namespace {

const std::unordered_set<std::string>& KnownKeys() {
    static const std::unordered_set<std::string> keys{ "name", "behaviour", "properties" };
    return keys;
}

std::string JoinMessages(const std::vector<std::string>& messages) {
    std::string joined;
    for (const auto& message : messages) {
        if (!joined.empty()) {
            joined.append("; ");
        }
        joined.append(message);
    }
    return joined;
}

} // namespace

ContentTemplate::ContentTemplate(std::string name, std::string behaviour,
                                 nlohmann::json properties, std::string sourceAddress)
    : m_name(std::move(name))
    , m_behaviour(std::move(behaviour))
    , m_properties(properties.is_object() ? std::move(properties) : nlohmann::json::object())
    , m_sourceAddress(std::move(sourceAddress)) {}

TemplateValidationResult ContentTemplate::Validate(const nlohmann::json& json) {
    TemplateValidationResult result;
    if (!json.is_object()) {
        result.errors.push_back("root must be a JSON object");
        return result;
    }

    if (!json.contains("name") || !json["name"].is_string()) {
        result.errors.push_back("missing required string field 'name'");
    } else if (json["name"].get<std::string>().empty()) {
        result.errors.push_back("'name' must not be empty");
    }

    if (json.contains("behaviour") && !json["behaviour"].is_string()) {
        result.errors.push_back("'behaviour' must be a string");
    }

    if (json.contains("properties") && !json["properties"].is_object()) {
        result.warnings.push_back("optional 'properties' should be an object, ignoring it");
    }

    for (const auto& [key, value] : json.items()) {
        if (!KnownKeys().contains(key)) {
            result.warnings.push_back(fmt::format("unknown key '{}' ignored", key));
        }
    }
    return result;
}

std::shared_ptr<const ContentTemplate> ContentTemplate::FromJson(const nlohmann::json& json,
                                                                 const std::string& sourceAddress) {
    const TemplateValidationResult validation = Validate(json);
    for (const auto& warning : validation.warnings) {
        core::Logger::Warning("[ContentTemplate] '{}': {}", sourceAddress, warning);
    }
    if (!validation.IsValid()) {
        throw core::ContentLoadError(sourceAddress, JoinMessages(validation.errors));
    }

    nlohmann::json properties = json.contains("properties") ? json["properties"] : nlohmann::json::object();
    return std::make_shared<ContentTemplate>(json["name"].get<std::string>(),
                                             json.value("behaviour", std::string{}),
                                             std::move(properties),
                                             sourceAddress);
}

std::shared_ptr<const ContentTemplate> ContentTemplate::FromFile(const std::filesystem::path& path,
                                                                 const std::string& sourceAddress) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw core::ContentLoadError(sourceAddress, fmt::format("file not found: {}", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::ContentLoadError(sourceAddress, fmt::format("unable to open {}", path.string()));
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw core::ContentLoadError(sourceAddress, fmt::format("JSON parse error: {}", e.what()));
    }
    return FromJson(json, sourceAddress);
}

ContentNodePtr ContentTemplate::Instantiate(const BehaviourRegistry& behaviours) const {
    auto node = std::make_shared<ContentNode>(m_name, m_sourceAddress);
    node->Properties() = m_properties;

    if (!m_behaviour.empty() && !behaviours.Bind(m_behaviour, *node)) {
        throw core::ContentLoadError(m_sourceAddress.empty() ? m_name : m_sourceAddress,
                                     fmt::format("unknown behaviour '{}'", m_behaviour));
    }
    return node;
}

} // namespace sh::content
