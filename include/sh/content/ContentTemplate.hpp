#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sh/content/ContentNode.hpp"

namespace sh::content {

class BehaviourRegistry;

struct TemplateValidationResult {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool IsValid() const { return errors.empty(); }
};

/**
 * @brief Prebuilt, immutable description of a content node.
 *
 * Shape: {"name": "...", "behaviour": "...", "properties": {...}}. Only
 * "name" is required. A template can be instantiated any number of times;
 * each call produces an independent node.
 */
class ContentTemplate {
public:
    ContentTemplate(std::string name, std::string behaviour,
                    nlohmann::json properties, std::string sourceAddress = {});

    static TemplateValidationResult Validate(const nlohmann::json& json);

    /**
     * @brief Build a template from a parsed document.
     * @throws core::ContentLoadError if validation reports errors.
     */
    static std::shared_ptr<const ContentTemplate> FromJson(const nlohmann::json& json,
                                                           const std::string& sourceAddress);

    /**
     * @brief Read, parse and validate a template file.
     * @throws core::ContentLoadError on I/O, parse or validation failure.
     */
    static std::shared_ptr<const ContentTemplate> FromFile(const std::filesystem::path& path,
                                                           const std::string& sourceAddress);

    /**
     * @throws core::ContentLoadError if the named behaviour is not registered.
     */
    ContentNodePtr Instantiate(const BehaviourRegistry& behaviours) const;

    const std::string& GetName() const { return m_name; }
    const std::string& GetBehaviour() const { return m_behaviour; }
    const nlohmann::json& GetProperties() const { return m_properties; }
    const std::string& GetSourceAddress() const { return m_sourceAddress; }

private:
    std::string m_name;
    std::string m_behaviour;
    nlohmann::json m_properties;
    std::string m_sourceAddress;
};

using ContentTemplatePtr = std::shared_ptr<const ContentTemplate>;

} // namespace sh::content
