#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <glm/vec4.hpp>

namespace sh::utils {

struct LoaderConfig {
    std::string scheme = "res://";
    std::string baseAddress = "res://scenes";
    std::string entryName = "scene.json";
    std::filesystem::path contentRoot;
    int workerThreads = 1;
    bool cacheTemplates = true;
};

struct TransitionConfig {
    std::string asset = "fade";
    double durationSeconds = 0.5;
    glm::vec4 color{0.0f, 0.0f, 0.0f, 1.0f};
};

struct LoggingConfig {
    std::filesystem::path file;
    bool debug = false;
};

struct BootstrapConfig {
    std::string initialContent;
};

struct StageLoopConfig {
    double frameRate = 60.0;
};

struct StageConfig {
    LoaderConfig loader;
    TransitionConfig transition;
    LoggingConfig logging;
    BootstrapConfig bootstrap;
    StageLoopConfig stage;
    std::filesystem::path configDirectory;
};

struct ConfigLoadResult {
    StageConfig config;
    bool loadedFromFile = false;
    std::vector<std::string> errors;      // Values that were invalid and had to be replaced
    std::vector<std::string> warnings;    // Values that were adjusted or ignored

    bool HasErrors() const { return !errors.empty(); }
    bool HasWarnings() const { return !warnings.empty(); }
};

class ConfigLoader {
public:
    static ConfigLoadResult Load(const std::filesystem::path& path);

    /**
     * @brief Defaults rooted at @p baseDir (content root is `baseDir/assets`).
     */
    static StageConfig CreateDefault(const std::filesystem::path& baseDir);

private:
    static void ValidateConfig(StageConfig& config, ConfigLoadResult& result);
    static void ValidateLoaderConfig(LoaderConfig& loader, ConfigLoadResult& result);
    static void ValidateTransitionConfig(TransitionConfig& transition, ConfigLoadResult& result);
};

} // namespace sh::utils
