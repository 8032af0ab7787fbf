#include "sh/utils/Config.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "sh/core/Logger.hpp"

namespace sh::utils {

namespace {

constexpr int kMinWorkerThreads = 1;
constexpr int kMaxWorkerThreads = 16;
constexpr double kMinTransitionDuration = 0.0;
constexpr double kMaxTransitionDuration = 10.0;
constexpr double kMinFrameRate = 1.0;
constexpr double kMaxFrameRate = 1000.0;

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        normalized = std::filesystem::absolute(path);
    }
    return normalized.lexically_normal();
}

std::filesystem::path ResolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    std::filesystem::path raw(value);
    if (raw.is_relative()) {
        return NormalizePath(baseDir / raw);
    }
    return NormalizePath(raw);
}

template <typename T>
T GetOrDefault(const nlohmann::json& obj, const char* key, const T& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        sh::core::Logger::Warning("[ConfigLoader] Failed to parse key '{}': {}", key, e.what());
        return fallback;
    }
}

nlohmann::json Section(const nlohmann::json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

bool ReadColor(const nlohmann::json& value, glm::vec4& out) {
    if (!value.is_array() || (value.size() != 3 && value.size() != 4)) {
        return false;
    }
    glm::vec4 color(0.0f, 0.0f, 0.0f, 1.0f);
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_number()) {
            return false;
        }
        color[static_cast<glm::length_t>(i)] = std::clamp(value[i].get<float>(), 0.0f, 1.0f);
    }
    out = color;
    return true;
}

} // namespace

StageConfig ConfigLoader::CreateDefault(const std::filesystem::path& baseDir) {
    StageConfig config{};
    config.configDirectory = baseDir;
    config.loader.contentRoot = NormalizePath(baseDir / "assets");
    return config;
}

ConfigLoadResult ConfigLoader::Load(const std::filesystem::path& path) {
    const std::filesystem::path baseDir = path.empty() || !path.has_parent_path()
                                              ? std::filesystem::current_path()
                                              : path.parent_path();

    ConfigLoadResult result;
    result.config = CreateDefault(baseDir);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        sh::core::Logger::Warning("[ConfigLoader] Config file '{}' not found, using defaults",
                                  path.empty() ? "<none>" : path.string());
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        sh::core::Logger::Error("[ConfigLoader] Failed to open config file '{}'", path.string());
        return result;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        sh::core::Logger::Error("[ConfigLoader] Failed to parse JSON '{}': {}", path.string(), e.what());
        return result;
    }
    if (!json.is_object()) {
        sh::core::Logger::Error("[ConfigLoader] Config root in '{}' must be an object", path.string());
        return result;
    }

    auto& cfg = result.config;

    const auto loaderObj = Section(json, "loader");
    cfg.loader.scheme = GetOrDefault<std::string>(loaderObj, "scheme", cfg.loader.scheme);
    cfg.loader.baseAddress = GetOrDefault<std::string>(loaderObj, "baseAddress", cfg.loader.baseAddress);
    cfg.loader.entryName = GetOrDefault<std::string>(loaderObj, "entryName", cfg.loader.entryName);
    if (loaderObj.contains("contentRoot") && loaderObj["contentRoot"].is_string()) {
        cfg.loader.contentRoot = ResolvePath(baseDir, loaderObj["contentRoot"].get<std::string>());
    }
    cfg.loader.workerThreads = GetOrDefault<int>(loaderObj, "workerThreads", cfg.loader.workerThreads);
    cfg.loader.cacheTemplates = GetOrDefault<bool>(loaderObj, "cacheTemplates", cfg.loader.cacheTemplates);

    const auto transitionObj = Section(json, "transition");
    cfg.transition.asset = GetOrDefault<std::string>(transitionObj, "asset", cfg.transition.asset);
    cfg.transition.durationSeconds =
        GetOrDefault<double>(transitionObj, "durationSeconds", cfg.transition.durationSeconds);
    if (transitionObj.contains("color") && !ReadColor(transitionObj["color"], cfg.transition.color)) {
        result.warnings.push_back("transition.color must be an array of 3 or 4 numbers, keeping default");
    }

    const auto loggingObj = Section(json, "logging");
    if (loggingObj.contains("file") && loggingObj["file"].is_string()) {
        const std::string logFile = loggingObj["file"].get<std::string>();
        if (!logFile.empty()) {
            cfg.logging.file = ResolvePath(baseDir, logFile);
        }
    }
    cfg.logging.debug = GetOrDefault<bool>(loggingObj, "debug", cfg.logging.debug);

    const auto bootstrapObj = Section(json, "bootstrap");
    cfg.bootstrap.initialContent =
        GetOrDefault<std::string>(bootstrapObj, "initialContent", cfg.bootstrap.initialContent);

    const auto stageObj = Section(json, "stage");
    cfg.stage.frameRate = GetOrDefault<double>(stageObj, "frameRate", cfg.stage.frameRate);

    cfg.configDirectory = baseDir;
    result.loadedFromFile = true;

    ValidateConfig(cfg, result);

    for (const auto& warning : result.warnings) {
        sh::core::Logger::Warning("[ConfigLoader] {}", warning);
    }
    for (const auto& error : result.errors) {
        sh::core::Logger::Error("[ConfigLoader] {}", error);
    }

    sh::core::Logger::Info("[ConfigLoader] Loaded config from '{}'", path.string());
    return result;
}

void ConfigLoader::ValidateConfig(StageConfig& config, ConfigLoadResult& result) {
    ValidateLoaderConfig(config.loader, result);
    ValidateTransitionConfig(config.transition, result);

    if (config.stage.frameRate < kMinFrameRate || config.stage.frameRate > kMaxFrameRate) {
        result.warnings.push_back(
            fmt::format("stage.frameRate ({:.1f}) should be between {:.1f} and {:.1f}, clamping",
                        config.stage.frameRate, kMinFrameRate, kMaxFrameRate));
        config.stage.frameRate = std::clamp(config.stage.frameRate, kMinFrameRate, kMaxFrameRate);
    }
}

void ConfigLoader::ValidateLoaderConfig(LoaderConfig& loader, ConfigLoadResult& result) {
    const LoaderConfig defaults{};

    if (loader.scheme.empty()) {
        result.errors.push_back(fmt::format("loader.scheme must not be empty, using '{}'", defaults.scheme));
        loader.scheme = defaults.scheme;
    }

    if (loader.baseAddress.empty()) {
        result.errors.push_back(
            fmt::format("loader.baseAddress must not be empty, using '{}'", defaults.baseAddress));
        loader.baseAddress = defaults.baseAddress;
    }
    while (loader.baseAddress.size() > loader.scheme.size() && loader.baseAddress.back() == '/') {
        loader.baseAddress.pop_back();
    }
    if (loader.baseAddress.rfind(loader.scheme, 0) != 0) {
        result.warnings.push_back(
            fmt::format("loader.baseAddress '{}' does not start with scheme '{}'", loader.baseAddress, loader.scheme));
    }

    if (loader.entryName.empty()) {
        result.errors.push_back(
            fmt::format("loader.entryName must not be empty, using '{}'", defaults.entryName));
        loader.entryName = defaults.entryName;
    }

    if (loader.workerThreads < kMinWorkerThreads || loader.workerThreads > kMaxWorkerThreads) {
        result.warnings.push_back(
            fmt::format("loader.workerThreads ({}) should be between {} and {}, clamping",
                        loader.workerThreads, kMinWorkerThreads, kMaxWorkerThreads));
        loader.workerThreads = std::clamp(loader.workerThreads, kMinWorkerThreads, kMaxWorkerThreads);
    }

    std::error_code ec;
    if (!std::filesystem::exists(loader.contentRoot, ec)) {
        result.warnings.push_back(
            fmt::format("Content root does not exist: {}", loader.contentRoot.string()));
    }
}

void ConfigLoader::ValidateTransitionConfig(TransitionConfig& transition, ConfigLoadResult& result) {
    if (transition.asset.empty()) {
        result.warnings.push_back("transition.asset is empty, using 'fade'");
        transition.asset = "fade";
    }

    if (transition.durationSeconds < kMinTransitionDuration ||
        transition.durationSeconds > kMaxTransitionDuration) {
        result.errors.push_back(
            fmt::format("transition.durationSeconds ({:.3f}) must be between {:.3f} and {:.3f}",
                        transition.durationSeconds, kMinTransitionDuration, kMaxTransitionDuration));
        transition.durationSeconds =
            std::clamp(transition.durationSeconds, kMinTransitionDuration, kMaxTransitionDuration);
    }
}

} // namespace sh::utils
