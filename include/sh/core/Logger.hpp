#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace sh::core {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

const char* ToString(LogLevel level);

class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> format, Args&&... args) {
#ifdef SH_DEBUG
        if (!IsDebugEnabled()) {
            return;
        }
        Write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
#else
        (void)format;
        (void)std::initializer_list<int>{((void)args, 0)...};
#endif
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Warning(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> format, Args&&... args) {
        Write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    // Lines below the threshold are dropped before formatting reaches any sink.
    static void SetMinimumLevel(LogLevel level);
    static LogLevel GetMinimumLevel();

    static void SetDebugEnabled(bool enabled);
    static bool IsDebugEnabled();

    // Reads SH_LOG_DEBUG (1/true/on/yes or 0/false/off/no).
    static void ConfigureFromEnvironment();

    // Empty path closes the current file sink.
    static void SetLogFile(const std::filesystem::path& path);

    static std::size_t RegisterListener(LogCallback callback);
    static void UnregisterListener(std::size_t token);

private:
    static void Write(LogLevel level, const std::string& message);
};

} // namespace sh::core
