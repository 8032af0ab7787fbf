#include "sh/core/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <fstream>
#include <mutex>
#include <system_error>
#include <vector>

namespace sh::core {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::filesystem::path filePath;
    std::ofstream fileStream;
    std::vector<std::pair<std::size_t, Logger::LogCallback>> listeners;
    std::atomic<std::size_t> nextToken{1};
    std::atomic<int> minimumLevel{static_cast<int>(LogLevel::Debug)};
    std::atomic<bool> debugEnabled{true};
    std::atomic<bool> environmentRead{false};
};

LoggerState& State() {
    static LoggerState state;
    return state;
}

std::string FormatTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto timeT = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec,
                       static_cast<int>(ms.count()));
}

void OpenFileLocked(LoggerState& state) {
    if (state.fileStream.is_open()) {
        state.fileStream.close();
    }
    if (state.filePath.empty()) {
        return;
    }
    std::error_code ec;
    if (state.filePath.has_parent_path()) {
        std::filesystem::create_directories(state.filePath.parent_path(), ec);
    }
    state.fileStream.open(state.filePath, std::ios::out | std::ios::app);
    if (!state.fileStream.is_open()) {
        fmt::print(stderr, "[Logger] Unable to open log file '{}'\n", state.filePath.string());
    }
}

void ReadEnvironment(LoggerState& state) {
    const char* env = std::getenv("SH_LOG_DEBUG");
    if (!env) {
        return;
    }
    std::string value(env);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "on" || value == "yes") {
        state.debugEnabled.store(true, std::memory_order_release);
    } else if (value == "0" || value == "false" || value == "off" || value == "no") {
        state.debugEnabled.store(false, std::memory_order_release);
    }
}

} // namespace

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "Debug";
        case LogLevel::Info:    return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error:   return "Error";
    }
    return "Unknown";
}

void Logger::SetMinimumLevel(LogLevel level) {
    State().minimumLevel.store(static_cast<int>(level), std::memory_order_release);
}

LogLevel Logger::GetMinimumLevel() {
    return static_cast<LogLevel>(State().minimumLevel.load(std::memory_order_acquire));
}

void Logger::SetDebugEnabled(bool enabled) {
    auto& state = State();
    state.environmentRead.store(true, std::memory_order_release);
    state.debugEnabled.store(enabled, std::memory_order_release);
}

bool Logger::IsDebugEnabled() {
#ifdef SH_DEBUG
    auto& state = State();
    bool expected = false;
    if (state.environmentRead.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        ReadEnvironment(state);
    }
    return state.debugEnabled.load(std::memory_order_acquire);
#else
    return false;
#endif
}

void Logger::ConfigureFromEnvironment() {
    auto& state = State();
    state.environmentRead.store(true, std::memory_order_release);
    ReadEnvironment(state);
}

void Logger::SetLogFile(const std::filesystem::path& path) {
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.filePath = path;
    OpenFileLocked(state);
}

std::size_t Logger::RegisterListener(LogCallback callback) {
    if (!callback) {
        return 0;
    }
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    const std::size_t token = state.nextToken.fetch_add(1, std::memory_order_relaxed);
    state.listeners.emplace_back(token, std::move(callback));
    return token;
}

void Logger::UnregisterListener(std::size_t token) {
    if (token == 0) {
        return;
    }
    auto& state = State();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.listeners.erase(std::remove_if(state.listeners.begin(), state.listeners.end(),
                                         [token](const auto& entry) { return entry.first == token; }),
                          state.listeners.end());
}

void Logger::Write(LogLevel level, const std::string& message) {
    auto& state = State();
    if (static_cast<int>(level) < state.minimumLevel.load(std::memory_order_acquire)) {
        return;
    }

    const std::string line = fmt::format("[{}] [{}] {}", FormatTimestamp(), ToString(level), message);
    fmt::print(stderr, "{}\n", line);

    std::vector<LogCallback> listenersCopy;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.fileStream.is_open()) {
            state.fileStream << line << '\n';
            state.fileStream.flush();
        }
        listenersCopy.reserve(state.listeners.size());
        for (const auto& [token, callback] : state.listeners) {
            listenersCopy.push_back(callback);
        }
    }

    for (auto& callback : listenersCopy) {
        try {
            callback(level, line);
        } catch (const std::exception& e) {
            fmt::print(stderr, "[Logger] Listener threw: {}\n", e.what());
        } catch (...) {
            fmt::print(stderr, "[Logger] Listener threw a non-standard exception\n");
        }
    }
}

} // namespace sh::core
