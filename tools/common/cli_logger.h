#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

namespace fidx::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "VERBOSE";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "VERBOSE";
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    stream << '[' << level_name(min_level) << "] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[WARN] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[ERROR] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args> void print(Args&&... args) {
    auto& stream = std::cout;
    if constexpr (sizeof...(Args) > 0) { ((stream << std::forward<Args>(args) << ' '), ...); }
    stream << '\n';
}

} // namespace fidx::log

namespace fidx::cli {
    using namespace fidx::log;
}

#define LOGI(...) ::fidx::log::info(__VA_ARGS__)
#define LOGW(...) ::fidx::log::warn(__VA_ARGS__)
#define LOGE(...) ::fidx::log::error(__VA_ARGS__)

#if FIDX_DEBUG
    #define LOGD(...) ::fidx::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
