#pragma once

#include <fmt/core.h>
#include <fmt/color.h>
#include <fmt/chrono.h>
#include <mutex>
#include <chrono>
#include <ctime>

// ====== CONFIGURATION: Compile-time flags ======
// Define these in CMake or via compiler flags (-DCROSSFORGE_LOG_DISABLE_COLORS, etc.)

// Disable specific levels
#ifndef CROSSFORGE_LOG_DISABLE_INFO
// #define CROSSFORGE_LOG_DISABLE_INFO
#endif
#ifndef CROSSFORGE_LOG_DISABLE_WARN
// #define CROSSFORGE_LOG_DISABLE_WARN
#endif
#ifndef CROSSFORGE_LOG_DISABLE_ERROR
// #define CROSSFORGE_LOG_DISABLE_ERROR
#endif

// Disable colors (for environments that don't support ANSI)
#ifndef CROSSFORGE_LOG_DISABLE_COLORS
// #define CROSSFORGE_LOG_DISABLE_COLORS
#endif

// Disable timestamp in logs
#ifndef CROSSFORGE_LOG_DISABLE_TIMESTAMP
// #define CROSSFORGE_LOG_DISABLE_TIMESTAMP
#endif

// Default output stream for info/success/command
#ifndef CROSSFORGE_LOG_DEFAULT_STREAM
    #define CROSSFORGE_LOG_DEFAULT_STREAM stdout
#endif

// Error stream for warnings and errors
#ifndef CROSSFORGE_LOG_ERROR_STREAM
    #define CROSSFORGE_LOG_ERROR_STREAM stderr
#endif

// ===============================================

namespace crossforge {

// Global mutex so worker threads do not interleave their output
inline std::mutex g_output_mutex;

// Helper to format timestamp: YYYY-MM-DD HH:MM:SS.mmm
inline std::string now_str() {
#ifdef CROSSFORGE_LOG_DISABLE_TIMESTAMP
    return "YYYY-MM-DD HH:MM:SS.000"; // placeholder
#else
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(now)), ms.count());
#endif
}

namespace out {

#ifdef CROSSFORGE_LOG_DISABLE_COLORS
    inline constexpr fmt::text_style color_info{};
    inline constexpr fmt::text_style color_warn{};
    inline constexpr fmt::text_style color_error{};
    inline constexpr fmt::text_style color_success{};
    inline constexpr fmt::text_style color_cmd{};
#else
    inline constexpr auto color_info = fmt::fg(fmt::color::dodger_blue) | fmt::emphasis::bold;
    inline constexpr auto color_warn = fmt::fg(fmt::color::orange) | fmt::emphasis::bold;
    inline constexpr auto color_error = fmt::fg(fmt::color::crimson) | fmt::emphasis::bold;
    inline constexpr auto color_success = fmt::fg(fmt::color::lime_green) | fmt::emphasis::bold;
    inline constexpr auto color_cmd = fmt::fg(fmt::color::cyan);
#endif

    // Generic log function with stream and color
    template<typename... T>
    void log_impl(const fmt::text_style style, FILE* stream, const char* level, fmt::format_string<T...> fmt, T&&... args) {
        std::lock_guard lock(g_output_mutex);
        const std::string time_str = now_str();
        const auto msg = fmt::format(fmt, std::forward<T>(args)...);

#ifdef CROSSFORGE_LOG_DISABLE_COLORS
        fmt::print(stream, "[{}] {} {}", time_str, level, msg);
#else
        fmt::print(stream, style, "[{}] {} ", time_str, level);
        fmt::print(stream, "{}", msg); // Avoid color reset interference
#endif
        fmt::print(stream, "\n");
    }

    template<typename... T>
    void info(fmt::format_string<T...> fmt, T&&... args) {
#ifndef CROSSFORGE_LOG_DISABLE_INFO
        log_impl(color_info, CROSSFORGE_LOG_DEFAULT_STREAM, "[INFO]", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void warn(fmt::format_string<T...> fmt, T&&... args) {
#ifndef CROSSFORGE_LOG_DISABLE_WARN
        log_impl(color_warn, CROSSFORGE_LOG_ERROR_STREAM, "[WARNING]", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void error(fmt::format_string<T...> fmt, T&&... args) {
#ifndef CROSSFORGE_LOG_DISABLE_ERROR
        log_impl(color_error, CROSSFORGE_LOG_ERROR_STREAM, "[ERROR]", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void success(fmt::format_string<T...> fmt, T&&... args) {
#ifndef CROSSFORGE_LOG_DISABLE_INFO
        log_impl(color_success, CROSSFORGE_LOG_DEFAULT_STREAM, "[OK]", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void command(fmt::format_string<T...> fmt, T&&... args) {
#ifndef CROSSFORGE_LOG_DISABLE_INFO
        log_impl(color_cmd, CROSSFORGE_LOG_DEFAULT_STREAM, "[CMD]", fmt, std::forward<T>(args)...);
#endif
    }

} // namespace out
} // namespace crossforge
