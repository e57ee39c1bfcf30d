#pragma once

/// @file log.hpp
/// @brief spdlog setup and module loggers for hoard
///
/// Each subsystem logs through its own named logger ("hoard_core",
/// "hoard_asset", "streaming", "hot_reload"). Every logger writes to one
/// shared distributing sink whose children are rebuilt from LogConfig.

#include <hoard/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define HOARD_LOG_TRACE(...) ::hoard_core::core_logger()->trace(__VA_ARGS__)
#define HOARD_LOG_DEBUG(...) ::hoard_core::core_logger()->debug(__VA_ARGS__)
#define HOARD_LOG_INFO(...) ::hoard_core::core_logger()->info(__VA_ARGS__)
#define HOARD_LOG_WARN(...) ::hoard_core::core_logger()->warn(__VA_ARGS__)
#define HOARD_LOG_ERROR(...) ::hoard_core::core_logger()->error(__VA_ARGS__)
#define HOARD_LOG_CRITICAL(...) ::hoard_core::core_logger()->critical(__VA_ARGS__)

namespace hoard_core {

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    bool console_enabled = true;
    /// Empty disables the file sink; otherwise a rotating "hoard.log" lives here
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
    /// Per-logger overrides of `level`, keyed by logger name
    std::map<std::string, spdlog::level::level_enum> module_levels;

    /// Quiet preset for tests and tools: console off, warnings and above
    [[nodiscard]] static LogConfig quiet() {
        LogConfig config;
        config.console_enabled = false;
        config.level = spdlog::level::warn;
        return config;
    }

    /// Keys: console, directory, max_file_size, max_files, level, modules{name: level}
    [[nodiscard]] static Result<LogConfig> from_json(const nlohmann::json& j);
};

/// Rebuild the shared sinks and apply levels to every existing logger
void configure_logging(const LogConfig& config);

/// Current configuration
[[nodiscard]] LogConfig logging_config();

// =============================================================================
// Loggers
// =============================================================================

/// Named logger, created on first use with the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> core_logger();
std::shared_ptr<spdlog::logger> asset_logger();
std::shared_ptr<spdlog::logger> streaming_logger();
std::shared_ptr<spdlog::logger> reload_logger();

// =============================================================================
// Levels
// =============================================================================

/// Applies to every logger without a module override
void set_global_log_level(spdlog::level::level_enum level);

/// Overrides one logger; survives configure_logging only if listed in module_levels
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Case-insensitive; accepts "warning", "err" and "fatal" as aliases
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Logs `message {key=value, ...}` on the named logger
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// Logs an Error with its code, context and cause chain
void log_error(spdlog::level::level_enum level, const std::string& logger_name,
               const std::string& what, const Error& error);

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry and exit (with elapsed time) of a block at trace level
class LogScope {
public:
    explicit LogScope(std::string name, const std::string& logger_name = "hoard_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define HOARD_LOG_SCOPE_CAT2(a, b) a##b
#define HOARD_LOG_SCOPE_CAT(a, b) HOARD_LOG_SCOPE_CAT2(a, b)
#define HOARD_LOG_SCOPE(name, logger) \
    ::hoard_core::LogScope HOARD_LOG_SCOPE_CAT(hoard_log_scope_, __LINE__)(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flushes and detaches every sink; configure_logging attaches new ones
void shutdown_logging();

} // namespace hoard_core
