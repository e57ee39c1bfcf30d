/// @file log.cpp
/// @brief Module loggers over a shared spdlog distributing sink

#include <hoard/core/log.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace hoard_core {

namespace {

struct LogState {
    std::mutex mutex;
    LogConfig config;
    std::shared_ptr<spdlog::sinks::dist_sink_mt> sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    bool sinks_built = false;
};

LogState& state() {
    static LogState s;
    return s;
}

spdlog::level::level_enum level_for(const LogConfig& config, const std::string& name) {
    auto it = config.module_levels.find(name);
    return it != config.module_levels.end() ? it->second : config.level;
}

/// Caller holds the state mutex
void rebuild_sinks(LogState& s) {
    std::vector<spdlog::sink_ptr> sinks;

    if (s.config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] [t%t] %v");
        sinks.push_back(std::move(console));
    }

    if (!s.config.log_directory.empty()) {
        auto file = std::filesystem::path(s.config.log_directory) / "hoard.log";
        try {
            std::filesystem::create_directories(file.parent_path());
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file.string(), s.config.max_file_size, s.config.max_files);
            rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [t%t] %v");
            sinks.push_back(std::move(rotating));
        } catch (const std::exception& e) {
            // spdlog_ex or filesystem_error; console logging carries on
            spdlog::warn("hoard: cannot open log file '{}': {}", file.string(), e.what());
        }
    }

    s.sink->set_sinks(std::move(sinks));
    s.sinks_built = true;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Result<spdlog::level::level_enum> level_from_json(const nlohmann::json& j, const std::string& key) {
    if (!j.is_string()) {
        return Err<spdlog::level::level_enum>(Error(ErrorCode::InvalidData, "log config: '" + key + "' must be a string"));
    }
    auto level = parse_log_level(j.get<std::string>());
    if (!level) {
        return Err<spdlog::level::level_enum>(
            Error(ErrorCode::InvalidData, "log config: unknown level '" + j.get<std::string>() + "'"));
    }
    return Ok(*level);
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

Result<LogConfig> LogConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<LogConfig>(Error(ErrorCode::InvalidData, "log config: document must be an object"));
    }

    LogConfig config;

    if (j.contains("console")) {
        if (!j["console"].is_boolean()) {
            return Err<LogConfig>(Error(ErrorCode::InvalidData, "log config: 'console' must be a boolean"));
        }
        config.console_enabled = j["console"].get<bool>();
    }
    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return Err<LogConfig>(Error(ErrorCode::InvalidData, "log config: 'directory' must be a string"));
        }
        config.log_directory = j["directory"].get<std::string>();
    }
    if (j.contains("max_file_size")) {
        if (!j["max_file_size"].is_number_integer() || j["max_file_size"].get<std::int64_t>() <= 0) {
            return Err<LogConfig>(Error(ErrorCode::InvalidData, "log config: 'max_file_size' must be positive"));
        }
        config.max_file_size = j["max_file_size"].get<std::size_t>();
    }
    if (j.contains("max_files")) {
        if (!j["max_files"].is_number_integer() || j["max_files"].get<std::int64_t>() < 0) {
            return Err<LogConfig>(Error(ErrorCode::InvalidData, "log config: 'max_files' must not be negative"));
        }
        config.max_files = j["max_files"].get<std::size_t>();
    }
    if (j.contains("level")) {
        auto level = level_from_json(j["level"], "level");
        if (!level) {
            return Err<LogConfig>(level.error());
        }
        config.level = *level;
    }
    if (j.contains("modules")) {
        if (!j["modules"].is_object()) {
            return Err<LogConfig>(Error(ErrorCode::InvalidData, "log config: 'modules' must be an object"));
        }
        for (const auto& [name, value] : j["modules"].items()) {
            auto level = level_from_json(value, name);
            if (!level) {
                return Err<LogConfig>(level.error());
            }
            config.module_levels[name] = *level;
        }
    }

    return Ok(std::move(config));
}

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    s.config = config;
    rebuild_sinks(s);
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(level_for(s.config, name));
    }
}

LogConfig logging_config() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.config;
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    auto it = s.loggers.find(name);
    if (it != s.loggers.end()) {
        return it->second;
    }

    if (!s.sinks_built) {
        rebuild_sinks(s);
    }

    auto logger = std::make_shared<spdlog::logger>(name, s.sink);
    logger->set_level(level_for(s.config, name));
    logger->flush_on(spdlog::level::err);
    s.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static const auto logger = get_logger("hoard_core");
    return logger;
}

std::shared_ptr<spdlog::logger> asset_logger() {
    static const auto logger = get_logger("hoard_asset");
    return logger;
}

std::shared_ptr<spdlog::logger> streaming_logger() {
    static const auto logger = get_logger("streaming");
    return logger;
}

std::shared_ptr<spdlog::logger> reload_logger() {
    static const auto logger = get_logger("hot_reload");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    s.config.level = level;
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(level_for(s.config, name));
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    auto it = s.loggers.find(name);
    if (it != s.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> k_levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    auto it = k_levels.find(lowercase(str));
    if (it == k_levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream line;
    line << message;
    if (!fields.empty()) {
        line << " {";
        const char* separator = "";
        for (const auto& [key, value] : fields) {
            line << separator << key << '=' << value;
            separator = ", ";
        }
        line << '}';
    }
    logger->log(level, line.str());
}

void log_error(spdlog::level::level_enum level, const std::string& logger_name,
               const std::string& what, const Error& error) {
    auto logger = get_logger(logger_name);
    if (logger->should_log(level)) {
        logger->log(level, "{}: {}", what, build_error_chain(error));
    }
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("-> {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<- {} ({} us)", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
    s.sink->set_sinks({});
    s.sinks_built = false;
}

} // namespace hoard_core
