/// @file test_log.cpp
/// @brief Tests for hoard_core logging

#include <catch2/catch_test_macros.hpp>
#include <hoard/core/log.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace hoard_core;

namespace {

std::string read_file(const std::filesystem::path& file) {
    std::ifstream in(file);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

/// Restores quiet logging when a test leaves
struct QuietOnExit {
    ~QuietOnExit() { configure_logging(LogConfig::quiet()); }
};

} // namespace

TEST_CASE("Logging: level names", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("WARNING") == spdlog::level::warn);
    REQUIRE(parse_log_level("Err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::off)) == "off");
}

TEST_CASE("Logging: LogConfig from JSON", "[core][log]") {
    SECTION("all keys") {
        auto config = LogConfig::from_json(nlohmann::json::parse(R"({
            "console": false,
            "directory": "logs",
            "max_file_size": 4096,
            "max_files": 2,
            "level": "debug",
            "modules": {"hot_reload": "trace", "streaming": "off"}
        })"));
        REQUIRE(config.is_ok());
        REQUIRE_FALSE(config->console_enabled);
        REQUIRE(config->log_directory == "logs");
        REQUIRE(config->max_file_size == 4096);
        REQUIRE(config->max_files == 2);
        REQUIRE(config->level == spdlog::level::debug);
        REQUIRE(config->module_levels.at("hot_reload") == spdlog::level::trace);
        REQUIRE(config->module_levels.at("streaming") == spdlog::level::off);
    }

    SECTION("invalid documents") {
        using nlohmann::json;
        for (const auto& doc : {
                 json::array(),
                 json{{"console", "yes"}},
                 json{{"level", "loud"}},
                 json{{"max_file_size", 0}},
                 json{{"modules", json{{"streaming", 3}}}}}) {
            auto config = LogConfig::from_json(doc);
            REQUIRE(config.is_err());
            REQUIRE(config.error().code() == ErrorCode::InvalidData);
        }
    }
}

TEST_CASE("Logging: module loggers and levels", "[core][log]") {
    QuietOnExit restore;

    LogConfig config = LogConfig::quiet();
    config.level = spdlog::level::info;
    config.module_levels["hot_reload"] = spdlog::level::trace;
    configure_logging(config);

    REQUIRE(asset_logger()->name() == "hoard_asset");
    REQUIRE(get_logger("hoard_asset") == asset_logger());
    REQUIRE(asset_logger()->level() == spdlog::level::info);
    REQUIRE(reload_logger()->level() == spdlog::level::trace);
    REQUIRE(get_global_log_level() == spdlog::level::info);

    set_global_log_level(spdlog::level::err);
    REQUIRE(streaming_logger()->level() == spdlog::level::err);
    REQUIRE(reload_logger()->level() == spdlog::level::trace);

    set_logger_level("streaming", spdlog::level::debug);
    REQUIRE(streaming_logger()->level() == spdlog::level::debug);
    REQUIRE(logging_config().level == spdlog::level::err);
}

TEST_CASE("Logging: file sink receives structured and error lines", "[core][log]") {
    QuietOnExit restore;

    auto dir = std::filesystem::temp_directory_path() /
        ("hoard_log_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

    LogConfig config = LogConfig::quiet();
    config.level = spdlog::level::trace;
    config.log_directory = dir.string();
    configure_logging(config);

    log_structured(spdlog::level::info, "hoard_asset", "Trimmed cache", {{"evicted", "2"}, {"freed_bytes", "64"}});
    Error error(ErrorCode::NotFound, "Asset file not found: a.txt");
    error.with_context("path", "a.txt");
    log_error(spdlog::level::warn, "hoard_asset", "Failed to load 'a.txt'", error);
    {
        HOARD_LOG_SCOPE("scoped block", "hoard_core");
    }
    flush_all_loggers();

    std::string text = read_file(dir / "hoard.log");
    REQUIRE(text.find("[hoard_asset]") != std::string::npos);
    REQUIRE(text.find("Trimmed cache {evicted=2, freed_bytes=64}") != std::string::npos);
    REQUIRE(text.find("Failed to load 'a.txt': [NotFound] Asset file not found: a.txt {path=a.txt}") != std::string::npos);
    REQUIRE(text.find("-> scoped block") != std::string::npos);
    REQUIRE(text.find("<- scoped block") != std::string::npos);

    shutdown_logging();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
