#include "utils/logging.hpp"
#include <filesystem>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace spreadarb {

namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/spreadarb.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("spreadarb", sinks.begin(), sinks.end());
    logger->set_level(parse_level(config.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

} // namespace spreadarb
