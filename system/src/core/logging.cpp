// ============= src/core/logging.cpp =============
#include "core/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace faceattend {

void init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.file.empty()) {
        std::filesystem::path p(config.file);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
    }

    auto logger = std::make_shared<spdlog::logger>("faceattend", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.level));
    spdlog::flush_on(spdlog::level::warn);

    if (!config.file.empty()) {
        spdlog::info("📝 Log file: {}", config.file);
    }
}

} // namespace faceattend
