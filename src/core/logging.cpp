#include "lifeline/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace lifeline::core {

void configure_logging(const ObservabilityConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);

    if (config.log_to_file) {
        try {
            fs::path path = expand_path(config.log_path);
            if (path.has_parent_path()) {
                fs::create_directories(path.parent_path());
            }

            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string()));

            auto logger = std::make_shared<spdlog::logger>("lifeline", sinks.begin(), sinks.end());
            spdlog::set_default_logger(logger);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to open log file {}: {}", config.log_path.string(), e.what());
        }
    }

    spdlog::set_level(level);
}

}  // namespace lifeline::core
