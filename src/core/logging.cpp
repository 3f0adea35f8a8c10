/**
 * @file logging.cpp
 * @brief spdlog console and rotating file sink setup
 *
 * @date 2025
 */

#include "agentbox/core/logging.hpp"
#include "agentbox/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <vector>

namespace agentbox {
namespace core {

void InitLogging(const LoggingSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file, settings.max_file_size_mb * 1024 * 1024, settings.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            throw EngineError(ErrorKind::VALIDATION,
                              "Cannot open log file " + settings.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("agentbox", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    spdlog::set_level(spdlog::level::from_str(settings.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);

    spdlog::debug("Logging initialized (level={}, file={})",
                  settings.level, settings.file.empty() ? "<none>" : settings.file);
}

} // namespace core
} // namespace agentbox
