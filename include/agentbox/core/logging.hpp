/**
 * @file logging.hpp
 * @brief Process-wide spdlog setup
 *
 * @date 2025
 */

#pragma once

#include "agentbox/core/config.hpp"

namespace agentbox {
namespace core {

/**
 * @brief Installs the default logger
 *
 * Console sink always; a rotating file sink when settings.file is set.
 * Pattern: [%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v
 *
 * @throws EngineError(VALIDATION) when the file sink cannot be opened
 */
void InitLogging(const LoggingSettings& settings);

} // namespace core
} // namespace agentbox
