#pragma once

#include <optional>
#include <string_view>
#include <spdlog/common.h>
#include <mediadex/config/gallery_config.h>

namespace mediadex::config {

/// "trace" … "error"; nullopt for anything else
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view level);

/**
 * @brief Install the process-wide default logger
 *
 * Colour stderr plus, when a file is configured, a rotating file
 * (10MB x 5). Falls back to stderr alone if the file cannot be opened.
 */
void configureLogging(const LoggingConfig& config);

} // namespace mediadex::config
