#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <vector>
#include <mediadex/config/logging.h>

namespace mediadex::config {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view level) {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    return std::nullopt;
}

void configureLogging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!config.file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.file.parent_path(), ec);
        try {
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("mediadex", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);

    auto level = parseLogLevel(config.level);
    spdlog::set_level(level.value_or(spdlog::level::info));
    if (!level) {
        spdlog::warn("[Logging] unknown level '{}', using info", config.level);
    }
    if (!fileError.empty()) {
        spdlog::warn("[Logging] file logging disabled ({}): {}", config.file.string(), fileError);
    }
}

} // namespace mediadex::config
