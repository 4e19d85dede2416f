#include <dlcore/common/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <system_error>
#include <vector>

namespace dlcore {

namespace {

constexpr const char* kLoggerName = "dlcore";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

} // namespace

Result<void> setLogLevel(std::string_view level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn" || level == "warning") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + std::string(level)};
    }
    return {};
}

Result<void> initLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (config.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!config.file.empty()) {
            std::error_code ec;
            if (config.file.has_parent_path()) {
                std::filesystem::create_directories(config.file.parent_path(), ec);
                if (ec) {
                    return Error{ErrorCode::DiskError, "Failed to create log directory " +
                                                           config.file.parent_path().string() +
                                                           ": " + ec.message()};
                }
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file.string(), config.maxFileBytes, config.maxFiles));
        }
    } catch (const spdlog::spdlog_ex& ex) {
        return Error{ErrorCode::DiskError, std::string("Failed to create log sink: ") + ex.what()};
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    auto levelResult = setLogLevel(config.level);
    if (!levelResult) {
        spdlog::warn("{}; keeping level 'info'", levelResult.error().message);
        spdlog::set_level(spdlog::level::info);
    }

    if (!config.file.empty()) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.file.string(),
                     config.maxFileBytes / (1024 * 1024), config.maxFiles);
    }
    return {};
}

} // namespace dlcore
