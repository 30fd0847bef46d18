#include "common/logger.h"

#include "config/client_config.h"
#include "config/config_loader.h"
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace darwin::client {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

// Every logger shares the same two sinks, built once: the console and a
// distributor holding the optional rotating file. Reconfiguring swaps the
// distributor's members; the loggers' own sink lists never change.
struct LoggingState {
    std::mutex mutex;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file;
    spdlog::sink_ptr console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::dist_sink_mt> file_slot =
        std::make_shared<spdlog::sinks::dist_sink_mt>();
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    logger = std::make_shared<spdlog::logger>(
        name, spdlog::sinks_init_list{s.console, s.file_slot});
    logger->set_pattern(kPattern);
    logger->set_level(s.level);
    logger->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger);
    return logger;
}

void configureLogging(const config::LoggingConfig& logging) {
    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        throw config::ConfigValidationError("Invalid log level: " + logging.level);
    }

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;

    if (logging.file != s.file) {
        std::vector<spdlog::sink_ptr> files;
        if (!logging.file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logging.file,
                5 * 1024 * 1024, // 5 MB per file
                3                // keep 3 rotated files
            );
            file_sink->set_pattern(kPattern);
            files.push_back(file_sink);
        }
        s.file_slot->set_sinks(std::move(files));
        s.file = logging.file;
    }

    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(level);
    });
}

} // namespace darwin::client
