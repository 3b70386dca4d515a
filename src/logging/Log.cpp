#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_mutex;

static constexpr const char* kLoggerName = "planetmap";
static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%^%l%$] %v";

static std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    return logger;
}

void logsys::init(const Options& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!options.filePath.empty()) {
        const fs::path file(options.filePath);
        if (file.has_parent_path()) {
            std::error_code ec; fs::create_directories(file.parent_path(), ec);
        }
        // Throws spdlog::spdlog_ex if the file cannot be opened.
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file.string(), options.maxFileBytes, options.maxFiles));
    }

    auto logger = make_logger(std::move(sinks));
    logger->set_level(options.level);
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_logger = logger;
    }
    spdlog::set_default_logger(logger);
    logger->debug("Logging started");
}

std::shared_ptr<spdlog::logger> logsys::get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = make_logger({std::make_shared<spdlog::sinks::stdout_color_sink_mt>()});
        g_logger->set_level(spdlog::level::warn);
    }
    return g_logger;
}
