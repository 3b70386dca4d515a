#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logsys {
    struct Options {
        spdlog::level::level_enum level = spdlog::level::info;
        bool        console  = true;
        std::string filePath;                 // empty: no file sink
        std::size_t maxFileBytes = 1 << 20;   // 1MB
        std::size_t maxFiles     = 4;
    };

    void init(const Options& options);        // installs "planetmap" as the default logger
    std::shared_ptr<spdlog::logger> get();    // "planetmap"; console-only until init()
}
