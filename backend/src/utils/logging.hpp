#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "config.hpp"

namespace Log
{
    inline void init(const Config& cfg)
    {
        // File logger only; the terminal belongs to the review UI
        auto file_logger = spdlog::basic_logger_mt("file_logger", cfg.log_file);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // Level and flushing setup
        spdlog::set_level(cfg.log_level);
        spdlog::flush_on(spdlog::level::info);
    }
}
