#pragma once
#include <string>
#include <spdlog/spdlog.h>

// Runtime settings. Defaults are overridable through CARDWISE_* environment variables.
struct Config {
    std::string data_dir = ".";
    std::string log_file = "cardwise.log";
    spdlog::level::level_enum log_level = spdlog::level::debug;

    static Config fromEnvironment();

    std::string userFile() const;
    std::string cardFileFor(const std::string& username) const;
};
