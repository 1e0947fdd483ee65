#include "config.hpp"
#include <cstdlib>

static const char* envOrNull(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

Config Config::fromEnvironment() {
    Config cfg;

    if (const char* dir = envOrNull("CARDWISE_DATA_DIR"))
        cfg.data_dir = dir;
    if (const char* file = envOrNull("CARDWISE_LOG_FILE"))
        cfg.log_file = file;

    if (const char* level = envOrNull("CARDWISE_LOG_LEVEL")) {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to "off"
        if (parsed != spdlog::level::off || std::string(level) == "off")
            cfg.log_level = parsed;
        else
            spdlog::warn("Unknown CARDWISE_LOG_LEVEL '{}'; keeping default", level);
    }

    return cfg;
}

std::string Config::userFile() const {
    return data_dir + "/users.txt";
}

std::string Config::cardFileFor(const std::string& username) const {
    return data_dir + "/cards_" + username + ".dat";
}
