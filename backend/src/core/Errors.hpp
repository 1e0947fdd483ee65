#pragma once
#include <stdexcept>
#include <string>

// Validation failures are thrown; store outcomes are returned as StoreStatus.

class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

class InvalidQuality : public std::out_of_range {
public:
    explicit InvalidQuality(int quality)
        : std::out_of_range("quality rating " + std::to_string(quality) + " is outside [0, 5]"),
        rating(quality) {}

    int rating;
};

// Session operation called from a phase where it is not defined
class InvalidTransition : public std::logic_error {
public:
    explicit InvalidTransition(const std::string& what) : std::logic_error(what) {}
};

enum class StoreStatus {
    OK,
    NOT_FOUND,
    PERSISTENCE_ERROR
};

inline const char* toString(StoreStatus s) {
    switch (s) {
    case StoreStatus::OK: return "ok";
    case StoreStatus::NOT_FOUND: return "not found";
    case StoreStatus::PERSISTENCE_ERROR: return "persistence error";
    }
    return "unknown";
}
