#pragma once
#include <string>
#include <ctime>
#include <optional>
#include "Date.hpp"

class Card {
public:
    static constexpr int INITIAL_INTERVAL = 0;
    static constexpr double INITIAL_EASE = 2.5;
    static constexpr double MIN_EASE = 1.3;

    Card() = default;

    // Fresh card due today. Throws InvalidInput on blank question/answer.
    static Card create(const std::string& question, const std::string& answer, std::time_t now);

    // Basic fields
    std::string id;          // Assigned by the store
    std::string question;
    std::string answer;

    // Scheduler state
    int interval = INITIAL_INTERVAL;      // Days
    double ease_factor = INITIAL_EASE;
    std::optional<std::time_t> last_review;
    Date next_review;

    std::time_t created_at = 0;

    bool isDue(const Date& asOf) const { return next_review <= asOf; }

    // Utility
    static std::string generateID();
    static bool isBlank(const std::string& text);
};
