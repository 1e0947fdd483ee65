#include "Card.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

Card Card::create(const std::string& question, const std::string& answer, std::time_t now) {
    if (isBlank(question) || isBlank(answer)) {
        spdlog::warn("Rejected card: question and answer must both be non-empty");
        throw InvalidInput("question and answer cannot be empty");
    }

    Card card;
    card.question = question;
    card.answer = answer;
    card.created_at = now;
    card.next_review = Date::fromUnixTime(now); // Due immediately
    return card;
}

bool Card::isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

// Simple unique ID generator (timestamp + random bits)
std::string Card::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    static thread_local std::mt19937_64 eng{ std::random_device{}() };
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
