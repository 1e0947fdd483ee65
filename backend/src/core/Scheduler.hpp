#pragma once
#include <spdlog/spdlog.h>
#include "Card.hpp"
#include "Date.hpp"

// Ratings offered by the review front end. Any integer in [0, 5] is accepted.
enum class ReviewQuality {
    AGAIN = 0,
    HARD = 2,
    GOOD = 4,
    EASY = 5
};

struct SchedulingState {
    int interval = Card::INITIAL_INTERVAL;
    double ease_factor = Card::INITIAL_EASE;
};

struct ReviewOutcome {
    int interval = 0;
    double ease_factor = Card::INITIAL_EASE;
    Date next_review;
};

/*
  SM-2 variant:
   - quality >= 3 is a correct recall; the interval walks 0 -> 1 -> 6 and then
     grows by the (updated) ease factor
   - quality 4/5 adjusts ease by 0.1 - (5-q)(0.08 + (5-q)0.02); quality 3 keeps it
   - quality < 3 resets the interval to 0 and drops ease by 0.2
   - ease never goes below 1.3

  Pure and deterministic: the caller supplies `today`.
*/
class Scheduler {
public:
    static constexpr int MIN_QUALITY = 0;
    static constexpr int MAX_QUALITY = 5;
    static constexpr int PASS_QUALITY = 3;
    static constexpr int MAX_INTERVAL_DAYS = 36500;

    // Throws InvalidQuality if quality is outside [0, 5], InvalidInput on a corrupt state
    ReviewOutcome computeNextState(const SchedulingState& state, int quality, const Date& today) const;
    ReviewOutcome computeNextState(const SchedulingState& state, int quality) const;
    ReviewOutcome computeNextState(const SchedulingState& state, ReviewQuality quality, const Date& today) const {
        return computeNextState(state, static_cast<int>(quality), today);
    }

    static SchedulingState stateOf(const Card& card) { return { card.interval, card.ease_factor }; }
    static bool isValidQuality(int quality) { return quality >= MIN_QUALITY && quality <= MAX_QUALITY; }

private:
    double updatedEase(double ease, int quality) const;
    int nextCorrectInterval(int interval, double ease) const;
};
