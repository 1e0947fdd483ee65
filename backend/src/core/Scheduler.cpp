#include "Scheduler.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

ReviewOutcome Scheduler::computeNextState(const SchedulingState& state, int quality, const Date& today) const {
    if (!isValidQuality(quality)) {
        spdlog::warn("Rejected quality rating {}", quality);
        throw InvalidQuality(quality);
    }
    if (state.interval < 0 || state.ease_factor < Card::MIN_EASE) {
        spdlog::error("Corrupt scheduling state: interval={} ease={}", state.interval, state.ease_factor);
        throw InvalidInput("scheduling state violates interval >= 0 / ease >= 1.3");
    }

    ReviewOutcome out;

    if (quality >= PASS_QUALITY) {
        out.ease_factor = updatedEase(state.ease_factor, quality);
        out.interval = nextCorrectInterval(state.interval, out.ease_factor);
    }
    else {
        // Lapse: due again today
        out.interval = 0;
        out.ease_factor = std::max(state.ease_factor - 0.2, Card::MIN_EASE);
    }

    out.next_review = today.addDays(out.interval);

    spdlog::debug("computeNextState: q={} interval {} -> {} ease {:.3f} -> {:.3f} due {}",
        quality, state.interval, out.interval, state.ease_factor, out.ease_factor,
        out.next_review.toIsoString());

    return out;
}

ReviewOutcome Scheduler::computeNextState(const SchedulingState& state, int quality) const {
    return computeNextState(state, quality, Date::today());
}

double Scheduler::updatedEase(double ease, int quality) const {
    if (quality == PASS_QUALITY) {
        return ease;
    }

    const int miss = MAX_QUALITY - quality;
    double next = ease + (0.1 - miss * (0.08 + miss * 0.02));
    return std::max(next, Card::MIN_EASE);
}

int Scheduler::nextCorrectInterval(int interval, double ease) const {
    if (interval == 0) return 1;  // first successful review
    if (interval == 1) return 6;  // second successful review

    double grown = std::round(static_cast<double>(interval) * ease);
    if (grown > MAX_INTERVAL_DAYS) return MAX_INTERVAL_DAYS;
    return static_cast<int>(grown);
}
