#include "ReviewSession.hpp"
#include "Errors.hpp"
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

ReviewSession::ReviewSession(CardStore& cardStore, Clock clk)
    : store(cardStore), clock(std::move(clk))
{
    if (!clock) {
        clock = [] { return std::time(nullptr); };
    }
}

void ReviewSession::start(std::vector<Card> dueQueue) {
    requirePhase(Phase::IDLE, "start");

    queue = std::move(dueQueue);
    pos = 0;
    last_outcome.reset();
    reviewed = 0;
    lapsed = 0;

    current_phase = queue.empty() ? Phase::COMPLETE : Phase::PRESENTING;
    spdlog::info("Review session started with {} card(s)", queue.size());
}

void ReviewSession::revealAnswer() {
    requirePhase(Phase::PRESENTING, "revealAnswer");
    current_phase = Phase::AWAITING_RATING;
    spdlog::debug("Answer revealed for card {}", queue[pos].id);
}

StoreStatus ReviewSession::submitRating(int quality) {
    requirePhase(Phase::AWAITING_RATING, "submitRating");

    Card& card = queue[pos];
    const std::time_t now = clock();

    // Throws InvalidQuality before anything reaches the store
    ReviewOutcome outcome = scheduler.computeNextState(
        Scheduler::stateOf(card), quality, Date::fromUnixTime(now));

    CardPatch patch;
    patch.interval = outcome.interval;
    patch.ease_factor = outcome.ease_factor;
    patch.next_review = outcome.next_review;
    patch.last_review = now;

    StoreStatus status = store.update(card.id, patch);
    if (status != StoreStatus::OK) {
        spdlog::error("Could not persist review of card {}: {}", card.id, toString(status));
        return status;
    }

    card.interval = outcome.interval;
    card.ease_factor = outcome.ease_factor;
    card.next_review = outcome.next_review;
    card.last_review = now;

    last_outcome = outcome;
    ++reviewed;
    if (quality < Scheduler::PASS_QUALITY) ++lapsed;

    spdlog::info("Reviewed card {} | q={} | interval={} ease={:.2f} next={}",
        card.id, quality, outcome.interval, outcome.ease_factor, outcome.next_review.toIsoString());

    if (pos + 1 < queue.size()) {
        ++pos;
        current_phase = Phase::PRESENTING;
    }
    else {
        current_phase = Phase::COMPLETE;
        spdlog::info("Review session complete: reviewed={} lapsed={}", reviewed, lapsed);
    }
    return StoreStatus::OK;
}

void ReviewSession::abort() {
    if (current_phase != Phase::IDLE)
        spdlog::info("Review session aborted at card {} of {}", pos + 1, queue.size());
    reset();
}

const Card& ReviewSession::currentCard() const {
    if (current_phase != Phase::PRESENTING && current_phase != Phase::AWAITING_RATING)
        throw InvalidTransition(std::string("no current card while ") + toString(current_phase));
    return queue[pos];
}

void ReviewSession::requirePhase(Phase expected, const char* operation) const {
    if (current_phase != expected) {
        spdlog::warn("{}() called while {}", operation, toString(current_phase));
        throw InvalidTransition(std::string(operation) + "() is not allowed while " + toString(current_phase));
    }
}

void ReviewSession::reset() {
    queue.clear();
    pos = 0;
    current_phase = Phase::IDLE;
    last_outcome.reset();
    reviewed = 0;
    lapsed = 0;
}

const char* toString(ReviewSession::Phase phase) {
    switch (phase) {
    case ReviewSession::Phase::IDLE: return "idle";
    case ReviewSession::Phase::PRESENTING: return "presenting";
    case ReviewSession::Phase::AWAITING_RATING: return "awaiting rating";
    case ReviewSession::Phase::COMPLETE: return "complete";
    }
    return "unknown";
}
