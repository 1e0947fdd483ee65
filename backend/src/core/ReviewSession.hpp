#pragma once
#include <cstddef>
#include <ctime>
#include <functional>
#include <optional>
#include <vector>
#include "Card.hpp"
#include "Scheduler.hpp"
#include "../storage/CardStore.hpp"

/*
  One review pass over a frozen queue.

    Idle --start(non-empty)--> Presenting(0)
    Idle --start(empty)------> Complete
    Presenting(p) --revealAnswer--> AwaitingRating(p)
    AwaitingRating(p) --submitRating, store OK--> Presenting(p+1) | Complete
    AwaitingRating(p) --submitRating, store failed--> AwaitingRating(p)
    any --abort--> Idle

  The session never advances before the store acknowledges the update.
  Wrong-phase calls throw InvalidTransition and change nothing.
*/
class ReviewSession {
public:
    enum class Phase {
        IDLE,
        PRESENTING,
        AWAITING_RATING,
        COMPLETE
    };

    using Clock = std::function<std::time_t()>;

    explicit ReviewSession(CardStore& store, Clock clock = nullptr);

    void start(std::vector<Card> queue);
    void revealAnswer();
    // Returns the store outcome; anything but OK leaves the session on the same card
    StoreStatus submitRating(int quality);
    StoreStatus submitRating(ReviewQuality quality) { return submitRating(static_cast<int>(quality)); }
    void abort();

    Phase phase() const { return current_phase; }
    std::size_t position() const { return pos; }
    std::size_t size() const { return queue.size(); }
    const Card& currentCard() const;

    // Result of the most recent persisted rating
    const std::optional<ReviewOutcome>& lastOutcome() const { return last_outcome; }
    int reviewedCount() const { return reviewed; }
    int lapseCount() const { return lapsed; }

private:
    CardStore& store;
    Clock clock;
    Scheduler scheduler;

    std::vector<Card> queue;
    std::size_t pos = 0;
    Phase current_phase = Phase::IDLE;

    std::optional<ReviewOutcome> last_outcome;
    int reviewed = 0;
    int lapsed = 0;

    void requirePhase(Phase expected, const char* operation) const;
    void reset();
};

const char* toString(ReviewSession::Phase phase);
