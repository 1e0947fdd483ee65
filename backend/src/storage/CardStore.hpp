#pragma once
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "../core/Card.hpp"
#include "../core/Date.hpp"
#include "../core/Errors.hpp"

// Fields a review may change. Question, answer, id and created_at are immutable.
struct CardPatch {
    std::optional<int> interval;
    std::optional<double> ease_factor;
    std::optional<std::time_t> last_review;
    std::optional<Date> next_review;

    bool empty() const {
        return !interval && !ease_factor && !last_review && !next_review;
    }
};

// Keyed card storage consumed by the review engine.
class CardStore {
public:
    using Listener = std::function<void(const std::vector<Card>&)>;
    using SubscriptionId = int;

    virtual ~CardStore() = default;

    // Returns the new id. Throws InvalidInput on blank question/answer.
    virtual std::string create(const std::string& question, const std::string& answer) = 0;
    virtual std::vector<Card> readAll() const = 0;
    // Throws InvalidInput if the patch would break interval >= 0 / ease >= 1.3
    virtual StoreStatus update(const std::string& id, const CardPatch& patch) = 0;
    virtual StoreStatus remove(const std::string& id) = 0;

    // Listeners get the full snapshot after every successful mutation.
    // An exception from a listener is logged and does not change the result.
    virtual SubscriptionId subscribe(Listener onChange) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;

    static void validatePatch(const CardPatch& patch) {
        if (patch.interval && *patch.interval < 0)
            throw InvalidInput("interval must be >= 0");
        if (patch.ease_factor && !(*patch.ease_factor >= Card::MIN_EASE))
            throw InvalidInput("ease factor must be >= 1.3");
    }
};
