#pragma once
#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include "../src/storage/CardStore.hpp"

// In-memory store with switchable failures for driving ReviewSession.
class FakeCardStore : public CardStore {
public:
    StoreStatus next_status = StoreStatus::OK;
    int update_calls = 0;
    std::vector<CardPatch> patches;

    void put(const Card& card) { cards.push_back(card); }

    std::string create(const std::string& question, const std::string& answer) override {
        Card c = Card::create(question, answer, 0);
        c.id = "card-" + std::to_string(cards.size() + 1);
        cards.push_back(c);
        notify();
        return c.id;
    }

    std::vector<Card> readAll() const override { return cards; }

    StoreStatus update(const std::string& id, const CardPatch& patch) override {
        validatePatch(patch);
        ++update_calls;
        patches.push_back(patch);
        if (next_status != StoreStatus::OK) return next_status;

        Card* c = find(id);
        if (!c) return StoreStatus::NOT_FOUND;
        if (patch.interval) c->interval = *patch.interval;
        if (patch.ease_factor) c->ease_factor = *patch.ease_factor;
        if (patch.last_review) c->last_review = *patch.last_review;
        if (patch.next_review) c->next_review = *patch.next_review;
        notify();
        return StoreStatus::OK;
    }

    StoreStatus remove(const std::string& id) override {
        auto it = std::find_if(cards.begin(), cards.end(), [&](const Card& c) { return c.id == id; });
        if (it == cards.end()) return StoreStatus::NOT_FOUND;
        cards.erase(it);
        notify();
        return StoreStatus::OK;
    }

    SubscriptionId subscribe(Listener onChange) override {
        listeners[++last_id] = std::move(onChange);
        return last_id;
    }

    void unsubscribe(SubscriptionId id) override { listeners.erase(id); }

    Card* find(const std::string& id) {
        for (auto& c : cards)
            if (c.id == id) return &c;
        return nullptr;
    }

private:
    std::vector<Card> cards;
    std::map<SubscriptionId, Listener> listeners;
    SubscriptionId last_id = 0;

    void notify() {
        for (auto& l : listeners) l.second(cards);
    }
};

inline Card makeCard(const std::string& id, const Date& due, int interval = 0, double ease = Card::INITIAL_EASE) {
    Card c;
    c.id = id;
    c.question = "Q " + id;
    c.answer = "A " + id;
    c.interval = interval;
    c.ease_factor = ease;
    c.next_review = due;
    return c;
}
