#include "DueQueue.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::vector<Card> buildDueQueue(const std::vector<Card>& cards, const Date& asOf) {
    std::vector<Card> due;
    due.reserve(cards.size() / 4 + 8);

    for (const auto& card : cards) {
        if (card.isDue(asOf)) {
            due.push_back(card);
        }
    }

    // Oldest due first; id breaks ties
    std::stable_sort(due.begin(), due.end(),
        [](const Card& a, const Card& b) {
            if (a.next_review != b.next_review) return a.next_review < b.next_review;
            return a.id < b.id;
        });

    spdlog::debug("buildDueQueue: {} of {} cards due as of {}", due.size(), cards.size(), asOf.toIsoString());
    return due;
}
