#include <gtest/gtest.h>
#include "FakeCardStore.hpp"
#include "../src/core/DueQueue.hpp"
#include "../src/core/ReviewSession.hpp"

namespace {

// 2026-10-19 08:30:00 UTC
const std::time_t NOW = 1792368000 + 8 * 3600 + 30 * 60;
const Date TODAY = Date::fromUnixTime(NOW);

class ReviewSessionTest : public ::testing::Test {
protected:
    FakeCardStore store;
    ReviewSession session{ store, [] { return NOW; } };

    void SetUp() override {
        store.put(makeCard("a", TODAY.addDays(-2)));
        store.put(makeCard("b", TODAY, 6, 2.0));
        store.put(makeCard("later", TODAY.addDays(5)));
    }

    void startDue() { session.start(buildDueQueue(store.readAll(), TODAY)); }
};

TEST_F(ReviewSessionTest, EmptyQueueCompletesImmediately) {
    session.start({});
    EXPECT_EQ(session.phase(), ReviewSession::Phase::COMPLETE);
    EXPECT_THROW(session.currentCard(), InvalidTransition);
}

TEST_F(ReviewSessionTest, WalksQueueAndPersistsEachRating) {
    startDue();
    ASSERT_EQ(session.phase(), ReviewSession::Phase::PRESENTING);
    ASSERT_EQ(session.size(), 2u);
    EXPECT_EQ(session.currentCard().id, "a");

    session.revealAnswer();
    EXPECT_EQ(session.phase(), ReviewSession::Phase::AWAITING_RATING);
    EXPECT_EQ(session.submitRating(ReviewQuality::GOOD), StoreStatus::OK);

    EXPECT_EQ(session.phase(), ReviewSession::Phase::PRESENTING);
    EXPECT_EQ(session.position(), 1u);
    EXPECT_EQ(session.currentCard().id, "b");

    const Card* a = store.find("a");
    EXPECT_EQ(a->interval, 1);
    EXPECT_DOUBLE_EQ(a->ease_factor, 2.5);
    EXPECT_EQ(a->next_review, TODAY.addDays(1));
    ASSERT_TRUE(a->last_review);
    EXPECT_EQ(*a->last_review, NOW);

    session.revealAnswer();
    EXPECT_EQ(session.submitRating(ReviewQuality::EASY), StoreStatus::OK);
    EXPECT_EQ(session.phase(), ReviewSession::Phase::COMPLETE);

    const Card* b = store.find("b");
    EXPECT_EQ(b->interval, 13);
    EXPECT_DOUBLE_EQ(b->ease_factor, 2.1);
    EXPECT_EQ(session.reviewedCount(), 2);
    EXPECT_EQ(session.lapseCount(), 0);
    EXPECT_EQ(store.update_calls, 2);
}

TEST_F(ReviewSessionTest, PatchCarriesAllReviewFields) {
    startDue();
    session.revealAnswer();
    ASSERT_EQ(session.submitRating(ReviewQuality::AGAIN), StoreStatus::OK);

    ASSERT_EQ(store.patches.size(), 1u);
    const CardPatch& p = store.patches[0];
    EXPECT_EQ(p.interval.value(), 0);
    EXPECT_DOUBLE_EQ(p.ease_factor.value(), 2.3);
    EXPECT_EQ(p.next_review.value(), TODAY);
    EXPECT_EQ(p.last_review.value(), NOW);
    EXPECT_EQ(session.lapseCount(), 1);
}

TEST_F(ReviewSessionTest, PersistenceFailureKeepsPositionAndAllowsRetry) {
    startDue();
    session.revealAnswer();

    store.next_status = StoreStatus::PERSISTENCE_ERROR;
    EXPECT_EQ(session.submitRating(4), StoreStatus::PERSISTENCE_ERROR);
    EXPECT_EQ(session.phase(), ReviewSession::Phase::AWAITING_RATING);
    EXPECT_EQ(session.position(), 0u);
    EXPECT_EQ(store.find("a")->interval, 0);
    EXPECT_FALSE(session.lastOutcome());

    store.next_status = StoreStatus::OK;
    EXPECT_EQ(session.submitRating(4), StoreStatus::OK);
    EXPECT_EQ(session.position(), 1u);
    EXPECT_EQ(store.find("a")->interval, 1);
    EXPECT_EQ(session.reviewedCount(), 1);
}

TEST_F(ReviewSessionTest, DeletedCardReportsNotFoundWithoutAdvancing) {
    startDue();
    session.revealAnswer();
    ASSERT_EQ(store.remove("a"), StoreStatus::OK);

    EXPECT_EQ(session.submitRating(5), StoreStatus::NOT_FOUND);
    EXPECT_EQ(session.phase(), ReviewSession::Phase::AWAITING_RATING);
    EXPECT_EQ(session.currentCard().id, "a");
}

TEST_F(ReviewSessionTest, InvalidQualityNeverReachesStore) {
    startDue();
    session.revealAnswer();
    EXPECT_THROW(session.submitRating(7), InvalidQuality);
    EXPECT_EQ(store.update_calls, 0);
    EXPECT_EQ(session.phase(), ReviewSession::Phase::AWAITING_RATING);
}

TEST_F(ReviewSessionTest, OperationsOutOfOrderAreRejected) {
    EXPECT_THROW(session.revealAnswer(), InvalidTransition);
    EXPECT_THROW(session.submitRating(4), InvalidTransition);

    startDue();
    EXPECT_THROW(session.submitRating(4), InvalidTransition);
    EXPECT_THROW(session.start({}), InvalidTransition);
    EXPECT_EQ(session.phase(), ReviewSession::Phase::PRESENTING);

    session.revealAnswer();
    EXPECT_THROW(session.revealAnswer(), InvalidTransition);
    EXPECT_EQ(store.update_calls, 0);
}

TEST_F(ReviewSessionTest, AbortReturnsToIdleFromAnyPhase) {
    startDue();
    session.revealAnswer();
    ASSERT_EQ(session.submitRating(4), StoreStatus::OK);

    session.abort();
    EXPECT_EQ(session.phase(), ReviewSession::Phase::IDLE);
    EXPECT_EQ(session.size(), 0u);
    // The persisted rating stays
    EXPECT_EQ(store.find("a")->interval, 1);

    session.start({});
    session.abort();
    EXPECT_EQ(session.phase(), ReviewSession::Phase::IDLE);
    session.abort();
    EXPECT_EQ(session.phase(), ReviewSession::Phase::IDLE);
}

TEST_F(ReviewSessionTest, QueueIsFrozenAtStart) {
    startDue();
    store.put(makeCard("new", TODAY.addDays(-10)));
    ASSERT_EQ(store.remove("b"), StoreStatus::OK);

    EXPECT_EQ(session.size(), 2u);
    session.revealAnswer();
    ASSERT_EQ(session.submitRating(4), StoreStatus::OK);
    EXPECT_EQ(session.currentCard().id, "b");

    // Next pass sees the changes
    ReviewSession next(store, [] { return NOW; });
    next.start(buildDueQueue(store.readAll(), TODAY));
    EXPECT_EQ(next.size(), 1u);
    EXPECT_EQ(next.currentCard().id, "new");
}

TEST_F(ReviewSessionTest, LapsedCardIsDueAgainSameDay) {
    startDue();
    session.revealAnswer();
    ASSERT_EQ(session.submitRating(ReviewQuality::AGAIN), StoreStatus::OK);

    auto again = buildDueQueue(store.readAll(), TODAY);
    ASSERT_FALSE(again.empty());
    EXPECT_EQ(again.front().id, "a");
}

} // namespace
