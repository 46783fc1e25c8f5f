#include <gtest/gtest.h>
#include "chunkswarm/transfer/chunk_scheduler.hpp"
#include <map>

using namespace chunkswarm;
using chunkswarm::core::ChunkBitmap;
using chunkswarm::core::DeviceKey;
using chunkswarm::transfer::ChunkAssignment;
using chunkswarm::transfer::ChunkScheduler;
using chunkswarm::transfer::ReleaseReason;

class ChunkSchedulerTest : public ::testing::Test {
protected:
    core::TimePoint now_ = core::from_unix_ms(1700000000000);
    const DeviceKey bob_{"bob", "desktop"};
    const DeviceKey carol_{"carol", "phone"};
};

TEST_F(ChunkSchedulerTest, NoAssignmentsUntilPeerIsReady) {
    ChunkScheduler scheduler(4, ChunkBitmap(4));
    scheduler.update_peer(bob_, ChunkBitmap::full(4), 2);

    EXPECT_TRUE(scheduler.next_assignments(now_).empty());

    scheduler.set_ready(bob_, true);
    EXPECT_EQ(scheduler.next_assignments(now_).size(), 2u);
}

TEST_F(ChunkSchedulerTest, RespectsPerPeerCapacity) {
    ChunkScheduler scheduler(10, ChunkBitmap(10));
    scheduler.update_peer(bob_, ChunkBitmap::full(10), 3);
    scheduler.update_peer(carol_, ChunkBitmap::full(10), 2);
    scheduler.set_ready(bob_, true);
    scheduler.set_ready(carol_, true);

    auto assignments = scheduler.next_assignments(now_);
    EXPECT_EQ(assignments.size(), 5u);
    EXPECT_EQ(scheduler.in_flight_for(bob_), 3u);
    EXPECT_EQ(scheduler.in_flight_for(carol_), 2u);

    // Full until something comes back.
    EXPECT_TRUE(scheduler.next_assignments(now_).empty());

    scheduler.mark_completed(assignments.front().chunk_index);
    EXPECT_EQ(scheduler.next_assignments(now_).size(), 1u);
}

TEST_F(ChunkSchedulerTest, EachIndexHasOneOwner) {
    ChunkScheduler scheduler(6, ChunkBitmap(6));
    scheduler.update_peer(bob_, ChunkBitmap::full(6), 5);
    scheduler.update_peer(carol_, ChunkBitmap::full(6), 5);
    scheduler.set_ready(bob_, true);
    scheduler.set_ready(carol_, true);

    std::map<std::uint32_t, int> seen;
    for (const auto& assignment : scheduler.next_assignments(now_)) {
        ++seen[assignment.chunk_index];
        EXPECT_EQ(scheduler.owner(assignment.chunk_index), assignment.peer);
    }
    EXPECT_EQ(seen.size(), 6u);
    for (const auto& [index, count] : seen) {
        EXPECT_EQ(count, 1) << "chunk " << index;
    }
}

TEST_F(ChunkSchedulerTest, OnlyAsksPeersThatHoldTheChunk) {
    ChunkScheduler scheduler(4, ChunkBitmap(4));
    scheduler.update_peer(bob_, ChunkBitmap::from_indices(4, {0, 1}), 5);
    scheduler.update_peer(carol_, ChunkBitmap::from_indices(4, {2}), 5);
    scheduler.set_ready(bob_, true);
    scheduler.set_ready(carol_, true);

    auto assignments = scheduler.next_assignments(now_);
    ASSERT_EQ(assignments.size(), 3u);
    for (const auto& assignment : assignments) {
        if (assignment.chunk_index == 2) {
            EXPECT_EQ(assignment.peer, carol_);
        } else {
            EXPECT_EQ(assignment.peer, bob_);
        }
    }
    EXPECT_EQ(scheduler.unservable(), std::vector<std::uint32_t>{3});
}

TEST_F(ChunkSchedulerTest, SkipsChunksAlreadyCompleted) {
    ChunkScheduler scheduler(4, ChunkBitmap::from_indices(4, {0, 2}));
    scheduler.update_peer(bob_, ChunkBitmap::full(4), 5);
    scheduler.set_ready(bob_, true);

    auto assignments = scheduler.next_assignments(now_);
    ASSERT_EQ(assignments.size(), 2u);
    EXPECT_EQ(assignments[0].chunk_index, 1u);
    EXPECT_EQ(assignments[1].chunk_index, 3u);
}

TEST_F(ChunkSchedulerTest, RefusedPeerIsNeverAskedAgain) {
    ChunkScheduler scheduler(1, ChunkBitmap(1));
    scheduler.update_peer(bob_, ChunkBitmap::full(1), 1);
    scheduler.set_ready(bob_, true);

    auto first = scheduler.next_assignments(now_);
    ASSERT_EQ(first.size(), 1u);
    scheduler.release(0, bob_, ReleaseReason::REFUSED);

    EXPECT_TRUE(scheduler.next_assignments(now_).empty());
    EXPECT_FALSE(scheduler.has_usable_peer());
    EXPECT_EQ(scheduler.unservable(), std::vector<std::uint32_t>{0});

    scheduler.update_peer(carol_, ChunkBitmap::full(1), 1);
    scheduler.set_ready(carol_, true);
    auto second = scheduler.next_assignments(now_);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].peer, carol_);
}

TEST_F(ChunkSchedulerTest, RetryPrefersAnotherPeerButFallsBack) {
    ChunkScheduler scheduler(1, ChunkBitmap(1));
    scheduler.update_peer(bob_, ChunkBitmap::full(1), 1);
    scheduler.set_ready(bob_, true);

    ASSERT_EQ(scheduler.next_assignments(now_).size(), 1u);
    scheduler.release(0, bob_, ReleaseReason::RETRY);

    // Bob is the only holder, so he gets it again.
    auto again = scheduler.next_assignments(now_);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].peer, bob_);

    scheduler.release(0, bob_, ReleaseReason::RETRY);
    scheduler.update_peer(carol_, ChunkBitmap::full(1), 1);
    scheduler.set_ready(carol_, true);
    auto moved = scheduler.next_assignments(now_);
    ASSERT_EQ(moved.size(), 1u);
    EXPECT_EQ(moved[0].peer, carol_);
}

TEST_F(ChunkSchedulerTest, ReleaseByNonOwnerKeepsOwnership) {
    ChunkScheduler scheduler(1, ChunkBitmap(1));
    scheduler.update_peer(bob_, ChunkBitmap::full(1), 1);
    scheduler.set_ready(bob_, true);
    ASSERT_EQ(scheduler.next_assignments(now_).size(), 1u);

    scheduler.release(0, carol_, ReleaseReason::RETRY);
    EXPECT_EQ(scheduler.owner(0), bob_);
    EXPECT_EQ(scheduler.in_flight_count(), 1u);
}

TEST_F(ChunkSchedulerTest, ExpireReleasesStaleRequests) {
    ChunkScheduler scheduler(3, ChunkBitmap(3));
    scheduler.update_peer(bob_, ChunkBitmap::full(3), 1);
    scheduler.set_ready(bob_, true);

    ASSERT_EQ(scheduler.next_assignments(now_).size(), 1u);
    EXPECT_TRUE(scheduler.expire(now_ + std::chrono::seconds(5), std::chrono::seconds(10)).empty());

    auto expired = scheduler.expire(now_ + std::chrono::seconds(11), std::chrono::seconds(10));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0].peer, bob_);
    EXPECT_EQ(scheduler.in_flight_count(), 0u);
    EXPECT_EQ(scheduler.in_flight_for(bob_), 0u);
}

TEST_F(ChunkSchedulerTest, ExpiredRequestHoldsCapacityUntilAnswered) {
    ChunkScheduler scheduler(4, ChunkBitmap(4));
    scheduler.update_peer(bob_, ChunkBitmap::full(4), 1);
    scheduler.set_ready(bob_, true);

    auto first = scheduler.next_assignments(now_);
    ASSERT_EQ(first.size(), 1u);
    auto later = now_ + std::chrono::seconds(11);
    ASSERT_EQ(scheduler.expire(later, std::chrono::seconds(10)).size(), 1u);

    // Bob may still be sending it, so he gets nothing new.
    EXPECT_EQ(scheduler.in_flight_for(bob_), 0u);
    EXPECT_EQ(scheduler.load_on(bob_), 1u);
    EXPECT_TRUE(scheduler.next_assignments(later).empty());

    // Another peer can pick the index up meanwhile.
    scheduler.update_peer(carol_, ChunkBitmap::full(4), 1);
    scheduler.set_ready(carol_, true);
    auto handed_over = scheduler.next_assignments(later);
    ASSERT_EQ(handed_over.size(), 1u);
    EXPECT_EQ(handed_over[0].peer, carol_);

    scheduler.response_arrived(bob_, first[0].chunk_index);
    EXPECT_EQ(scheduler.load_on(bob_), 0u);
    auto resumed = scheduler.next_assignments(later);
    ASSERT_EQ(resumed.size(), 1u);
    EXPECT_EQ(resumed[0].peer, bob_);
}

TEST_F(ChunkSchedulerTest, UnansweredExpiredRequestIsForgottenAfterAnotherTimeout) {
    ChunkScheduler scheduler(4, ChunkBitmap(4));
    scheduler.update_peer(bob_, ChunkBitmap::full(4), 1);
    scheduler.set_ready(bob_, true);
    ASSERT_EQ(scheduler.next_assignments(now_).size(), 1u);

    auto later = now_ + std::chrono::seconds(11);
    ASSERT_EQ(scheduler.expire(later, std::chrono::seconds(10)).size(), 1u);
    EXPECT_EQ(scheduler.load_on(bob_), 1u);

    auto much_later = later + std::chrono::seconds(10);
    EXPECT_TRUE(scheduler.expire(much_later, std::chrono::seconds(10)).empty());
    EXPECT_EQ(scheduler.load_on(bob_), 0u);
    EXPECT_EQ(scheduler.next_assignments(much_later).size(), 1u);
}

TEST_F(ChunkSchedulerTest, RemovePeerRequeuesItsChunks) {
    ChunkScheduler scheduler(4, ChunkBitmap(4));
    scheduler.update_peer(bob_, ChunkBitmap::full(4), 2);
    scheduler.set_ready(bob_, true);
    ASSERT_EQ(scheduler.next_assignments(now_).size(), 2u);

    auto requeued = scheduler.remove_peer(bob_);
    EXPECT_EQ(requeued.size(), 2u);
    EXPECT_FALSE(scheduler.has_peer(bob_));
    EXPECT_EQ(scheduler.in_flight_count(), 0u);

    scheduler.update_peer(carol_, ChunkBitmap::full(4), 4);
    scheduler.set_ready(carol_, true);
    EXPECT_EQ(scheduler.next_assignments(now_).size(), 4u);
}

TEST_F(ChunkSchedulerTest, IgnoresBitmapOfWrongLength) {
    ChunkScheduler scheduler(4, ChunkBitmap(4));
    scheduler.update_peer(bob_, ChunkBitmap::full(5), 2);
    EXPECT_FALSE(scheduler.has_peer(bob_));
}

TEST_F(ChunkSchedulerTest, CompletedChunkIsNeverReassigned) {
    ChunkScheduler scheduler(2, ChunkBitmap(2));
    scheduler.update_peer(bob_, ChunkBitmap::full(2), 2);
    scheduler.set_ready(bob_, true);
    ASSERT_EQ(scheduler.next_assignments(now_).size(), 2u);

    scheduler.mark_completed(0);
    scheduler.mark_completed(1);
    EXPECT_TRUE(scheduler.completed().complete());
    EXPECT_TRUE(scheduler.next_assignments(now_).empty());
    EXPECT_FALSE(scheduler.has_usable_peer());
}
