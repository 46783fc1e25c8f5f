#include <gtest/gtest.h>
#include "chunkswarm/tracker/tracker.hpp"
#include "test_helpers.hpp"
#include <set>

using namespace chunkswarm;
using namespace chunkswarm::tracker;
using chunkswarm::core::ChunkBitmap;
using chunkswarm::core::DeviceKey;
using chunkswarm::core::ErrorCode;

namespace {

class RecordingNotifier : public TrackerNotifier, public PresenceOracle {
public:
    void notify(const DeviceKey& target, const TrackerNotification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent.emplace_back(target, notification);
    }

    bool is_online(const DeviceKey& device) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return offline.count(device) == 0;
    }

    template<typename T>
    size_t count_for(const DeviceKey& target) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [device, notification] : sent) {
            if (device == target && std::holds_alternative<T>(notification)) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::pair<DeviceKey, TrackerNotification>> sent;
    std::set<DeviceKey> offline;

private:
    mutable std::mutex mutex_;
};

}

class TrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker_ = std::make_unique<Tracker>(TrackerSettings{}, clock_);
        tracker_->set_notifier(&notifier_);
        tracker_->set_presence(&notifier_);
    }

    Announcement announcement(const DeviceKey& device, std::vector<core::UserId> scope = {"bob", "carol"},
                              std::optional<ChunkBitmap> bitmap = std::nullopt) {
        Announcement a;
        a.file_id = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
        a.device = device;
        a.metadata = {10 * 1024, "checksum-hex", 10};
        a.bitmap = bitmap ? *bitmap : ChunkBitmap::full(10);
        a.share_scope = std::move(scope);
        return a;
    }

    const core::FileId file_id_ = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
    const DeviceKey alice_{"alice", "laptop"};
    const DeviceKey bob_{"bob", "desktop"};
    const DeviceKey carol_{"carol", "phone"};
    const DeviceKey mallory_{"mallory", "pc"};

    test::ManualClock clock_;
    RecordingNotifier notifier_;
    std::unique_ptr<Tracker> tracker_;
};

TEST_F(TrackerTest, FirstAnnounceCreatesRecordOwnedByAnnouncer) {
    FileRecordSummary summary;
    auto result = tracker_->announce(announcement(alice_), summary);

    ASSERT_TRUE(result) << result.describe();
    EXPECT_EQ(summary.uploader_id, "alice");
    EXPECT_EQ(summary.seeder_count, 1u);
    EXPECT_EQ(summary.complete_seeder_count, 1u);

    auto record = tracker_->snapshot(file_id_);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->expires_at, clock_.now() + std::chrono::hours(24 * 30));
    EXPECT_TRUE(record->share_scope.contains("bob"));
}

TEST_F(TrackerTest, AnnounceRejectsMismatchedBitmapLength) {
    FileRecordSummary summary;
    auto result = tracker_->announce(announcement(alice_, {}, ChunkBitmap::full(9)), summary);
    EXPECT_EQ(result.error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(tracker_->snapshot(file_id_).has_value());
}

TEST_F(TrackerTest, AnnounceWithDifferentMetadataConflicts) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));

    auto other = announcement(bob_);
    other.metadata.checksum = "different";
    EXPECT_EQ(tracker_->announce(other, summary).error, ErrorCode::CONFLICT);
}

TEST_F(TrackerTest, OutOfScopeDeviceIsUnauthorized) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));

    EXPECT_EQ(tracker_->announce(announcement(mallory_), summary).error, ErrorCode::UNAUTHORIZED);

    std::vector<SeederAvailability> seeders;
    EXPECT_EQ(tracker_->get_available_chunks(file_id_, mallory_, seeders).error, ErrorCode::UNAUTHORIZED);
    EXPECT_TRUE(seeders.empty());
}

TEST_F(TrackerTest, OnlyUploaderScopeIsMerged) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_, {"bob"}), summary));
    ASSERT_TRUE(tracker_->announce(announcement(bob_, {"mallory"}), summary));

    auto record = tracker_->snapshot(file_id_);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->share_scope.contains("mallory"));

    ASSERT_TRUE(tracker_->announce(announcement(DeviceKey{"alice", "phone"}, {"carol"}), summary));
    record = tracker_->snapshot(file_id_);
    EXPECT_TRUE(record->share_scope.contains("carol"));
    EXPECT_TRUE(record->share_scope.contains("bob"));
}

TEST_F(TrackerTest, TtlRefreshesOnlyNearExpiry) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    auto original_expiry = tracker_->snapshot(file_id_)->expires_at;

    // 20 days in, 10 days remain: no refresh.
    clock_.advance(std::chrono::hours(24 * 20));
    ASSERT_TRUE(tracker_->reannounce(file_id_, alice_, ChunkBitmap::full(10), true, summary));
    EXPECT_EQ(tracker_->snapshot(file_id_)->expires_at, original_expiry);

    // 28 days in, 2 days remain: refreshed to a full 30 days from now.
    clock_.advance(std::chrono::hours(24 * 8));
    ASSERT_TRUE(tracker_->reannounce(file_id_, alice_, ChunkBitmap::full(10), true, summary));
    EXPECT_EQ(tracker_->snapshot(file_id_)->expires_at, clock_.now() + std::chrono::hours(24 * 30));
}

TEST_F(TrackerTest, ReannounceOfUnknownFileIsNotFound) {
    FileRecordSummary summary;
    auto result = tracker_->reannounce("ffffffffffffffffffffffffffffffff", alice_, ChunkBitmap::full(10), true, summary);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
}

TEST_F(TrackerTest, ReannounceCompleteWithPartialBitmapIsRejected) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));

    ChunkBitmap partial(10);
    partial.set(0);
    EXPECT_EQ(tracker_->reannounce(file_id_, bob_, partial, true, summary).error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(tracker_->reannounce(file_id_, bob_, partial, false, summary));
}

TEST_F(TrackerTest, CheckExistsSeparatesDeletedAndUnknownFiles) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    auto report = tracker_->check_exists({file_id_, "00000000000000000000000000000000"});
    EXPECT_EQ(report.exists, std::vector<core::FileId>{file_id_});
    EXPECT_EQ(report.missing.size(), 1u);

    ASSERT_TRUE(tracker_->delete_share(file_id_, alice_));
    report = tracker_->check_exists({file_id_});
    EXPECT_TRUE(report.exists.empty());
    EXPECT_EQ(report.missing, std::vector<core::FileId>{file_id_});
}

TEST_F(TrackerTest, AvailableChunksExcludesRequesterAndFlagsUnreachable) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));

    ChunkBitmap partial(10);
    partial.set(3);
    ASSERT_TRUE(tracker_->reannounce(file_id_, bob_, partial, false, summary));
    notifier_.offline.insert(alice_);

    std::vector<SeederAvailability> seeders;
    ASSERT_TRUE(tracker_->get_available_chunks(file_id_, bob_, seeders));
    ASSERT_EQ(seeders.size(), 1u);
    EXPECT_EQ(seeders[0].device, alice_);
    EXPECT_FALSE(seeders[0].reachable);
    EXPECT_TRUE(seeders[0].download_complete);

    ASSERT_TRUE(tracker_->get_available_chunks(file_id_, carol_, seeders));
    EXPECT_EQ(seeders.size(), 2u);
}

TEST_F(TrackerTest, NonUploaderDeleteNeverMutates) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->reannounce(file_id_, bob_, ChunkBitmap::full(10), true, summary));

    auto before = tracker_->snapshot(file_id_);
    EXPECT_EQ(tracker_->delete_share(file_id_, bob_).error, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(tracker_->delete_share(file_id_, mallory_).error, ErrorCode::UNAUTHORIZED);

    auto after = tracker_->snapshot(file_id_);
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after->deleted);
    EXPECT_EQ(after->seeders.size(), before->seeders.size());
    EXPECT_TRUE(notifier_.sent.empty());
}

TEST_F(TrackerTest, UploaderDeleteNotifiesHoldersAndStopsDiscovery) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->reannounce(file_id_, bob_, ChunkBitmap::full(10), true, summary));
    ASSERT_TRUE(tracker_->register_leecher(file_id_, carol_, ChunkBitmap::full(10)));

    ASSERT_TRUE(tracker_->delete_share(file_id_, DeviceKey{"alice", "phone"}));

    EXPECT_EQ(notifier_.count_for<ShareDeleted>(alice_), 1u);
    EXPECT_EQ(notifier_.count_for<ShareDeleted>(bob_), 1u);
    EXPECT_EQ(notifier_.count_for<ShareDeleted>(carol_), 1u);

    std::vector<SeederAvailability> seeders;
    EXPECT_EQ(tracker_->get_available_chunks(file_id_, carol_, seeders).error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(tracker_->announce(announcement(bob_), summary).error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(tracker_->delete_share(file_id_, alice_).error, ErrorCode::NOT_FOUND);

    // Dropped after the grace window.
    clock_.advance(std::chrono::seconds(301));
    auto report = tracker_->sweep();
    EXPECT_EQ(report.deleted_records_removed, 1u);
    EXPECT_FALSE(tracker_->snapshot(file_id_).has_value());
}

TEST_F(TrackerTest, UploaderReannounceWakesLeechers) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->register_leecher(file_id_, bob_, ChunkBitmap::full(10)));

    ASSERT_TRUE(tracker_->reannounce(file_id_, alice_, ChunkBitmap::full(10), true, summary));
    EXPECT_EQ(notifier_.count_for<UploaderOnline>(bob_), 1u);

    // A non-uploader reannounce does not.
    ASSERT_TRUE(tracker_->reannounce(file_id_, carol_, ChunkBitmap::full(10), true, summary));
    EXPECT_EQ(notifier_.count_for<UploaderOnline>(bob_), 1u);
}

TEST_F(TrackerTest, DisconnectRemovesDeviceEverywhere) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->reannounce(file_id_, bob_, ChunkBitmap::full(10), true, summary));

    EXPECT_EQ(tracker_->disconnect(bob_), 1u);
    auto record = tracker_->snapshot(file_id_);
    EXPECT_EQ(record->seeders.count(bob_), 0u);
    EXPECT_EQ(record->seeders.count(alice_), 1u);
}

TEST_F(TrackerTest, SweepAt31DaysKeepsCompleteAndRemovesPartialSeeder) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));

    ChunkBitmap partial(10);
    for (std::uint32_t i = 0; i < 4; ++i) {
        partial.set(i);
    }
    ASSERT_TRUE(tracker_->reannounce(file_id_, bob_, partial, false, summary));

    clock_.advance(std::chrono::hours(24 * 31));
    auto report = tracker_->sweep();

    EXPECT_EQ(report.seeders_removed, 1u);
    EXPECT_EQ(report.expired_records_removed, 0u);
    auto record = tracker_->snapshot(file_id_);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->seeders.count(alice_), 1u);
    EXPECT_EQ(record->seeders.count(bob_), 0u);
    EXPECT_EQ(notifier_.count_for<SeederRemoved>(bob_), 1u);
    EXPECT_EQ(notifier_.count_for<SeederRemoved>(alice_), 0u);

    std::vector<SeederAvailability> seeders;
    ASSERT_TRUE(tracker_->get_available_chunks(file_id_, carol_, seeders));
    ASSERT_EQ(seeders.size(), 1u);
    EXPECT_EQ(seeders[0].device, alice_);
    EXPECT_TRUE(seeders[0].download_complete);
}

TEST_F(TrackerTest, RecordWithoutSeedersExpiresAndNotifiesLeechers) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->unannounce(file_id_, alice_));
    ASSERT_TRUE(tracker_->register_leecher(file_id_, bob_, ChunkBitmap::full(10)));

    clock_.advance(std::chrono::hours(24 * 29));
    EXPECT_EQ(tracker_->sweep().expired_records_removed, 0u);

    // Keep the leecher fresh so only the record expires.
    ASSERT_TRUE(tracker_->register_leecher(file_id_, bob_, ChunkBitmap::full(10)));
    clock_.advance(std::chrono::hours(24 * 2));
    auto report = tracker_->sweep();
    EXPECT_EQ(report.expired_records_removed, 1u);
    EXPECT_FALSE(tracker_->snapshot(file_id_).has_value());
    EXPECT_EQ(notifier_.count_for<ShareDeleted>(bob_), 1u);
}

TEST_F(TrackerTest, UploaderRevokesUserAndCutsTheirDevices) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->reannounce(file_id_, bob_, ChunkBitmap::full(10), true, summary));
    ASSERT_TRUE(tracker_->register_leecher(file_id_, carol_, ChunkBitmap::full(10)));

    std::vector<core::UserId> scope;
    ASSERT_TRUE(tracker_->update_share_scope(file_id_, alice_, {"dave"}, {"bob"}, scope));
    EXPECT_EQ(scope, (std::vector<core::UserId>{"carol", "dave"}));

    auto record = tracker_->snapshot(file_id_);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->can_access("bob"));
    EXPECT_EQ(record->seeders.count(bob_), 0u);
    EXPECT_EQ(record->leechers.count(carol_), 1u);
    EXPECT_EQ(notifier_.count_for<ShareDeleted>(bob_), 1u);
    EXPECT_EQ(notifier_.count_for<ShareScopeChanged>(alice_), 1u);

    std::vector<SeederAvailability> seeders;
    EXPECT_EQ(tracker_->get_available_chunks(file_id_, bob_, seeders).error, ErrorCode::UNAUTHORIZED);
}

TEST_F(TrackerTest, NonUploaderMayOnlyRemoveThemselves) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    std::vector<core::UserId> scope;

    EXPECT_EQ(tracker_->update_share_scope(file_id_, bob_, {}, {"carol"}, scope).error, ErrorCode::UNAUTHORIZED);
    EXPECT_TRUE(tracker_->snapshot(file_id_)->share_scope.contains("carol"));
    EXPECT_EQ(tracker_->update_share_scope(file_id_, bob_, {}, {"alice"}, scope).error,
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(tracker_->update_share_scope(file_id_, mallory_, {"mallory"}, {}, scope).error,
              ErrorCode::UNAUTHORIZED);

    // In-scope users may widen the scope and may leave it.
    ASSERT_TRUE(tracker_->update_share_scope(file_id_, bob_, {"erin"}, {}, scope));
    EXPECT_EQ(scope, (std::vector<core::UserId>{"bob", "carol", "erin"}));
    ASSERT_TRUE(tracker_->update_share_scope(file_id_, bob_, {}, {"bob"}, scope));
    EXPECT_EQ(scope, (std::vector<core::UserId>{"carol", "erin"}));
    EXPECT_FALSE(tracker_->snapshot(file_id_)->can_access("bob"));
}

TEST_F(TrackerTest, ShareScopeIsCappedAtLimit) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_, {}), summary));

    std::vector<core::UserId> many;
    for (size_t i = 0; i < MAX_SHARE_SCOPE; ++i) {
        many.push_back("user" + std::to_string(i));
    }
    std::vector<core::UserId> scope;
    ASSERT_TRUE(tracker_->update_share_scope(file_id_, alice_, many, {}, scope));
    EXPECT_EQ(scope.size(), MAX_SHARE_SCOPE);

    EXPECT_EQ(tracker_->update_share_scope(file_id_, alice_, {"one-too-many"}, {}, scope).error,
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(tracker_->snapshot(file_id_)->share_scope.size(), MAX_SHARE_SCOPE);

    // Swapping one user for another stays within the limit.
    ASSERT_TRUE(tracker_->update_share_scope(file_id_, alice_, {"one-too-many"}, {"user0"}, scope));
    EXPECT_EQ(scope.size(), MAX_SHARE_SCOPE);
}

TEST_F(TrackerTest, EmptyScopeUpdateReadsScopeOfLiveFilesOnly) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));

    std::vector<core::UserId> scope;
    ASSERT_TRUE(tracker_->update_share_scope(file_id_, carol_, {}, {}, scope));
    EXPECT_EQ(scope, (std::vector<core::UserId>{"bob", "carol"}));
    EXPECT_EQ(notifier_.count_for<ShareScopeChanged>(alice_), 0u);

    ASSERT_TRUE(tracker_->delete_share(file_id_, alice_));
    EXPECT_EQ(tracker_->update_share_scope(file_id_, alice_, {"dave"}, {}, scope).error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(tracker_->update_share_scope("ffffffffffffffffffffffffffffffff", alice_, {}, {}, scope).error,
              ErrorCode::NOT_FOUND);
}

TEST_F(TrackerTest, StatsCountLiveRecords) {
    FileRecordSummary summary;
    ASSERT_TRUE(tracker_->announce(announcement(alice_), summary));
    ASSERT_TRUE(tracker_->register_leecher(file_id_, bob_, ChunkBitmap::full(10)));

    auto stats = tracker_->stats();
    EXPECT_EQ(stats.files, 1u);
    EXPECT_EQ(stats.seeders, 1u);
    EXPECT_EQ(stats.leechers, 1u);
}
