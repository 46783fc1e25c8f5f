#include <gtest/gtest.h>
#include "chunkswarm/transfer/swarm_coordinator.hpp"
#include "chunkswarm/tracker/local_tracker_client.hpp"
#include "test_helpers.hpp"

using namespace chunkswarm;
using namespace chunkswarm::transfer;
using chunkswarm::core::DeviceKey;
using chunkswarm::core::ErrorCode;

namespace {

// One device: its storage, tracker session, peer transport and coordinator.
struct Node {
    test::DeviceStorage storage;
    tracker::LocalTrackerClient tracker;
    test::LoopbackTransport transport;
    SwarmContext context;
    SwarmCoordinator coordinator;

    Node(const std::filesystem::path& base, const DeviceKey& key, crypto::FileKeyProvider& provider,
         tracker::LocalTrackerHub& hub, test::LoopbackNetwork& network, core::Clock& clock)
        : storage(base, key, provider)
        , tracker(hub, key)
        , transport(network, key)
        , context{key, storage.store, storage.chunks, storage.files, storage.resume, tracker, storage.keys,
                  clock, test::fast_settings()}
        , coordinator(context, transport) {}
};

}

class SwarmCoordinatorTest : public ::testing::Test {
protected:
    SwarmCoordinatorTest() : tracker_(tracker::TrackerSettings{}, clock_), hub_(tracker_) {}

    void SetUp() override {
        alice_ = std::make_unique<Node>(dir_.path(), DeviceKey{"alice", "laptop"}, provider_, hub_, network_, clock_);
        bob_ = std::make_unique<Node>(dir_.path(), DeviceKey{"bob", "desktop"}, provider_, hub_, network_, clock_);
        ASSERT_TRUE(alice_->storage.open());
        ASSERT_TRUE(bob_->storage.open());
        alice_->coordinator.start();
        bob_->coordinator.start();

        content_ = test::make_content(8 * 1024 + 333);
        source_ = dir_.path() / "holiday.mov";
        test::write_file(source_, content_);
        key_handle_ = provider_.add(crypto::SecureRandom::generate_file_key());
    }

    void TearDown() override {
        bob_->coordinator.stop();
        alice_->coordinator.stop();
    }

    FileDescriptor share(std::vector<core::UserId> scope = {"bob"}) {
        FileDescriptor descriptor;
        auto result = alice_->coordinator.share_file(source_, scope, key_handle_, descriptor);
        EXPECT_TRUE(result) << result.describe();
        return descriptor;
    }

    std::filesystem::path output() const { return dir_.path() / "downloads" / "holiday.mov"; }

    bool reaped(Node& node) {
        return test::wait_until([&]() { return node.coordinator.tasks().empty(); });
    }

    test::TempDir dir_;
    test::ManualClock clock_;
    tracker::Tracker tracker_;
    tracker::LocalTrackerHub hub_;
    test::InMemoryKeyProvider provider_;
    test::LoopbackNetwork network_;
    std::unique_ptr<Node> alice_;
    std::unique_ptr<Node> bob_;

    std::vector<std::uint8_t> content_;
    std::filesystem::path source_;
    std::string key_handle_;
};

TEST_F(SwarmCoordinatorTest, ShareRecordsAndAnnouncesFile) {
    auto descriptor = share();

    auto record = alice_->storage.files.get(descriptor.file_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->role, storage::FileRole::UPLOADER);
    EXPECT_TRUE(record->download_complete);
    EXPECT_EQ(alice_->storage.store.list_chunks(descriptor.file_id).size(), descriptor.chunk_count);

    auto snapshot = tracker_.snapshot(descriptor.file_id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->uploader_id, "alice");
    EXPECT_TRUE(snapshot->seeders.at(alice_->storage.key).download_complete);
}

TEST_F(SwarmCoordinatorTest, ShareWithUnknownKeyIsUnauthorized) {
    FileDescriptor descriptor;
    auto result = alice_->coordinator.share_file(source_, {"bob"}, "missing-key", descriptor);
    EXPECT_EQ(result.error, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(alice_->storage.files.count(), 0u);
}

TEST_F(SwarmCoordinatorTest, ShareWhileTrackerOfflineLeavesNothingBehind) {
    alice_->tracker.go_offline();
    FileDescriptor descriptor;
    auto result = alice_->coordinator.share_file(source_, {"bob"}, key_handle_, descriptor);
    EXPECT_EQ(result.error, ErrorCode::TIMEOUT);
    EXPECT_EQ(alice_->storage.files.count(), 0u);
    EXPECT_TRUE(alice_->storage.store.list_files().empty());
}

TEST_F(SwarmCoordinatorTest, DownloadsFileFromUploader) {
    auto descriptor = share();

    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    EXPECT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
    EXPECT_EQ(test::read_file(output()), content_);

    ASSERT_TRUE(reaped(*bob_));
    auto progress = bob_->coordinator.progress(descriptor.file_id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->outcome, TaskOutcome::COMPLETE);
    EXPECT_EQ(progress->completed_chunks, descriptor.chunk_count);

    // The finished download keeps its chunks and seeds them.
    EXPECT_EQ(bob_->storage.store.list_chunks(descriptor.file_id).size(), descriptor.chunk_count);
    EXPECT_TRUE(tracker_.snapshot(descriptor.file_id)->seeders.at(bob_->storage.key).download_complete);
    EXPECT_GE(alice_->coordinator.uploads().stats().chunks_served, descriptor.chunk_count);
}

TEST_F(SwarmCoordinatorTest, SecondStartOfSameFileConflicts) {
    auto descriptor = share();
    network_.stall(alice_->storage.key);

    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    EXPECT_EQ(bob_->coordinator.start_download(descriptor, output()).error, ErrorCode::CONFLICT);
}

TEST_F(SwarmCoordinatorTest, PauseThenResumeFinishesDownload) {
    auto descriptor = share();
    alice_->transport.stop_serving_after(3);

    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    ASSERT_TRUE(test::wait_until([&]() {
        auto progress = bob_->coordinator.progress(descriptor.file_id);
        return progress && progress->completed_chunks == 3;
    }));
    ASSERT_TRUE(bob_->coordinator.pause(descriptor.file_id));
    EXPECT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(5)), TaskOutcome::PAUSED);
    ASSERT_TRUE(reaped(*bob_));

    auto saved = bob_->storage.resume.load(descriptor.file_id);
    ASSERT_TRUE(saved.has_value());
    EXPECT_TRUE(saved->paused);
    auto committed = saved->completed.set_indices();
    ASSERT_EQ(committed.size(), 3u);

    alice_->transport.serve_everything();
    ASSERT_TRUE(bob_->coordinator.resume(descriptor.file_id));
    EXPECT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
    EXPECT_EQ(test::read_file(output()), content_);

    // Chunks stored before the pause are never asked for again.
    for (auto index : committed) {
        EXPECT_EQ(alice_->transport.requests_for(index), 1u) << "chunk " << index;
    }
}

TEST_F(SwarmCoordinatorTest, CancelPurgesLocalState) {
    auto descriptor = share();
    network_.stall(alice_->storage.key);

    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    ASSERT_TRUE(bob_->coordinator.cancel(descriptor.file_id));
    ASSERT_TRUE(reaped(*bob_));

    EXPECT_FALSE(bob_->storage.files.contains(descriptor.file_id));
    EXPECT_FALSE(bob_->storage.resume.contains(descriptor.file_id));
    EXPECT_EQ(bob_->coordinator.progress(descriptor.file_id)->outcome, TaskOutcome::CANCELLED);
    EXPECT_EQ(bob_->coordinator.cancel(descriptor.file_id).error, ErrorCode::NOT_FOUND);
}

TEST_F(SwarmCoordinatorTest, WatchdogCutsStalledConnection) {
    auto descriptor = share();
    network_.stall(alice_->storage.key);

    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    ASSERT_TRUE(test::wait_until([&]() {
        return bob_->transport.state(alice_->storage.key) == PeerConnectionState::CONNECTING;
    }));

    EXPECT_EQ(bob_->coordinator.check_connections(clock_.now()), 0u);
    auto later = clock_.now() + bob_->context.settings.connect_timeout;
    EXPECT_EQ(bob_->coordinator.check_connections(later), 1u);

    EXPECT_EQ(bob_->transport.state(alice_->storage.key), PeerConnectionState::CLOSED);
    EXPECT_TRUE(test::wait_until([&]() {
        auto progress = bob_->coordinator.progress(descriptor.file_id);
        return progress && progress->known_peers == 0;
    }));
    EXPECT_TRUE(bob_->coordinator.is_downloading(descriptor.file_id));
}

TEST_F(SwarmCoordinatorTest, DeletedShareIsPurgedEverywhere) {
    auto descriptor = share();
    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    ASSERT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
    ASSERT_TRUE(reaped(*bob_));

    EXPECT_EQ(bob_->coordinator.delete_share(descriptor.file_id).error, ErrorCode::UNAUTHORIZED);
    ASSERT_TRUE(alice_->coordinator.delete_share(descriptor.file_id));

    EXPECT_TRUE(test::wait_until([&]() { return !bob_->storage.files.contains(descriptor.file_id); }));
    EXPECT_TRUE(bob_->storage.store.list_chunks(descriptor.file_id).empty());
    EXPECT_FALSE(alice_->storage.files.contains(descriptor.file_id));
    EXPECT_TRUE(alice_->storage.store.list_chunks(descriptor.file_id).empty());
    // The assembled output belongs to the user and stays.
    EXPECT_TRUE(std::filesystem::exists(output()));
}

TEST_F(SwarmCoordinatorTest, DeletedShareCancelsRunningDownload) {
    auto descriptor = share();
    network_.stall(alice_->storage.key);
    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));

    ASSERT_TRUE(alice_->coordinator.delete_share(descriptor.file_id));
    ASSERT_TRUE(reaped(*bob_));

    EXPECT_FALSE(bob_->storage.files.contains(descriptor.file_id));
    EXPECT_FALSE(bob_->storage.resume.contains(descriptor.file_id));
    EXPECT_EQ(bob_->coordinator.progress(descriptor.file_id)->outcome, TaskOutcome::CANCELLED);
}

TEST_F(SwarmCoordinatorTest, ReconnectPurgesForgottenDownloadsAndAnnouncesOwnShares) {
    auto descriptor = share();
    crypto::EncryptedChunk chunk;
    chunk.ciphertext.assign(100, 0x42);

    const std::string ghost = "0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f0f";
    storage::LocalFileRecord record;
    record.file_id = ghost;
    record.total_size = 100;
    record.chunk_count = 1;
    record.checksum = "00";
    record.uploader_id = "carol";
    ASSERT_TRUE(alice_->storage.files.upsert(record));
    ASSERT_TRUE(alice_->storage.store.put_chunk(ghost, 0, chunk));

    // Shared from this device while the tracker lost its records.
    const std::string own = "1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e1e";
    record.file_id = own;
    record.uploader_id = "alice";
    record.share_scope = {"bob"};
    record.role = storage::FileRole::UPLOADER;
    record.download_complete = true;
    ASSERT_TRUE(alice_->storage.files.upsert(record));
    ASSERT_TRUE(alice_->storage.store.put_chunk(own, 0, chunk));
    ASSERT_FALSE(tracker_.snapshot(own).has_value());

    auto report = alice_->coordinator.on_tracker_reconnected();
    EXPECT_EQ(report.checked, 3u);
    EXPECT_EQ(report.purged, 1u);
    EXPECT_EQ(report.reannounced, 2u);
    EXPECT_FALSE(alice_->storage.files.contains(ghost));
    EXPECT_FALSE(alice_->storage.store.has_chunk(ghost, 0));
    EXPECT_TRUE(alice_->storage.files.contains(descriptor.file_id));

    EXPECT_TRUE(alice_->storage.files.contains(own));
    EXPECT_TRUE(alice_->storage.store.has_chunk(own, 0));
    auto announced = tracker_.snapshot(own);
    ASSERT_TRUE(announced.has_value());
    EXPECT_EQ(announced->uploader_id, "alice");
    EXPECT_TRUE(announced->can_access("bob"));
    EXPECT_TRUE(announced->seeders.at(alice_->storage.key).download_complete);
}

TEST_F(SwarmCoordinatorTest, ReconnectResumesUnpausedDownloads) {
    auto descriptor = share();

    storage::ResumeState state;
    state.file_id = descriptor.file_id;
    state.chunk_count = descriptor.chunk_count;
    state.completed = core::ChunkBitmap(descriptor.chunk_count);
    state.key_handle = descriptor.key_handle;
    state.total_size = descriptor.total_size;
    state.checksum = descriptor.checksum;
    state.uploader_id = descriptor.uploader_id;
    state.output_path = output().string();
    ASSERT_TRUE(bob_->storage.resume.save(state));

    auto report = bob_->coordinator.on_tracker_reconnected();
    EXPECT_EQ(report.resumed, 1u);
    EXPECT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
    EXPECT_EQ(test::read_file(output()), content_);
}

TEST_F(SwarmCoordinatorTest, UploaderOnlineWakesWaitingDownload) {
    auto descriptor = share();
    alice_->tracker.go_offline();

    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    EXPECT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::milliseconds(200)), TaskOutcome::RUNNING);

    // Coming back online reannounces, which notifies the waiting leecher.
    alice_->tracker.go_online();
    auto report = alice_->coordinator.on_tracker_reconnected();
    EXPECT_EQ(report.reannounced, 1u);
    EXPECT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
}

TEST_F(SwarmCoordinatorTest, SeederRemovalDropsLocalCopy) {
    auto descriptor = share();
    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    ASSERT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
    ASSERT_TRUE(reaped(*bob_));
    ASSERT_EQ(bob_->storage.store.list_chunks(descriptor.file_id).size(), descriptor.chunk_count);

    bob_->coordinator.handle_notification(tracker::SeederRemoved{descriptor.file_id, "inactive for 30 days"});

    EXPECT_FALSE(bob_->storage.files.contains(descriptor.file_id));
    EXPECT_FALSE(bob_->storage.resume.contains(descriptor.file_id));
    EXPECT_TRUE(bob_->storage.store.list_chunks(descriptor.file_id).empty());
    // The uploader's copy is untouched.
    EXPECT_EQ(alice_->storage.store.list_chunks(descriptor.file_id).size(), descriptor.chunk_count);
}

TEST_F(SwarmCoordinatorTest, ScopeChangesReachLocalRecords) {
    auto descriptor = share();
    ASSERT_TRUE(bob_->coordinator.start_download(descriptor, output()));
    ASSERT_EQ(bob_->coordinator.wait(descriptor.file_id, std::chrono::seconds(10)), TaskOutcome::COMPLETE);
    ASSERT_TRUE(reaped(*bob_));
    EXPECT_EQ(bob_->storage.files.get(descriptor.file_id)->share_scope, std::vector<core::UserId>{"bob"});

    std::vector<core::UserId> scope;
    ASSERT_TRUE(alice_->coordinator.update_share_scope(descriptor.file_id, {"carol"}, {}, scope));
    EXPECT_EQ(scope, (std::vector<core::UserId>{"bob", "carol"}));
    EXPECT_EQ(alice_->storage.files.get(descriptor.file_id)->share_scope, scope);
    EXPECT_TRUE(test::wait_until([&]() {
        auto record = bob_->storage.files.get(descriptor.file_id);
        return record && record->share_scope == scope;
    }));

    EXPECT_EQ(bob_->coordinator.update_share_scope(descriptor.file_id, {}, {"carol"}, scope).error,
              ErrorCode::UNAUTHORIZED);

    // Revoking bob removes the copy on bob's device.
    ASSERT_TRUE(alice_->coordinator.update_share_scope(descriptor.file_id, {}, {"bob"}, scope));
    EXPECT_TRUE(test::wait_until([&]() { return !bob_->storage.files.contains(descriptor.file_id); }));
    EXPECT_TRUE(bob_->storage.store.list_chunks(descriptor.file_id).empty());
    EXPECT_FALSE(tracker_.snapshot(descriptor.file_id)->can_access("bob"));
}

TEST_F(SwarmCoordinatorTest, FinishedOutcomesAreBounded) {
    auto descriptor = share();

    // Files the tracker never heard of fail as soon as discovery runs.
    const auto total = SwarmCoordinator::MAX_FINISHED_RETAINED + 5;
    std::vector<core::FileId> ids;
    for (size_t i = 0; i < total; ++i) {
        auto attempt = descriptor;
        auto suffix = std::to_string(i);
        attempt.file_id = std::string(32 - suffix.size(), 'e') + suffix;
        ASSERT_TRUE(bob_->coordinator.start_download(attempt, dir_.path() / ("copy" + suffix)));
        ASSERT_EQ(bob_->coordinator.wait(attempt.file_id, std::chrono::seconds(5)), TaskOutcome::FAILED);
        ASSERT_TRUE(reaped(*bob_));
        ids.push_back(attempt.file_id);
    }

    EXPECT_EQ(bob_->coordinator.finished_count(), SwarmCoordinator::MAX_FINISHED_RETAINED);
    EXPECT_FALSE(bob_->coordinator.progress(ids.front()).has_value());
    ASSERT_TRUE(bob_->coordinator.progress(ids.back()).has_value());
    EXPECT_EQ(bob_->coordinator.progress(ids.back())->outcome, TaskOutcome::FAILED);
}
