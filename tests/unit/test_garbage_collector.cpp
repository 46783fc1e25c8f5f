#include <gtest/gtest.h>
#include "chunkswarm/gc/garbage_collector.hpp"
#include "chunkswarm/gc/sweep_scheduler.hpp"
#include "chunkswarm/core/config.hpp"
#include "test_helpers.hpp"
#include <atomic>

using namespace chunkswarm;
using chunkswarm::core::ErrorCode;
using chunkswarm::gc::GarbageCollector;
using chunkswarm::gc::GcSettings;

class GarbageCollectorTest : public ::testing::Test {
protected:
    GarbageCollectorTest()
        : device_(dir_.path(), core::DeviceKey{"bob", "desktop"}, provider_)
        , gc_(device_.store, device_.db, device_.files, device_.resume, clock_) {}

    void SetUp() override {
        ASSERT_TRUE(device_.open());
    }

    // A partially downloaded file with `chunks` of its chunks stored.
    void hold_partial(const std::string& file_id, std::uint32_t chunks, bool with_resume = true) {
        storage::LocalFileRecord record;
        record.file_id = file_id;
        record.total_size = 4 * 1024;
        record.chunk_count = 4;
        record.checksum = "aa";
        record.uploader_id = "alice";
        record.role = storage::FileRole::DOWNLOADER;
        record.last_activity_at = clock_.now();
        record.created_at = clock_.now();
        ASSERT_TRUE(device_.files.upsert(record));

        for (std::uint32_t index = 0; index < chunks; ++index) {
            ASSERT_TRUE(device_.store.put_chunk(file_id, index, chunk()));
        }

        if (with_resume) {
            storage::ResumeState state;
            state.file_id = file_id;
            state.chunk_count = 4;
            state.completed = core::ChunkBitmap::from_indices(4, device_.store.list_chunks(file_id));
            state.total_size = 4 * 1024;
            state.checksum = "aa";
            ASSERT_TRUE(device_.resume.save(state));
        }
    }

    static crypto::EncryptedChunk chunk() {
        crypto::EncryptedChunk c;
        c.ciphertext.assign(1024, 0x5A);
        return c;
    }

    bool nothing_held(const std::string& file_id) {
        return !device_.files.contains(file_id) && !device_.resume.contains(file_id) &&
               device_.store.list_chunks(file_id).empty();
    }

    const std::string stale_ = "11111111111111111111111111111111";
    const std::string fresh_ = "22222222222222222222222222222222";

    test::TempDir dir_;
    test::ManualClock clock_;
    test::InMemoryKeyProvider provider_;
    test::DeviceStorage device_;
    GarbageCollector gc_;
};

TEST_F(GarbageCollectorTest, PurgeCascadesOverAllStores) {
    hold_partial(stale_, 3);

    ASSERT_TRUE(gc_.purge_file(stale_));
    EXPECT_TRUE(nothing_held(stale_));
    EXPECT_FALSE(std::filesystem::exists(device_.store.file_directory(stale_)));
}

TEST_F(GarbageCollectorTest, PurgeOfUnknownFileIsNotFound) {
    EXPECT_EQ(gc_.purge_file(stale_).error, ErrorCode::NOT_FOUND);
}

TEST_F(GarbageCollectorTest, FailedDatabaseHalfRestoresChunks) {
    hold_partial(stale_, 2);
    ASSERT_TRUE(device_.db.exec("DROP TABLE resume_state;"));

    auto result = gc_.purge_file(stale_);
    EXPECT_EQ(result.error, ErrorCode::STORAGE_FAILURE);
    EXPECT_TRUE(device_.files.contains(stale_));
    EXPECT_EQ(device_.store.list_chunks(stale_).size(), 2u);
}

TEST_F(GarbageCollectorTest, SweepRemovesPartialFilesPastSeederTtl) {
    hold_partial(stale_, 2);
    clock_.advance(std::chrono::hours(24 * 20));
    hold_partial(fresh_, 1);
    clock_.advance(std::chrono::hours(24 * 11));

    auto report = gc_.sweep();
    EXPECT_EQ(report.stale_files_removed, 1u);
    EXPECT_EQ(report.bytes_freed, device_.store.stored_bytes(fresh_) * 2);
    EXPECT_TRUE(nothing_held(stale_));
    EXPECT_TRUE(device_.files.contains(fresh_));
}

TEST_F(GarbageCollectorTest, CompleteFilesAreNeverSwept) {
    hold_partial(stale_, 4, false);
    ASSERT_TRUE(device_.files.mark_complete(stale_, clock_.now()));
    clock_.advance(std::chrono::hours(24 * 90));

    auto report = gc_.sweep();
    EXPECT_EQ(report.stale_files_removed, 0u);
    EXPECT_TRUE(device_.files.contains(stale_));
}

TEST_F(GarbageCollectorTest, ActiveDownloadsAreSkipped) {
    hold_partial(stale_, 2);
    clock_.advance(std::chrono::hours(24 * 31));
    gc_.set_active_predicate([this](const core::FileId& file_id) { return file_id == stale_; });

    auto report = gc_.sweep();
    EXPECT_EQ(report.skipped_active, 1u);
    EXPECT_EQ(report.stale_files_removed, 0u);
    EXPECT_TRUE(device_.files.contains(stale_));
}

TEST_F(GarbageCollectorTest, OrphanedChunksAreRemoved) {
    hold_partial(fresh_, 1);
    ASSERT_TRUE(device_.store.put_chunk(stale_, 0, chunk()));

    auto report = gc_.sweep();
    EXPECT_EQ(report.orphans_removed, 1u);
    EXPECT_TRUE(device_.store.list_chunks(stale_).empty());
    EXPECT_EQ(device_.store.list_chunks(fresh_).size(), 1u);
}

TEST_F(GarbageCollectorTest, ChunksWithOnlyResumeStateAreKept) {
    hold_partial(stale_, 2);
    ASSERT_TRUE(device_.files.remove(stale_));

    auto report = gc_.sweep();
    EXPECT_EQ(report.orphans_removed, 0u);
    EXPECT_EQ(device_.store.list_chunks(stale_).size(), 2u);
}

TEST_F(GarbageCollectorTest, SettingsComeFromConfig) {
    auto& config = core::Config::instance();
    config.clear();
    config.set("gc.interval_seconds", "120");
    config.set("gc.seeder_ttl_days", "7");

    auto settings = GcSettings::from_config(config);
    EXPECT_EQ(settings.interval, std::chrono::seconds(120));
    EXPECT_EQ(settings.seeder_ttl, std::chrono::hours(24 * 7));
    config.clear();
}

TEST(SweepSchedulerTest, RunsJobPeriodicallyUntilStopped) {
    std::atomic<int> runs{0};
    gc::SweepScheduler scheduler("test sweep", std::chrono::milliseconds(20), [&]() { ++runs; });

    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());
    EXPECT_TRUE(test::wait_until([&]() { return runs.load() >= 3; }));

    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
    auto after_stop = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(runs.load(), after_stop);
}

TEST(SweepSchedulerTest, RunNowSurvivesThrowingJob) {
    int runs = 0;
    gc::SweepScheduler scheduler("throwing sweep", std::chrono::hours(1), [&]() {
        ++runs;
        throw std::runtime_error("disk vanished");
    });

    scheduler.run_now();
    scheduler.run_now();
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(scheduler.run_count(), 2u);
}
