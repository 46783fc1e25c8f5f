#include <gtest/gtest.h>
#include "chunkswarm/storage/database.hpp"
#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/storage/resume_manager.hpp"
#include "test_helpers.hpp"

using namespace chunkswarm;
using chunkswarm::storage::FileRole;
using chunkswarm::storage::LocalFileRecord;
using chunkswarm::storage::ResumeState;

class LocalStateTest : public ::testing::Test {
protected:
    LocalStateTest()
        : db_(dir_.path() / "state.db")
        , files_(db_)
        , resume_(db_) {}

    void SetUp() override {
        ASSERT_TRUE(db_.open());
        ASSERT_TRUE(files_.initialize());
        ASSERT_TRUE(resume_.initialize());
    }

    LocalFileRecord record(const std::string& file_id, FileRole role = FileRole::DOWNLOADER) {
        LocalFileRecord r;
        r.file_id = file_id;
        r.total_size = 10000;
        r.chunk_count = 10;
        r.checksum = "c0ffee";
        r.uploader_id = "alice";
        r.role = role;
        r.share_scope = {"bob", "carol"};
        r.last_activity_at = clock_.now();
        r.seeder_since = clock_.now();
        r.created_at = clock_.now();
        r.key_handle = "key-1";
        r.local_path = "/tmp/out.bin";
        return r;
    }

    ResumeState state(const std::string& file_id) {
        ResumeState s;
        s.file_id = file_id;
        s.chunk_count = 10;
        s.completed = core::ChunkBitmap::from_indices(10, {0, 3, 9});
        s.key_handle = "key-1";
        s.total_size = 10000;
        s.checksum = "c0ffee";
        s.uploader_id = "alice";
        s.output_path = "/tmp/out.bin";
        s.updated_at = clock_.now();
        return s;
    }

    test::TempDir dir_;
    test::ManualClock clock_;
    storage::Database db_;
    storage::FileIndex files_;
    storage::ResumeManager resume_;
};

TEST_F(LocalStateTest, FileRecordRoundTrips) {
    ASSERT_TRUE(files_.upsert(record("f1", FileRole::UPLOADER)));

    auto loaded = files_.get("f1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->role, FileRole::UPLOADER);
    EXPECT_EQ(loaded->share_scope, (std::vector<std::string>{"bob", "carol"}));
    EXPECT_EQ(loaded->chunk_count, 10u);
    EXPECT_EQ(loaded->key_handle, "key-1");
    EXPECT_TRUE(loaded->last_activity_at == clock_.now());
    EXPECT_FALSE(loaded->download_complete);
}

TEST_F(LocalStateTest, EmptyScopeStaysEmpty) {
    auto r = record("f1");
    r.share_scope.clear();
    ASSERT_TRUE(files_.upsert(r));
    EXPECT_TRUE(files_.get("f1")->share_scope.empty());
}

TEST_F(LocalStateTest, TouchAndCompleteRequireExistingRecord) {
    EXPECT_FALSE(files_.touch_activity("missing", clock_.now()));
    EXPECT_FALSE(files_.mark_complete("missing", clock_.now()));

    ASSERT_TRUE(files_.upsert(record("f1")));
    clock_.advance(std::chrono::minutes(5));
    EXPECT_TRUE(files_.touch_activity("f1", clock_.now()));
    EXPECT_TRUE(files_.get("f1")->last_activity_at == clock_.now());

    EXPECT_TRUE(files_.mark_complete("f1", clock_.now()));
    EXPECT_TRUE(files_.get("f1")->download_complete);
}

TEST_F(LocalStateTest, StaleQueryOnlyReturnsOldIncompleteFiles) {
    ASSERT_TRUE(files_.upsert(record("old")));
    auto done = record("old-done");
    done.download_complete = true;
    ASSERT_TRUE(files_.upsert(done));

    clock_.advance(std::chrono::hours(48));
    ASSERT_TRUE(files_.upsert(record("new")));

    auto stale = files_.find_stale_incomplete(clock_.now() - std::chrono::hours(24));
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].file_id, "old");
    EXPECT_EQ(files_.count(), 3u);
}

TEST_F(LocalStateTest, RemoveDeletesRecord) {
    ASSERT_TRUE(files_.upsert(record("f1")));
    ASSERT_TRUE(files_.remove("f1"));
    EXPECT_FALSE(files_.contains("f1"));
    EXPECT_TRUE(files_.list().empty());
}

TEST_F(LocalStateTest, ResumeStateRoundTrips) {
    auto s = state("f1");
    s.phase = core::TaskPhase::DRAINING;
    s.paused = true;
    ASSERT_TRUE(resume_.save(s));

    auto loaded = resume_.load("f1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->completed == s.completed);
    EXPECT_EQ(loaded->phase, core::TaskPhase::DRAINING);
    EXPECT_TRUE(loaded->paused);
    EXPECT_EQ(loaded->output_path, "/tmp/out.bin");
}

TEST_F(LocalStateTest, SaveReplacesPreviousProgress) {
    ASSERT_TRUE(resume_.save(state("f1")));
    auto s = state("f1");
    s.completed.set(5);
    ASSERT_TRUE(resume_.save(s));

    EXPECT_EQ(resume_.load("f1")->completed.set_indices(), (std::vector<std::uint32_t>{0, 3, 5, 9}));
}

TEST_F(LocalStateTest, TerminalStatesAreNotResumable) {
    ASSERT_TRUE(resume_.save(state("running")));
    auto failed = state("failed");
    failed.phase = core::TaskPhase::FAILED;
    ASSERT_TRUE(resume_.save(failed));

    auto resumable = resume_.list_resumable();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0].file_id, "running");
}

TEST_F(LocalStateTest, EmptyBitmapIsStored) {
    auto s = state("f1");
    s.completed = core::ChunkBitmap(0);
    s.chunk_count = 0;
    ASSERT_TRUE(resume_.save(s));
    ASSERT_TRUE(resume_.load("f1").has_value());
}

TEST_F(LocalStateTest, CorruptBitmapIsDiscarded) {
    ASSERT_TRUE(resume_.save(state("f1")));
    ASSERT_TRUE(db_.exec("UPDATE resume_state SET chunk_count = 40 WHERE file_id = 'f1';"));
    EXPECT_FALSE(resume_.load("f1").has_value());
    EXPECT_TRUE(resume_.contains("f1"));
}

TEST_F(LocalStateTest, FailedTransactionRollsBackBothTables) {
    ASSERT_TRUE(files_.upsert(record("f1")));
    ASSERT_TRUE(resume_.save(state("f1")));

    bool committed = db_.transaction([&]() {
        EXPECT_TRUE(files_.remove("f1"));
        return false;
    });
    EXPECT_FALSE(committed);
    EXPECT_TRUE(files_.contains("f1"));

    committed = db_.transaction([&]() {
        return files_.remove("f1") && resume_.remove("f1");
    });
    EXPECT_TRUE(committed);
    EXPECT_FALSE(files_.contains("f1"));
    EXPECT_FALSE(resume_.contains("f1"));
}

TEST_F(LocalStateTest, ThrowingTransactionRollsBackAndRethrows) {
    ASSERT_TRUE(files_.upsert(record("f1")));

    EXPECT_THROW(db_.transaction([&]() -> bool {
        EXPECT_TRUE(files_.remove("f1"));
        throw std::runtime_error("interrupted");
    }), std::runtime_error);
    EXPECT_TRUE(files_.contains("f1"));
}

TEST_F(LocalStateTest, StateSurvivesReopen) {
    ASSERT_TRUE(files_.upsert(record("f1")));
    ASSERT_TRUE(resume_.save(state("f1")));
    db_.close();

    storage::Database reopened(dir_.path() / "state.db");
    ASSERT_TRUE(reopened.open());
    storage::FileIndex files(reopened);
    storage::ResumeManager resume(reopened);
    ASSERT_TRUE(files.initialize());
    ASSERT_TRUE(resume.initialize());

    EXPECT_TRUE(files.contains("f1"));
    EXPECT_EQ(resume.load("f1")->completed.count(), 3u);
}
