#include <gtest/gtest.h>
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/storage/chunk_manager.hpp"
#include "chunkswarm/crypto/hash.hpp"
#include "chunkswarm/crypto/random.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>

using namespace chunkswarm;
using chunkswarm::core::ErrorCode;
using chunkswarm::storage::ChunkStore;

class ChunkStoreTest : public ::testing::Test {
protected:
    ChunkStoreTest() : store_(dir_.path() / "chunks") {}

    void SetUp() override {
        ASSERT_TRUE(store_.initialize());
        key_ = crypto::SecureRandom::generate_file_key();
    }

    crypto::EncryptedChunk sealed(std::uint32_t index, std::uint8_t seed = 1) {
        crypto::EncryptedChunk chunk;
        auto plaintext = test::make_content(512, seed);
        EXPECT_TRUE(cipher_.encrypt_chunk(key_, file_id_, index, plaintext, chunk));
        return chunk;
    }

    storage::ChunkVerifier verifier_for(std::uint32_t index) {
        return [this, index](const crypto::EncryptedChunk& chunk) {
            return cipher_.verify_chunk(key_, file_id_, index, chunk);
        };
    }

    test::TempDir dir_;
    ChunkStore store_;
    crypto::ChunkCipher cipher_;
    crypto::FileKey key_;
    const std::string file_id_ = "ab34cd56ef7890123456789012345678";
};

TEST_F(ChunkStoreTest, StoresAndReadsBack) {
    auto chunk = sealed(0);
    ASSERT_TRUE(store_.put_chunk(file_id_, 0, chunk, verifier_for(0)));

    EXPECT_TRUE(store_.has_chunk(file_id_, 0));
    auto loaded = store_.get_chunk(file_id_, 0);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->ciphertext, chunk.ciphertext);
    EXPECT_EQ(loaded->nonce, chunk.nonce);
    EXPECT_EQ(store_.record_size(file_id_, 0).value_or(0), chunk.total_size());
    EXPECT_EQ(store_.chunk_path(file_id_, 0).parent_path().parent_path().filename().string(), "ab");
}

TEST_F(ChunkStoreTest, CommittedChunkIsNeverOverwritten) {
    auto first = sealed(3, 1);
    ASSERT_TRUE(store_.put_chunk(file_id_, 3, first));

    auto result = store_.put_chunk(file_id_, 3, sealed(3, 2));
    EXPECT_EQ(result.error, ErrorCode::CONFLICT);
    EXPECT_EQ(store_.get_chunk(file_id_, 3)->ciphertext, first.ciphertext);

    ASSERT_TRUE(store_.delete_chunk(file_id_, 3));
    EXPECT_TRUE(store_.put_chunk(file_id_, 3, sealed(3, 2)));
}

TEST_F(ChunkStoreTest, VerifierFailureStoresNothing) {
    auto chunk = sealed(1);
    auto result = store_.put_chunk(file_id_, 2, chunk, verifier_for(2));

    EXPECT_EQ(result.error, ErrorCode::CORRUPT);
    EXPECT_FALSE(store_.has_chunk(file_id_, 2));
}

TEST_F(ChunkStoreTest, EmptyCiphertextIsCorrupt) {
    crypto::EncryptedChunk empty;
    EXPECT_EQ(store_.put_chunk(file_id_, 0, empty).error, ErrorCode::CORRUPT);
}

TEST_F(ChunkStoreTest, RejectsPathLikeFileIds) {
    auto chunk = sealed(0);
    EXPECT_EQ(store_.put_chunk("../escape", 0, chunk).error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(store_.put_chunk("x", 0, chunk).error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(store_.get_chunk("../escape", 0).has_value());
    EXPECT_TRUE(store_.list_chunks("a/b").empty());
}

TEST_F(ChunkStoreTest, DeletingMissingChunkIsNotFound) {
    EXPECT_EQ(store_.delete_chunk(file_id_, 9).error, ErrorCode::NOT_FOUND);
}

TEST_F(ChunkStoreTest, ListsChunksAndFiles) {
    const std::string other = "ff00ff00ff00ff00ff00ff00ff00ff00";
    for (std::uint32_t index : {7u, 2u, 11u}) {
        ASSERT_TRUE(store_.put_chunk(file_id_, index, sealed(index)));
    }
    ASSERT_TRUE(store_.put_chunk(other, 0, sealed(0)));

    EXPECT_EQ(store_.list_chunks(file_id_), (std::vector<std::uint32_t>{2, 7, 11}));
    EXPECT_EQ(store_.list_files(), (std::vector<std::string>{file_id_, other}));
    EXPECT_EQ(store_.stored_bytes(file_id_), 3 * sealed(0).total_size());
}

TEST_F(ChunkStoreTest, ConcurrentWritersCommitExactlyOnce) {
    std::atomic<int> committed{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> writers;

    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([&, i]() {
            auto result = store_.put_chunk(file_id_, 5, sealed(5, static_cast<std::uint8_t>(i)));
            if (result) {
                ++committed;
            } else if (result.error == ErrorCode::CONFLICT) {
                ++conflicts;
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(committed.load(), 1);
    EXPECT_EQ(conflicts.load(), 7);
}

TEST_F(ChunkStoreTest, PurgeHidesFileUntilFinished) {
    ASSERT_TRUE(store_.put_chunk(file_id_, 0, sealed(0)));
    ASSERT_TRUE(store_.put_chunk(file_id_, 1, sealed(1)));

    std::filesystem::path tombstone;
    ASSERT_TRUE(store_.begin_purge(file_id_, tombstone));
    EXPECT_FALSE(tombstone.empty());
    EXPECT_TRUE(store_.list_chunks(file_id_).empty());
    EXPECT_TRUE(store_.list_files().empty());

    ASSERT_TRUE(store_.finish_purge(tombstone));
    EXPECT_FALSE(std::filesystem::exists(tombstone));
}

TEST_F(ChunkStoreTest, AbortedPurgeRestoresChunks) {
    ASSERT_TRUE(store_.put_chunk(file_id_, 0, sealed(0)));

    std::filesystem::path tombstone;
    ASSERT_TRUE(store_.begin_purge(file_id_, tombstone));
    ASSERT_TRUE(store_.abort_purge(file_id_, tombstone));

    EXPECT_EQ(store_.list_chunks(file_id_), (std::vector<std::uint32_t>{0}));
}

TEST_F(ChunkStoreTest, PurgeOfAbsentFileSucceeds) {
    std::filesystem::path tombstone;
    ASSERT_TRUE(store_.begin_purge(file_id_, tombstone));
    EXPECT_TRUE(tombstone.empty());
    EXPECT_TRUE(store_.purge_file(file_id_));
}

TEST_F(ChunkStoreTest, InitializeClearsInterruptedWork) {
    ASSERT_TRUE(store_.put_chunk(file_id_, 0, sealed(0)));
    std::filesystem::path tombstone;
    ASSERT_TRUE(store_.begin_purge(file_id_, tombstone));

    ASSERT_TRUE(store_.put_chunk(file_id_, 1, sealed(1)));
    auto stray = store_.chunk_path(file_id_, 2);
    stray += ".a1b2c3.tmp";
    test::write_file(stray, test::make_content(32));

    ChunkStore reopened(store_.root());
    ASSERT_TRUE(reopened.initialize());

    EXPECT_FALSE(std::filesystem::exists(tombstone));
    EXPECT_FALSE(std::filesystem::exists(stray));
    EXPECT_EQ(reopened.list_chunks(file_id_), (std::vector<std::uint32_t>{1}));
}

namespace {

// A filesystem without hard links: every commit attempt fails.
class LinklessChunkStore : public ChunkStore {
public:
    using ChunkStore::ChunkStore;

protected:
    void link_into_place(const std::filesystem::path&, const std::filesystem::path&,
                         std::error_code& ec) override {
        ec = std::make_error_code(std::errc::operation_not_supported);
    }
};

}

TEST_F(ChunkStoreTest, FailedCommitNeverReplacesStoredChunk) {
    auto first = sealed(4, 1);
    ASSERT_TRUE(store_.put_chunk(file_id_, 4, first));

    LinklessChunkStore linkless(store_.root());
    auto result = linkless.put_chunk(file_id_, 4, sealed(4, 2));
    EXPECT_EQ(result.error, ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(store_.get_chunk(file_id_, 4)->ciphertext, first.ciphertext);

    EXPECT_EQ(linkless.put_chunk(file_id_, 5, sealed(5)).error, ErrorCode::STORAGE_FAILURE);
    EXPECT_FALSE(store_.has_chunk(file_id_, 5));
    EXPECT_EQ(store_.cleanup_leftovers(), 0u);
}

class ChunkManagerTest : public ::testing::Test {
protected:
    ChunkManagerTest() : store_(dir_.path() / "chunks"), chunks_(store_, 1000) {}

    void SetUp() override {
        ASSERT_TRUE(store_.initialize());
        key_ = crypto::SecureRandom::generate_file_key();
        content_ = test::make_content(4500);
        source_ = dir_.path() / "source.bin";
        test::write_file(source_, content_);
    }

    test::TempDir dir_;
    ChunkStore store_;
    storage::ChunkManager chunks_;
    crypto::FileKey key_;
    std::vector<std::uint8_t> content_;
    std::filesystem::path source_;
};

TEST_F(ChunkManagerTest, ChunkCountRoundsUp) {
    EXPECT_EQ(storage::ChunkManager::chunk_count_for(4500, 1000), 5u);
    EXPECT_EQ(storage::ChunkManager::chunk_count_for(4000, 1000), 4u);
    EXPECT_EQ(storage::ChunkManager::chunk_count_for(0, 1000), 0u);
    EXPECT_EQ(chunks_.expected_plaintext_size(4500, 4), 500u);
    EXPECT_EQ(chunks_.expected_plaintext_size(4500, 5), 0u);
}

TEST_F(ChunkManagerTest, FileIdDependsOnUploader) {
    auto checksum = crypto::Hasher::hash(content_);
    auto alice = storage::ChunkManager::derive_file_id(checksum, "alice");
    EXPECT_EQ(alice.size(), 32u);
    EXPECT_EQ(alice, storage::ChunkManager::derive_file_id(checksum, "alice"));
    EXPECT_NE(alice, storage::ChunkManager::derive_file_id(checksum, "bob"));
}

TEST_F(ChunkManagerTest, IngestThenAssembleReproducesFile) {
    storage::IngestedFile ingested;
    ASSERT_TRUE(chunks_.ingest_file(source_, "alice", key_, ingested));
    EXPECT_EQ(ingested.chunk_count, 5u);
    EXPECT_EQ(ingested.total_size, content_.size());
    EXPECT_EQ(store_.list_chunks(ingested.file_id).size(), 5u);

    storage::AssemblyReport report;
    auto output = dir_.path() / "out" / "copy.bin";
    ASSERT_TRUE(chunks_.assemble_file(ingested.file_id, ingested.chunk_count, ingested.total_size,
                                      ingested.checksum, key_, output, report));
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(test::read_file(output), content_);
}

TEST_F(ChunkManagerTest, EmptyOrMissingSourceIsRejected) {
    storage::IngestedFile ingested;
    EXPECT_EQ(chunks_.ingest_file(dir_.path() / "missing.bin", "alice", key_, ingested).error,
              ErrorCode::NOT_FOUND);

    auto empty = dir_.path() / "empty.bin";
    test::write_file(empty, {});
    EXPECT_EQ(chunks_.ingest_file(empty, "alice", key_, ingested).error, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ChunkManagerTest, ReportListsEveryMissingChunk) {
    storage::IngestedFile ingested;
    ASSERT_TRUE(chunks_.ingest_file(source_, "alice", key_, ingested));
    ASSERT_TRUE(store_.delete_chunk(ingested.file_id, 1));
    ASSERT_TRUE(store_.delete_chunk(ingested.file_id, 3));

    storage::AssemblyReport report;
    auto output = dir_.path() / "copy.bin";
    auto result = chunks_.assemble_file(ingested.file_id, ingested.chunk_count, ingested.total_size,
                                        ingested.checksum, key_, output, report);
    EXPECT_EQ(result.error, ErrorCode::CORRUPT);
    EXPECT_EQ(report.missing, (std::vector<std::uint32_t>{1, 3}));
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(ChunkManagerTest, WrongKeyReportsEveryChunkUndecryptable) {
    storage::IngestedFile ingested;
    ASSERT_TRUE(chunks_.ingest_file(source_, "alice", key_, ingested));

    storage::AssemblyReport report;
    auto output = dir_.path() / "copy.bin";
    auto wrong_key = crypto::SecureRandom::generate_file_key();
    auto result = chunks_.assemble_file(ingested.file_id, ingested.chunk_count, ingested.total_size,
                                        ingested.checksum, wrong_key, output, report);
    EXPECT_EQ(result.error, ErrorCode::CORRUPT);
    EXPECT_EQ(report.undecryptable.size(), 5u);
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "copy.bin.part"));
}

TEST_F(ChunkManagerTest, ChecksumMismatchIsCorrupt) {
    storage::IngestedFile ingested;
    ASSERT_TRUE(chunks_.ingest_file(source_, "alice", key_, ingested));

    storage::AssemblyReport report;
    auto output = dir_.path() / "copy.bin";
    auto result = chunks_.assemble_file(ingested.file_id, ingested.chunk_count, ingested.total_size,
                                        std::string(64, '0'), key_, output, report);
    EXPECT_EQ(result.error, ErrorCode::CORRUPT);
    EXPECT_TRUE(report.checksum_mismatch);
    EXPECT_EQ(report.actual_checksum, ingested.checksum);
    EXPECT_FALSE(std::filesystem::exists(output));
}
