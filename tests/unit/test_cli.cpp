#include <gtest/gtest.h>
#include "chunkswarm/core/cli.hpp"
#include "chunkswarm/core/command_registry.hpp"
#include "chunkswarm/core/config.hpp"
#include "test_helpers.hpp"

using namespace chunkswarm;
using chunkswarm::core::CommandLineParser;

namespace {

// argv as main() would receive it.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

}

TEST(CommandLineParserTest, ParsesLongOptionsAndPositionals) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "--verbose", "--data-dir", "/srv/swarm", "tracker", "7500"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_TRUE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_option("data-dir"), "/srv/swarm");
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"tracker", "7500"}));
}

TEST(CommandLineParserTest, AcceptsEqualsSyntaxAndShortNames) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "--config=/etc/chunkswarm.conf", "-d", "/data", "files"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_option("config"), "/etc/chunkswarm.conf");
    EXPECT_EQ(parser.get_option("d"), "/data");
    EXPECT_TRUE(parser.has_option("data-dir"));
}

TEST(CommandLineParserTest, DefaultsApplyWhenOptionAbsent) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "gc"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "~/.chunkswarm.conf");
    EXPECT_EQ(parser.get_option("data-dir", "fallback"), "fallback");
}

TEST(CommandLineParserTest, RejectsUnknownOptions) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "--turbo"};

    EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_error(), "Unknown option: --turbo");
}

TEST(CommandLineParserTest, MissingValueIsAnError) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "--config"};

    EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    EXPECT_NE(parser.get_error().find("requires a value"), std::string::npos);
}

TEST(CommandLineParserTest, ArgumentsAfterCommandBelongToIt) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "-d", "/data", "tracker", "--port", "7500"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"tracker", "--port", "7500"}));

    Args dashed{"chunkswarm", "--", "-weird-name"};
    ASSERT_TRUE(parser.parse(dashed.argc(), dashed.argv()));
    EXPECT_EQ(parser.get_positional_args(), (std::vector<std::string>{"-weird-name"}));
}

TEST(CommandLineParserTest, FlagRejectsInlineValue) {
    CommandLineParser parser("chunkswarm");
    Args args{"chunkswarm", "--verbose=yes"};

    EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    EXPECT_NE(parser.get_error().find("does not take a value"), std::string::npos);
}

TEST(CommandLineParserTest, IntOptionFallsBackOnGarbage) {
    CommandLineParser parser("chunkswarm");
    parser.add_option("p", "port", "Port", true);
    Args args{"chunkswarm", "-p", "80x"};

    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_EQ(parser.get_int_option("port", 7420), 7420);
}

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Config::instance().clear();
        storage_config_ = storage::StorageConfig(dir_.path());
    }

    void TearDown() override {
        core::Config::instance().clear();
    }

    test::TempDir dir_;
    storage::StorageConfig storage_config_;
};

TEST_F(CommandRegistryTest, KnowsBuiltInCommands) {
    core::CommandRegistry registry(storage_config_);
    for (const char* name : {"tracker", "gc", "files", "tasks"}) {
        EXPECT_TRUE(registry.has_command(name)) << name;
    }
    EXPECT_FALSE(registry.has_command("share"));
}

TEST_F(CommandRegistryTest, UnknownCommandFails) {
    core::CommandRegistry registry(storage_config_);
    auto result = registry.execute_command("share", {"share"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(CommandRegistryTest, TrackerRejectsInvalidPort) {
    core::CommandRegistry registry(storage_config_);
    EXPECT_FALSE(registry.execute_command("tracker", {"tracker", "70000"}).success);
    EXPECT_FALSE(registry.execute_command("tracker", {"tracker", "abc"}).success);
}

TEST_F(CommandRegistryTest, FilesAndTasksReportEmptyStore) {
    core::CommandRegistry registry(storage_config_);

    testing::internal::CaptureStdout();
    auto files = registry.execute_command("files", {"files"});
    auto tasks = registry.execute_command("tasks", {"tasks"});
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(files.success);
    EXPECT_TRUE(tasks.success);
    EXPECT_NE(output.find("No files held locally"), std::string::npos);
    EXPECT_NE(output.find("No resumable downloads"), std::string::npos);
}

TEST_F(CommandRegistryTest, TasksListsSavedProgress) {
    {
        storage::Database db(storage_config_.database_path);
        storage::ResumeManager resume(db);
        ASSERT_TRUE(db.open());
        ASSERT_TRUE(resume.initialize());

        storage::ResumeState state;
        state.file_id = "0123456789abcdef0123456789abcdef";
        state.chunk_count = 4;
        state.completed = core::ChunkBitmap::from_indices(4, {0, 1});
        state.paused = true;
        state.output_path = "/tmp/movie.mkv";
        ASSERT_TRUE(resume.save(state));
    }

    core::CommandRegistry registry(storage_config_);
    testing::internal::CaptureStdout();
    auto result = registry.execute_command("tasks", {"tasks"});
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(result.success);
    EXPECT_NE(output.find("50.0%"), std::string::npos);
    EXPECT_NE(output.find("(paused)"), std::string::npos);
    EXPECT_NE(output.find("/tmp/movie.mkv"), std::string::npos);
}

TEST_F(CommandRegistryTest, GcOnEmptyStoreSucceeds) {
    core::CommandRegistry registry(storage_config_);

    testing::internal::CaptureStdout();
    auto result = registry.execute_command("gc", {"gc"});
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(result.success);
    EXPECT_NE(output.find("Stale partial files removed: 0"), std::string::npos);
}
