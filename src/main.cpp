#include "chunkswarm/core/cli.hpp"
#include "chunkswarm/core/command_registry.hpp"
#include "chunkswarm/core/config.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include "chunkswarm/crypto/random.hpp"
#include "chunkswarm/storage/storage_config.hpp"
#include <iostream>

namespace {

using namespace chunkswarm;

// Defaults, then the config file if present, then command line overrides.
bool load_settings(const core::CommandLineParser& parser, core::Config& config) {
    config.set_defaults();

    auto path = core::utils::FileUtils::expand_user(parser.get_option("config"));
    if (core::utils::FileUtils::exists(path) && !config.load_from_file(path.string())) {
        std::cerr << "Error: cannot read " << path.string() << "\n";
        return false;
    }
    if (parser.has_option("data-dir")) {
        config.set("storage.base_dir", parser.get_option("data-dir"));
    }
    return true;
}

void print_usage(const core::CommandLineParser& parser, const core::CommandRegistry& commands) {
    parser.print_help();
    commands.print_help();
}

}

int main(int argc, char* argv[]) {
    core::CommandLineParser parser("chunkswarm");
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    if (!load_settings(parser, config)) {
        return 1;
    }
    core::CommandRegistry commands(storage::StorageConfig::from_config(config));

    const auto& args = parser.get_positional_args();
    if (parser.has_option("help") || args.empty()) {
        print_usage(parser, commands);
        return 0;
    }

    auto level = parser.has_option("verbose")
        ? core::LogLevel::Debug
        : core::Logger::parse_level(config.get_string("log.level"));
    core::Logger::initialize(config.get_string("log.file", "chunkswarm.log"), level);

    if (!crypto::SecureRandom::initialize()) {
        LOG_CRITICAL("libsodium initialization failed");
        core::Logger::shutdown();
        return 1;
    }

    auto result = commands.execute_command(args[0], args);
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
    }

    core::Logger::shutdown();
    return result.exit_code;
}
