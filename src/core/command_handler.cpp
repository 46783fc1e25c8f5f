#include "chunkswarm/core/command_handler.hpp"
#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/config.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include "chunkswarm/gc/garbage_collector.hpp"
#include "chunkswarm/gc/sweep_scheduler.hpp"
#include "chunkswarm/storage/chunk_store.hpp"
#include "chunkswarm/storage/database.hpp"
#include "chunkswarm/storage/file_index.hpp"
#include "chunkswarm/storage/resume_manager.hpp"
#include "chunkswarm/tracker/tracker.hpp"
#include "chunkswarm/tracker/tracker_server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <charconv>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>

namespace chunkswarm::core {

namespace {

// The on-disk state of one device, opened for a single command.
struct LocalStorage {
    storage::Database db;
    storage::ChunkStore store;
    storage::FileIndex files;
    storage::ResumeManager resume;

    explicit LocalStorage(const storage::StorageConfig& config)
        : db(config.database_path), store(config.chunks_directory), files(db), resume(db) {}
};

std::unique_ptr<LocalStorage> open_storage(const storage::StorageConfig& config, std::string& error) {
    if (!config.validate()) {
        error = "Invalid storage configuration";
        return nullptr;
    }
    if (!config.create_directories()) {
        error = "Cannot create storage directories under " + config.chunks_directory.parent_path().string();
        return nullptr;
    }

    auto local = std::make_unique<LocalStorage>(config);
    if (!local->db.open()) {
        error = "Cannot open database " + config.database_path.string() + ": " + local->db.last_error();
        return nullptr;
    }
    auto initialized = local->store.initialize();
    if (!initialized) {
        error = "Cannot open chunk store: " + initialized.message;
        return nullptr;
    }
    if (!local->files.initialize() || !local->resume.initialize()) {
        error = "Cannot initialize database tables: " + local->db.last_error();
        return nullptr;
    }
    return local;
}

}

CommandResult TrackerCommandHandler::execute(const std::vector<std::string>& args) {
    auto settings = tracker::TrackerSettings::from_config(Config::instance());
    if (args.size() > 1) {
        unsigned port = 0;
        const auto& text = args[1];
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
        if (ec != std::errc() || end != text.data() + text.size() || port == 0 || port > 65535) {
            return CommandResult::error("Invalid port: " + text);
        }
        settings.port = static_cast<std::uint16_t>(port);
    }

    tracker::Tracker tracker(settings);
    tracker::TrackerServer server(tracker, settings.port);
    if (!server.start()) {
        return CommandResult::error("Failed to start tracker on port " + std::to_string(settings.port));
    }

    gc::SweepScheduler sweeper("Tracker sweep",
                               std::chrono::duration_cast<std::chrono::milliseconds>(settings.sweep_interval),
                               [&tracker]() {
        auto report = tracker.sweep();
        auto stats = tracker.stats();
        LOG_INFO("Tracker holds {} files, {} seeders, {} leechers after sweep ({} removals)",
                 stats.files, stats.seeders, stats.leechers, report.total());
    });
    sweeper.start(false);

    std::cout << "Tracker listening on port " << server.port() << " (Ctrl+C to stop)\n";

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signal_number);
        }
    });
    signals_context.run();

    sweeper.stop();
    server.stop();
    std::cout << "Tracker stopped\n";
    return CommandResult::ok();
}

GcCommandHandler::GcCommandHandler(storage::StorageConfig storage_config)
    : storage_config_(std::move(storage_config)) {}

CommandResult GcCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    std::string error;
    auto local = open_storage(storage_config_, error);
    if (!local) {
        return CommandResult::error(error);
    }

    gc::GarbageCollector collector(local->store, local->db, local->files, local->resume,
                                   SystemClock::shared(), gc::GcSettings::from_config(Config::instance()));
    auto report = collector.sweep();

    std::cout << "Stale partial files removed: " << report.stale_files_removed << "\n";
    std::cout << "Orphaned chunk sets removed: " << report.orphans_removed << "\n";
    std::cout << "Leftovers removed:           " << report.leftovers_removed << "\n";
    std::cout << "Space freed:                 " << utils::StringUtils::format_bytes(report.bytes_freed) << "\n";
    if (report.failures > 0) {
        return CommandResult::error(std::to_string(report.failures) + " removals failed");
    }
    return CommandResult::ok();
}

FilesCommandHandler::FilesCommandHandler(storage::StorageConfig storage_config)
    : storage_config_(std::move(storage_config)) {}

CommandResult FilesCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    std::string error;
    auto local = open_storage(storage_config_, error);
    if (!local) {
        return CommandResult::error(error);
    }

    auto records = local->files.list();
    if (records.empty()) {
        std::cout << "No files held locally\n";
        return CommandResult::ok();
    }

    for (const auto& record : records) {
        auto held = local->store.list_chunks(record.file_id).size();
        std::cout << record.file_id << "\n";
        std::cout << "  Role:          "
                  << (record.role == storage::FileRole::UPLOADER ? "uploader" : "downloader") << "\n";
        std::cout << "  Size:          " << utils::StringUtils::format_bytes(record.total_size) << "\n";
        std::cout << "  Chunks:        " << held << "/" << record.chunk_count
                  << (record.download_complete ? " (complete)" : "") << "\n";
        std::cout << "  Checksum:      " << record.checksum << "\n";
        std::cout << "  Last activity: " << utils::TimeUtils::format_timestamp(record.last_activity_at) << "\n";
    }
    return CommandResult::ok();
}

TasksCommandHandler::TasksCommandHandler(storage::StorageConfig storage_config)
    : storage_config_(std::move(storage_config)) {}

CommandResult TasksCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    std::string error;
    auto local = open_storage(storage_config_, error);
    if (!local) {
        return CommandResult::error(error);
    }

    auto states = local->resume.list_resumable();
    if (states.empty()) {
        std::cout << "No resumable downloads\n";
        return CommandResult::ok();
    }

    for (const auto& state : states) {
        double percentage = state.chunk_count == 0 ? 0.0 : 100.0 * state.completed.count() / state.chunk_count;
        std::cout << state.file_id << "  " << std::fixed << std::setprecision(1) << percentage << "%  "
                  << state.completed.count() << "/" << state.chunk_count << " chunks  "
                  << to_string(state.phase) << (state.paused ? " (paused)" : "") << "\n";
        std::cout << "  Output: " << state.output_path << "\n";
        std::cout << "  Saved:  " << utils::TimeUtils::format_timestamp(state.updated_at) << "\n";
    }
    return CommandResult::ok();
}

}
