#pragma once

#include "chunkswarm/storage/storage_config.hpp"
#include <string>
#include <vector>

namespace chunkswarm::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") { return {true, msg, 0}; }
    static CommandResult error(const std::string& msg, int code = 1) { return {false, msg, code}; }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs the tracker server and its sweeper until SIGINT/SIGTERM.
class TrackerCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the tracker server"; }
    std::string get_usage() const override { return "chunkswarm tracker [port]"; }
};

class GcCommandHandler : public CommandHandler {
public:
    explicit GcCommandHandler(storage::StorageConfig storage_config);
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Remove stale partial downloads and orphaned chunks"; }
    std::string get_usage() const override { return "chunkswarm gc"; }

private:
    storage::StorageConfig storage_config_;
};

class FilesCommandHandler : public CommandHandler {
public:
    explicit FilesCommandHandler(storage::StorageConfig storage_config);
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List files held locally"; }
    std::string get_usage() const override { return "chunkswarm files"; }

private:
    storage::StorageConfig storage_config_;
};

class TasksCommandHandler : public CommandHandler {
public:
    explicit TasksCommandHandler(storage::StorageConfig storage_config);
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List downloads that can be resumed"; }
    std::string get_usage() const override { return "chunkswarm tasks"; }

private:
    storage::StorageConfig storage_config_;
};

}
