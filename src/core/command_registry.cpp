#include "chunkswarm/core/command_registry.hpp"
#include "chunkswarm/core/logger.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace chunkswarm::core {

CommandRegistry::CommandRegistry(const storage::StorageConfig& storage_config) {
    register_command("tracker", std::make_unique<TrackerCommandHandler>());
    register_command("gc", std::make_unique<GcCommandHandler>(storage_config));
    register_command("files", std::make_unique<FilesCommandHandler>(storage_config));
    register_command("tasks", std::make_unique<TasksCommandHandler>(storage_config));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command + " (see --help)");
    }

    LOG_DEBUG("Running command '{}' with {} argument(s)", command, args.size() > 0 ? args.size() - 1 : 0);
    try {
        return it->second->execute(args);
    } catch (const std::filesystem::filesystem_error& e) {
        // Data directory problems surface here rather than as a crash.
        LOG_ERROR("Command '{}' failed on {}: {}", command, e.path1().string(), e.what());
        return CommandResult::error(std::string("Filesystem error: ") + e.code().message());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
                  << "  " << std::setw(10) << "" << "usage: " << handler->get_usage() << "\n";
    }
}

}
