#pragma once

#include "chunkswarm/core/command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chunkswarm::core {

class CommandRegistry {
public:
    explicit CommandRegistry(const storage::StorageConfig& storage_config);

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
