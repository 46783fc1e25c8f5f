#include "chunkswarm/core/cli.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>

namespace chunkswarm::core {

namespace {

constexpr const char* VERSION = "0.3.0";

}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.chunkswarm.conf");
    add_option("d", "data-dir", "Storage base directory", true);
    add_option("", "verbose", "Enable verbose logging");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    // Options without a long form are stored under their short name.
    const std::string key = long_name.empty() ? short_name : long_name;
    if (key.empty()) {
        return;
    }
    options_[key] = Option{short_name, description, has_value, default_value};
    if (!short_name.empty()) {
        aliases_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    values_.clear();
    error_.clear();

    int next = 1;
    while (next < argc) {
        std::string token = argv[next++];

        if (token == "--") {
            break;
        }
        if (token.size() > 2 && token.starts_with("--")) {
            if (!parse_long(token, argc, argv, next)) {
                return false;
            }
            continue;
        }
        if (token.size() > 1 && token[0] == '-') {
            if (!parse_short(token, argc, argv, next)) {
                return false;
            }
            continue;
        }

        // The command word: the rest belongs to the command.
        positional_args_.push_back(std::move(token));
        break;
    }

    for (; next < argc; ++next) {
        positional_args_.emplace_back(argv[next]);
    }
    return true;
}

bool CommandLineParser::parse_long(const std::string& token, int argc, char* argv[], int& next) {
    auto eq = token.find('=');
    std::string name = token.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);

    auto it = options_.find(name);
    if (it == options_.end()) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (!it->second.has_value) {
        if (eq != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        values_[name] = "true";
        return true;
    }

    if (eq != std::string::npos) {
        values_[name] = token.substr(eq + 1);
    } else if (next < argc) {
        values_[name] = argv[next++];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse_short(const std::string& token, int argc, char* argv[], int& next) {
    // Flags may be clustered (-hv); a value-taking option ends the cluster
    // and takes the remainder or the next argument.
    for (size_t pos = 1; pos < token.size(); ++pos) {
        std::string flag(1, token[pos]);
        auto alias = aliases_.find(flag);
        if (alias == aliases_.end()) {
            error_ = "Unknown option: -" + flag;
            return false;
        }

        const auto& name = alias->second;
        if (!options_.at(name).has_value) {
            values_[name] = "true";
            continue;
        }

        if (pos + 1 < token.size()) {
            values_[name] = token.substr(pos + 1);
        } else if (next < argc) {
            values_[name] = argv[next++];
        } else {
            error_ = "Option -" + flag + " requires a value";
            return false;
        }
        return true;
    }
    return true;
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    auto it = options_.find(resolve(name));
    return it == options_.end() ? nullptr : &it->second;
}

std::string CommandLineParser::resolve(const std::string& name) const {
    auto it = aliases_.find(name);
    return it == aliases_.end() ? name : it->second;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return values_.count(resolve(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto it = values_.find(resolve(name));
    if (it != values_.end()) {
        return it->second;
    }
    const auto* option = find(name);
    if (option && !option->default_value.empty()) {
        return option->default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    int parsed = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
        return default_value;
    }
    return parsed;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n"
              << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        if (name != option.short_name) {
            flags += "--" + name;
        }
        if (option.has_value) {
            flags += " <value>";
        }

        std::cout << "  " << std::left << std::setw(26) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " " << VERSION << "\n";
}

}
