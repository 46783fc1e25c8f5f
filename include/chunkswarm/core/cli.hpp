#pragma once

#include <map>
#include <string>
#include <vector>

namespace chunkswarm::core {

// Global options come before the command word; everything from the first
// positional argument (or after "--") is handed to the command untouched.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    // Each returns false and sets error_ on a bad token. `next` is advanced
    // when the option consumes the following argument as its value.
    bool parse_long(const std::string& token, int argc, char* argv[], int& next);
    bool parse_short(const std::string& token, int argc, char* argv[], int& next);

    const Option* find(const std::string& name) const;
    std::string resolve(const std::string& name) const;

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> aliases_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
