#pragma once

#include "filejet/core/config.hpp"
#include "filejet/core/result.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace filejet::core {

constexpr const char* DEFAULT_CONFIG_FILE = "~/.filejet.conf";

// Everything argv can say. Options that were not given stay empty so the
// configuration file keeps its value.
struct CliOptions {
    bool help = false;
    bool version = false;
    bool verbose = false;
    std::string config_file = DEFAULT_CONFIG_FILE;
    std::optional<std::string> store;
    std::optional<std::string> session_id;
    std::optional<std::string> output_dir;
    
    // Command name followed by its arguments.
    std::vector<std::string> arguments;
    
    void apply_to(Config& config) const;
};

class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);
    
    Result parse(int argc, const char* const argv[]);
    const CliOptions& options() const { return options_; }
    
    void print_help(std::ostream& out) const;
    void print_version(std::ostream& out) const;
    
    static const char* version();

private:
    struct OptionSpec {
        char short_name;
        std::string long_name;
        std::string value_name;
        std::string description;
        std::function<Result(CliOptions&, const std::string&)> apply;
        
        bool takes_value() const { return !value_name.empty(); }
    };
    
    const OptionSpec* find(const std::string& long_name) const;
    const OptionSpec* find(char short_name) const;
    
    std::string program_name_;
    std::vector<OptionSpec> specs_;
    CliOptions options_;
};

} // namespace filejet::core
