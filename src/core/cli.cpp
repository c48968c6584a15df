#include "filejet/core/cli.hpp"
#include "filejet/signaling/session_id.hpp"
#include <iomanip>
#include <ostream>
#include <utility>

namespace filejet::core {

namespace {
    Result flag(bool& target) {
        target = true;
        return Result();
    }
    
    Result non_empty(std::optional<std::string>& target, const std::string& option, const std::string& value) {
        if (value.empty()) {
            return Result(ErrorCode::INVALID_INPUT, "Option --" + option + " needs a non-empty value");
        }
        target = value;
        return Result();
    }
}

void CliOptions::apply_to(Config& config) const {
    if (store) {
        config.set("rendezvous.database", *store);
    }
    if (output_dir) {
        config.set("transfer.output_dir", *output_dir);
    }
    if (session_id) {
        config.set("node.id", *session_id);
    }
    if (verbose) {
        config.set("log.level", "debug");
    }
}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
    specs_ = {
        {'h', "help", "", "Show this help message",
         [](CliOptions& o, const std::string&) { return flag(o.help); }},
        {'v', "version", "", "Show version information",
         [](CliOptions& o, const std::string&) { return flag(o.version); }},
        {'c', "config", "file", std::string("Configuration file (default: ") + DEFAULT_CONFIG_FILE + ")",
         [](CliOptions& o, const std::string& value) {
             o.config_file = value;
             return Result();
         }},
        {'\0', "verbose", "", "Log at debug level",
         [](CliOptions& o, const std::string&) { return flag(o.verbose); }},
        {'\0', "store", "db", "Rendezvous database shared with the peer",
         [](CliOptions& o, const std::string& value) { return non_empty(o.store, "store", value); }},
        {'\0', "id", "session id", "Session id to listen on (6 digits)",
         [](CliOptions& o, const std::string& value) {
             auto valid = signaling::validate_session_id(value);
             if (!valid.success()) {
                 return Result(ErrorCode::INVALID_INPUT, "Option --id: " + valid.message);
             }
             o.session_id = value;
             return Result();
         }},
        {'\0', "output", "dir", "Directory received files are saved to",
         [](CliOptions& o, const std::string& value) { return non_empty(o.output_dir, "output", value); }},
    };
}

const CommandLineParser::OptionSpec* CommandLineParser::find(const std::string& long_name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == long_name) return &spec;
    }
    return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find(char short_name) const {
    for (const auto& spec : specs_) {
        if (spec.short_name != '\0' && spec.short_name == short_name) return &spec;
    }
    return nullptr;
}

Result CommandLineParser::parse(int argc, const char* const argv[]) {
    options_ = CliOptions{};
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        // Everything after the command belongs to it.
        if (!options_.arguments.empty() || arg == "-" || !arg.starts_with("-")) {
            options_.arguments.push_back(arg);
            continue;
        }
        
        const OptionSpec* spec = nullptr;
        std::optional<std::string> value;
        std::string shown = arg;
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            spec = find(name);
            shown = "--" + name;
            if (eq_pos != std::string::npos) {
                value = arg.substr(eq_pos + 1);
            }
        } else if (arg.size() == 2) {
            spec = find(arg[1]);
        }
        
        if (!spec) {
            return Result(ErrorCode::INVALID_INPUT, "Unknown option: " + shown);
        }
        
        if (spec->takes_value() && !value) {
            if (i + 1 >= argc) {
                return Result(ErrorCode::INVALID_INPUT, "Option " + shown + " requires a <" + spec->value_name + ">");
            }
            value = argv[++i];
        } else if (!spec->takes_value() && value) {
            return Result(ErrorCode::INVALID_INPUT, "Option " + shown + " takes no value");
        }
        
        auto applied = spec->apply(options_, value.value_or(""));
        if (!applied.success()) {
            return applied;
        }
    }
    
    return Result();
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";
    
    for (const auto& spec : specs_) {
        std::string name = spec.short_name != '\0' ? std::string("-") + spec.short_name + ", " : "    ";
        name += "--" + spec.long_name;
        if (spec.takes_value()) {
            name += " <" + spec.value_name + ">";
        }
        out << "  " << std::left << std::setw(26) << name << spec.description << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " " << version() << "\n";
}

const char* CommandLineParser::version() {
    return FILEJET_VERSION;
}

} // namespace filejet::core
