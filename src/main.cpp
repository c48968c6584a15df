#include <iostream>
#include <string>
#include <vector>
#include "filejet/core/logger.hpp"
#include "filejet/core/config.hpp"
#include "filejet/core/cli.hpp"
#include "filejet/core/utils.hpp"
#include "filejet/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    filejet::core::CommandLineParser parser("filejet");
    auto commands = filejet::core::CommandRegistry::with_builtin_commands();
    
    auto parsed = parser.parse(argc, argv);
    if (!parsed.success()) {
        std::cerr << "Error: " << parsed.message << "\n\n";
        parser.print_help(std::cerr);
        return 2;
    }
    
    const auto& options = parser.options();
    if (options.version && !options.help) {
        parser.print_version(std::cout);
        return 0;
    }
    
    if (options.help || options.arguments.empty()) {
        parser.print_help(std::cout);
        commands.print_help(std::cout);
        return 0;
    }
    
    auto& config = filejet::core::Config::instance();
    config.set_defaults();
    
    auto config_file = filejet::core::utils::FileUtils::expand_home(options.config_file);
    filejet::core::Result loaded;
    if (filejet::core::utils::FileUtils::exists(config_file)) {
        loaded = config.load_from_file(config_file.string());
    }
    
    options.apply_to(config);
    
    auto log_level = filejet::core::Logger::parse_level(config.get_string("log.level", "info"),
                                                        filejet::core::LogLevel::Info);
    filejet::core::Logger::initialize(config.get_string("log.file", "filejet.log"), log_level);
    
    LOG_INFO("FileJet {} starting up", filejet::core::CommandLineParser::version());
    if (!loaded.success()) {
        LOG_WARN("{}, using defaults", loaded.message);
    }
    
    auto result = commands.dispatch(options.arguments);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!commands.has_command(options.arguments[0])) {
            commands.print_help(std::cerr);
        }
    }
    
    filejet::core::Logger::shutdown();
    return result.exit_code;
}
