#include <iostream>
#include <string>
#include <vector>
#include "chanmux/core/logger.hpp"
#include "chanmux/core/config.hpp"
#include "chanmux/core/cli.hpp"
#include "chanmux/core/utils.hpp"
#include "chanmux/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    chanmux::core::CommandLineParser parser("chanmux");
    chanmux::core::CommandRegistry command_registry;
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = chanmux::core::Config::instance();
    config.set_defaults();
    
    std::string config_file = parser.get_option("config", "chanmux.conf");
    if (chanmux::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: failed to read configuration file " << config_file << "\n";
            return 1;
        }
    } else if (parser.has_option("config")) {
        std::cerr << "Error: configuration file not found: " << config_file << "\n";
        return 1;
    }
    
    // Command line options override the configuration file
    const std::vector<std::pair<std::string, std::string>> overrides = {
        {"host", "control.host"},
        {"port", "control.port"},
        {"channels", "transfer.channels"},
        {"chunk-size", "transfer.chunk_size"},
        {"bind", "data.address"},
    };
    for (const auto& [option, key] : overrides) {
        if (parser.has_option(option)) {
            config.set(key, parser.get_option(option));
        }
    }
    
    auto log_level = parser.has_option("verbose") ? 
        chanmux::core::LogLevel::Debug :
        chanmux::core::Logger::parse_level(config.get_string("log.level", "info"));
    chanmux::core::Logger::initialize(config.get_string("log.file", "chanmux.log"), log_level);
    
    LOG_DEBUG("ChanMux starting up");
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        chanmux::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    chanmux::core::Logger::shutdown();
    return result.exit_code;
}
