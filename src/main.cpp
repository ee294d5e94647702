#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "mediaharvest/core/cli.hpp"
#include "mediaharvest/core/command_registry.hpp"
#include "mediaharvest/core/config.hpp"
#include "mediaharvest/core/logger.hpp"

int main(int argc, char* argv[]) {
    mediaharvest::core::CommandLineParser parser("mediaharvest");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        mediaharvest::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = mediaharvest::core::Config::instance();
    config.set_defaults();
    
    std::string config_file = parser.get_option("config", "mediaharvest.conf");
    if (std::filesystem::exists(config_file)) {
        auto loaded = config.load_from_file(config_file);
        if (!loaded) {
            std::cerr << "Warning: " << loaded.message << "\n";
        }
    }
    config.apply_environment();
    // Command-line flags win over the config file and the environment.
    parser.apply_to(config);
    
    auto log_level = mediaharvest::core::log_level_from_string(config.get_string("log.level", "info"));
    mediaharvest::core::Logger::initialize(config.get_string("log.file", "mediaharvest.log"), log_level);
    
    mediaharvest::core::CommandRegistry command_registry;
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        mediaharvest::core::Logger::shutdown();
        return 0;
    }
    
    std::string command = args[0];
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    mediaharvest::core::Logger::shutdown();
    return result.exit_code;
}
