#include "mediaharvest/core/command_registry.hpp"
#include "mediaharvest/core/logger.hpp"
#include <iomanip>
#include <iostream>

namespace mediaharvest::core {

CommandRegistry::CommandRegistry() {
    register_command("fetch", std::make_unique<FetchCommandHandler>());
    register_command("retry", std::make_unique<RetryCommandHandler>());
    register_command("export", std::make_unique<ExportCommandHandler>());
    register_command("mark-html", std::make_unique<MarkHtmlCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    LOG_DEBUG("Executing command '{}' with {} argument(s)", command, args.size() > 0 ? args.size() - 1 : 0);
    try {
        return it->second->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' failed: {}", command, e.what());
        return CommandResult::error(command + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(12) << name << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(12) << " " << handler->get_usage() << "\n";
    }
}

} // namespace mediaharvest::core
