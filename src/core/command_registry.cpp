#include "filejet/core/command_registry.hpp"
#include <ostream>

namespace filejet::core {

CommandRegistry CommandRegistry::with_builtin_commands() {
    CommandRegistry registry;
    registry.register_command("id", std::make_unique<IdCommandHandler>());
    registry.register_command("receive", std::make_unique<ReceiveCommandHandler>());
    registry.register_command("send", std::make_unique<SendCommandHandler>());
    registry.register_command("save-config", std::make_unique<SaveConfigCommandHandler>());
    return registry;
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    for (auto& entry : handlers_) {
        if (entry.first == name) {
            entry.second = std::move(handler);
            return;
        }
    }
    handlers_.emplace_back(name, std::move(handler));
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    for (const auto& [name, handler] : handlers_) {
        if (name == command) {
            return handler.get();
        }
    }
    return nullptr;
}

CommandResult CommandRegistry::dispatch(const std::vector<std::string>& arguments) {
    if (arguments.empty()) {
        return CommandResult::error("No command given");
    }
    
    auto* handler = find(arguments[0]);
    if (!handler) {
        return CommandResult::error("Unknown command: " + arguments[0], 2);
    }
    
    if (arguments.size() - 1 != handler->arity()) {
        return CommandResult::error("Usage: " + handler->get_usage(), 2);
    }
    
    return handler->execute(arguments);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find(command) != nullptr;
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        out << "  " << name << "\n"
            << "      " << handler->get_description() << "\n"
            << "      usage: " << handler->get_usage() << "\n";
    }
}

} // namespace filejet::core
