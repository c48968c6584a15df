#pragma once

#include "filejet/core/command_handler.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace filejet::core {

class CommandRegistry {
public:
    CommandRegistry() = default;
    
    // id, receive, send and save-config.
    static CommandRegistry with_builtin_commands();
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    // arguments[0] names the command. The argument count is checked against the
    // handler's arity before it runs.
    CommandResult dispatch(const std::vector<std::string>& arguments);
    
    bool has_command(const std::string& command) const;
    void print_help(std::ostream& out) const;

private:
    CommandHandler* find(const std::string& command) const;
    
    std::vector<std::pair<std::string, std::unique_ptr<CommandHandler>>> handlers_;
};

} // namespace filejet::core
