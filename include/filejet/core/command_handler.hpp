#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace filejet::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
    
    // Arguments expected after the command name.
    virtual std::size_t arity() const { return 0; }
};

class IdCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print a new random session id"; }
    std::string get_usage() const override { return "filejet id"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for a peer and receive one file"; }
    std::string get_usage() const override { return "filejet [--id <session id>] [--output <dir>] receive"; }
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Connect to a peer and send a file"; }
    std::string get_usage() const override { return "filejet send <recipient-id> <file>"; }
    std::size_t arity() const override { return 2; }
};

class SaveConfigCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Write the effective configuration to a file"; }
    std::string get_usage() const override { return "filejet [options] save-config <file>"; }
    std::size_t arity() const override { return 1; }
};

} // namespace filejet::core
