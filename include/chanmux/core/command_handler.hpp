#pragma once

#include <string>
#include <vector>

namespace chanmux::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }
    
    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Sends a file over TCP. Reads control.host, control.port, transfer.channels,
// transfer.chunk_size, transfer.resubmission_timeout_ms and data.address.
class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file to a waiting receiver"; }
    std::string get_usage() const override { return "chanmux send <file>"; }
};

// Receives one file into a directory. Reads control.host, control.port and
// transfer.channels.
class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for one transfer and write it to a directory"; }
    std::string get_usage() const override { return "chanmux receive <directory>"; }
};

}
