#pragma once

#include "command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace partvault::core {

class CommandRegistry {
public:
    explicit CommandRegistry(std::shared_ptr<CommandContext> context);

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);

    // args[0] is the command name itself
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);

    bool has_command(const std::string& command) const;

    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

} // namespace partvault::core
