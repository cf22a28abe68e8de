#include "partvault/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace partvault::core {

CommandRegistry::CommandRegistry(std::shared_ptr<CommandContext> context) {
    register_command("upload", std::make_unique<UploadCommandHandler>(context));
    register_command("download", std::make_unique<DownloadCommandHandler>(context));
    register_command("list", std::make_unique<ListCommandHandler>(context));
    register_command("info", std::make_unique<InfoCommandHandler>(context));
    register_command("forget", std::make_unique<ForgetCommandHandler>(context));
    register_command("agent", std::make_unique<AgentCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(12) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(12) << " "
                  << "Usage: partvault " << handler->get_usage() << "\n";
    }
}

} // namespace partvault::core
