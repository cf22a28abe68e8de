#pragma once

#include "config.hpp"
#include "../storage/progress_store.hpp"
#include "../storage/storage_config.hpp"
#include "../transfer/retry_policy.hpp"
#include "../transfer/transfer_types.hpp"
#include "../transport/part_transport.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace partvault::core {

constexpr int EXIT_CANCELLED = 130;

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

    static CommandResult from_transfer(const transfer::TransferResult& result);
};

// Everything a command needs from the process: settings, the shared
// cancellation flag, the transport to use and where to talk to the user
struct CommandContext {
    Config* config = &Config::instance();
    transfer::CancellationToken* cancel = nullptr;
    transport::TransportFactory transport_factory;
    transfer::Sleeper sleeper = transfer::real_sleeper();
    std::istream* input = &std::cin;
    std::ostream* output = &std::cout;

    // Telegram transport with timeouts from config
    static CommandContext from_config(Config& config, transfer::CancellationToken& cancel);

    storage::StorageConfig storage_config() const;
    std::shared_ptr<storage::ProgressStore> progress_store() const;
    transport::TransportCredentials credentials() const;
    std::string destination_chat() const;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class UploadCommandHandler : public CommandHandler {
public:
    explicit UploadCommandHandler(std::shared_ptr<CommandContext> context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a file to the configured channel"; }
    std::string get_usage() const override { return "upload <path>"; }

private:
    std::shared_ptr<CommandContext> context_;
};

class DownloadCommandHandler : public CommandHandler {
public:
    explicit DownloadCommandHandler(std::shared_ptr<CommandContext> context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download a completely uploaded file"; }
    std::string get_usage() const override { return "download <filename> [destination_dir]"; }

private:
    std::shared_ptr<CommandContext> context_;
};

class ListCommandHandler : public CommandHandler {
public:
    explicit ListCommandHandler(std::shared_ptr<CommandContext> context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List recorded uploads"; }
    std::string get_usage() const override { return "list"; }

private:
    std::shared_ptr<CommandContext> context_;
};

class InfoCommandHandler : public CommandHandler {
public:
    explicit InfoCommandHandler(std::shared_ptr<CommandContext> context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the upload record of one file"; }
    std::string get_usage() const override { return "info <filename>"; }

private:
    std::shared_ptr<CommandContext> context_;
};

class ForgetCommandHandler : public CommandHandler {
public:
    explicit ForgetCommandHandler(std::shared_ptr<CommandContext> context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Remove the upload record of one file"; }
    std::string get_usage() const override { return "forget <filename>"; }

private:
    std::shared_ptr<CommandContext> context_;
};

// Reads job descriptors, one JSON object per line, until end of input
class AgentCommandHandler : public CommandHandler {
public:
    explicit AgentCommandHandler(std::shared_ptr<CommandContext> context);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run jobs read from standard input"; }
    std::string get_usage() const override { return "agent"; }

private:
    std::shared_ptr<CommandContext> context_;
};

} // namespace partvault::core
