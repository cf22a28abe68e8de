#include "partvault/core/command_handler.hpp"
#include "partvault/core/logger.hpp"
#include "partvault/core/utils.hpp"
#include "partvault/transfer/download_manager.hpp"
#include "partvault/transfer/job_dispatcher.hpp"
#include "partvault/transfer/job_queue.hpp"
#include "partvault/transfer/upload_manager.hpp"
#include "partvault/transport/telegram_transport.hpp"
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <mutex>
#include <thread>

namespace partvault::core {

namespace {

bool cancelled(const transfer::CancellationToken* cancel) {
    return cancel && cancel->is_cancelled();
}

} // namespace

CommandResult CommandResult::from_transfer(const transfer::TransferResult& result) {
    if (result.success()) {
        return ok(result.message);
    }
    if (result.is_cancelled()) {
        return error("Cancelled", EXIT_CANCELLED);
    }
    return error(result.describe());
}

CommandContext CommandContext::from_config(Config& config, transfer::CancellationToken& cancel) {
    transport::TelegramTimeouts timeouts;
    timeouts.upload = std::chrono::seconds(config.get_int("transport.upload_timeout_s", 90));
    timeouts.metadata = std::chrono::seconds(config.get_int("transport.metadata_timeout_s", 20));
    timeouts.fetch = std::chrono::seconds(config.get_int("transport.fetch_timeout_s", 120));

    CommandContext context;
    context.config = &config;
    context.cancel = &cancel;
    context.transport_factory = transport::TelegramTransport::factory(timeouts);
    return context;
}

storage::StorageConfig CommandContext::storage_config() const {
    return storage::StorageConfig::from_config(*config);
}

std::shared_ptr<storage::ProgressStore> CommandContext::progress_store() const {
    return std::make_shared<storage::ProgressStore>(storage_config().get_progress_store_path());
}

transport::TransportCredentials CommandContext::credentials() const {
    transport::TransportCredentials credentials;
    credentials.bot_token = config->get_string("transport.bot_token");
    credentials.api_host = config->get_string("transport.api_host", "api.telegram.org");
    return credentials;
}

std::string CommandContext::destination_chat() const {
    return config->get_string("transport.chat_id");
}

// UploadCommandHandler Implementation
UploadCommandHandler::UploadCommandHandler(std::shared_ptr<CommandContext> context)
    : context_(std::move(context)) {
}

CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto storage = context_->storage_config();
    if (!storage.validate()) {
        return CommandResult::error("Invalid storage settings (owner.id, storage.*, transfer.chunk_size)");
    }

    auto credentials = context_->credentials();
    if (credentials.bot_token.empty()) {
        return CommandResult::error("transport.bot_token is not configured");
    }

    auto chat = context_->destination_chat();
    if (chat.empty()) {
        return CommandResult::error("transport.chat_id is not configured");
    }

    auto& out = *context_->output;
    transfer::UploadManager manager(context_->progress_store(),
                                    context_->transport_factory,
                                    transfer::UploadOptions::from_config(*context_->config),
                                    context_->sleeper);

    bool reported = false;
    manager.set_progress_callback([&out, &reported](std::uint32_t done, std::uint32_t total) {
        out << "\r  Uploaded " << done << "/" << total << " parts" << std::flush;
        reported = true;
    });

    std::filesystem::path source = args[1];
    out << "Uploading " << source.filename().string() << "\n";

    auto result = manager.upload(credentials, chat, source, context_->cancel);
    if (reported) {
        out << "\n";
    }

    if (result.success()) {
        out << "Upload complete\n";
    }
    return CommandResult::from_transfer(result);
}

// DownloadCommandHandler Implementation
DownloadCommandHandler::DownloadCommandHandler(std::shared_ptr<CommandContext> context)
    : context_(std::move(context)) {
}

CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto storage = context_->storage_config();
    auto credentials = context_->credentials();
    if (credentials.bot_token.empty()) {
        return CommandResult::error("transport.bot_token is not configured");
    }

    const auto& filename = args[1];
    std::filesystem::path destination = args.size() > 2 ? std::filesystem::path(args[2])
                                                        : storage.download_directory;

    auto manifest = context_->progress_store()->load(filename);
    if (!manifest) {
        return CommandResult::error("No upload record for '" + filename + "'");
    }

    if (!core::utils::FileUtils::create_directories(destination)) {
        return CommandResult::error("Cannot create " + destination.string());
    }
    if (!storage.has_sufficient_space(destination, manifest->file_size_bytes)) {
        LOG_WARN("Free space in {} may not be enough for {}", destination.string(),
                 utils::StringUtils::format_bytes(manifest->file_size_bytes));
    }

    auto& out = *context_->output;
    transfer::DownloadManager manager(context_->transport_factory,
                                      transfer::DownloadOptions::from_config(*context_->config),
                                      context_->sleeper);

    std::mutex output_mutex;
    manager.set_progress_callback([&out, &output_mutex](std::uint32_t done, std::uint32_t total) {
        std::lock_guard<std::mutex> lock(output_mutex);
        out << "\r  Fetched " << done << "/" << total << " parts" << std::flush;
    });

    out << "Downloading " << filename << " ("
        << utils::StringUtils::format_bytes(manifest->file_size_bytes) << ")\n";

    auto result = manager.download(credentials, *manifest, destination, context_->cancel);
    if (manifest->total_parts > 0) {
        out << "\n";
    }

    if (result.success()) {
        out << "Saved to " << result.message << "\n";
    }
    return CommandResult::from_transfer(result);
}

// ListCommandHandler Implementation
ListCommandHandler::ListCommandHandler(std::shared_ptr<CommandContext> context)
    : context_(std::move(context)) {
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    auto manifests = context_->progress_store()->list();
    auto& out = *context_->output;

    if (manifests.empty()) {
        out << "No uploads recorded.\n";
        return CommandResult::ok();
    }

    std::sort(manifests.begin(), manifests.end(),
              [](const storage::TransferManifest& a, const storage::TransferManifest& b) {
                  return a.filename < b.filename;
              });

    out << std::left << std::setw(40) << "NAME" << std::setw(14) << "SIZE"
        << std::setw(12) << "PARTS" << "STATE\n";

    for (const auto& manifest : manifests) {
        std::string parts = std::to_string(manifest.recorded_parts()) + "/" +
                            std::to_string(manifest.total_parts);
        out << std::left << std::setw(40) << manifest.filename
            << std::setw(14) << utils::StringUtils::format_bytes(manifest.file_size_bytes)
            << std::setw(12) << parts
            << (manifest.is_complete() ? "complete" : "partial") << "\n";
    }

    return CommandResult::ok();
}

// InfoCommandHandler Implementation
InfoCommandHandler::InfoCommandHandler(std::shared_ptr<CommandContext> context)
    : context_(std::move(context)) {
}

CommandResult InfoCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto manifest = context_->progress_store()->load(args[1]);
    if (!manifest) {
        return CommandResult::error("No upload record for '" + args[1] + "'");
    }

    auto& out = *context_->output;
    out << "File:       " << manifest->filename << "\n";
    out << "Size:       " << manifest->file_size_bytes << " bytes ("
        << utils::StringUtils::format_bytes(manifest->file_size_bytes) << ")\n";
    out << "Chunk size: " << manifest->chunk_size << " bytes\n";
    out << "Parts:      " << manifest->recorded_parts() << "/" << manifest->total_parts
        << " (" << std::fixed << std::setprecision(1) << manifest->progress() * 100.0 << "%)\n";
    out << "State:      " << (manifest->is_complete() ? "complete" : "partial") << "\n";

    for (size_t i = 0; i < manifest->parts.size(); ++i) {
        const auto& part = manifest->parts[i];
        out << "  " << storage::ChunkManager::get_part_name(manifest->filename, static_cast<std::uint32_t>(i))
            << "  message " << part.message_id;
        if (!part.content_hash.empty()) {
            out << "  " << part.content_hash.substr(0, 16);
        }
        out << "\n";
    }

    return CommandResult::ok();
}

// ForgetCommandHandler Implementation
ForgetCommandHandler::ForgetCommandHandler(std::shared_ptr<CommandContext> context)
    : context_(std::move(context)) {
}

CommandResult ForgetCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto result = context_->progress_store()->remove(args[1]);
    if (!result) {
        return CommandResult::error(result.message);
    }

    *context_->output << "Forgot " << args[1] << "\n";
    return CommandResult::ok();
}

// AgentCommandHandler Implementation
AgentCommandHandler::AgentCommandHandler(std::shared_ptr<CommandContext> context)
    : context_(std::move(context)) {
}

CommandResult AgentCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    auto storage = context_->storage_config();
    if (!storage.validate()) {
        return CommandResult::error("Invalid storage settings (owner.id, storage.*, transfer.chunk_size)");
    }

    auto store = context_->progress_store();
    auto uploader = std::make_shared<transfer::UploadManager>(
        store, context_->transport_factory,
        transfer::UploadOptions::from_config(*context_->config), context_->sleeper);
    auto downloader = std::make_shared<transfer::DownloadManager>(
        context_->transport_factory,
        transfer::DownloadOptions::from_config(*context_->config), context_->sleeper);

    transfer::DispatchSettings settings;
    settings.owner_id = storage.owner_id;
    settings.credentials = context_->credentials();
    settings.destination_chat = context_->destination_chat();
    settings.download_directory = storage.download_directory;

    transfer::JobDispatcher dispatcher(settings, store, uploader, downloader, context_->cancel);
    transfer::JobQueue queue;
    std::atomic<size_t> failures{0};
    auto& out = *context_->output;

    std::thread worker([&]() {
        dispatcher.run(queue, [&](const transfer::TransferJob& job, const transfer::TransferResult& result) {
            if (!result.success()) {
                failures++;
            }
            out << job.descriptor.filename << ": " << result.describe() << "\n" << std::flush;
        });
    });

    LOG_INFO("Agent waiting for jobs");

    std::string line;
    while (!cancelled(context_->cancel) && std::getline(*context_->input, line)) {
        line = utils::StringUtils::trim(line);
        if (line.empty()) {
            continue;
        }

        auto descriptor = transfer::JobDescriptor::parse(line);
        if (!descriptor) {
            LOG_WARN("Ignoring malformed job descriptor: {}", line);
            continue;
        }

        queue.push(std::move(*descriptor));
    }

    queue.close();
    worker.join();

    if (cancelled(context_->cancel)) {
        return CommandResult::error("Cancelled", EXIT_CANCELLED);
    }
    if (failures > 0) {
        return CommandResult::error(std::to_string(failures.load()) + " job(s) failed");
    }
    return CommandResult::ok();
}

} // namespace partvault::core
