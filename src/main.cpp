#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "partvault/core/logger.hpp"
#include "partvault/core/config.hpp"
#include "partvault/core/cli.hpp"
#include "partvault/core/utils.hpp"
#include "partvault/core/command_registry.hpp"
#include "partvault/crypto/hash.hpp"

namespace {

partvault::transfer::CancellationToken g_cancel;

extern "C" void signal_handler(int /*signum*/) {
    g_cancel.cancel();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace partvault;

    core::CommandLineParser parser("partvault");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        core::CommandRegistry(std::make_shared<core::CommandContext>()).print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    config.set_defaults();

    auto config_file = core::utils::FileUtils::expand_user(parser.get_option("config", "~/.partvault.conf"));
    if (core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Error: cannot read " << config_file.string() << "\n";
        return 1;
    }

    for (const auto& [key, value] : parser.get_overrides()) {
        config.set(key, value);
    }

    auto log_level = core::Logger::parse_level(
        parser.get_option("log-level", config.get_string("log.level", "info")));
    if (parser.has_option("verbose")) {
        log_level = core::LogLevel::Debug;
    }
    core::Logger::initialize(config.get_string("log.file", "partvault.log"), log_level);

    if (!crypto::ensure_sodium_initialized()) {
        LOG_CRITICAL("libsodium failed to initialize");
        core::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto context = std::make_shared<core::CommandContext>(core::CommandContext::from_config(config, g_cancel));
    core::CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        core::Logger::shutdown();
        return 0;
    }

    const std::string& command = args[0];
    LOG_DEBUG("Running command '{}'", command);

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    }

    core::Logger::shutdown();
    return result.exit_code;
}
