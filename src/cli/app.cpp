#include "nekrobox/cli/app.hpp"
#include "nekrobox/cli/commands.hpp"
#include "nekrobox/core/logger.hpp"

#include <filesystem>

#ifndef NEKROBOX_VERSION_STRING
#define NEKROBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace nekrobox::cli {

App::App()
    : cli_("nekrobox", "Sandboxed task execution for chat agents")
{
    cli_.set_version_flag("--version", NEKROBOX_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("NEKROBOX_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (" + Logger::level_names() + ")")
        ->check(CLI::Validator(
            [](std::string& value) -> std::string {
                if (Logger::parse_level(value)) return {};
                return "Unknown log level '" + value + "', expected one of: " +
                       Logger::level_names();
            },
            "LEVEL"));

    cli_.require_subcommand(1);

    // The main app's parse-complete callback runs before any subcommand
    // callback, so commands always see the resolved configuration.
    cli_.parse_complete_callback([this]() { apply_global_options(); });

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_run_command(cli_, config_);
    register_workflow_command(cli_, config_);
    register_config_command(cli_, config_);
    register_version_command(cli_);
}

void App::apply_global_options() {
    config_ = config_path_.empty()
        ? load_config_from_env()
        : load_config(std::filesystem::path(config_path_));

    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }

    Logger::init("nekrobox", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }
}

} // namespace nekrobox::cli
