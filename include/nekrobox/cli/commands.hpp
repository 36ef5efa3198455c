#pragma once

#include <CLI/CLI.hpp>

#include "nekrobox/core/config.hpp"

namespace nekrobox::cli {

/// Register the `run` subcommand.
/// Executes one instruction in a sandbox session and prints the task result.
void register_run_command(CLI::App& app, Config& config);

/// Register the `workflow` subcommand.
/// Executes instructions in sequence in one session, threading variables.
void register_workflow_command(CLI::App& app, Config& config);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, Config& config);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace nekrobox::cli
