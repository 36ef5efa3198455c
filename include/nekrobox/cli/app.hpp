#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "nekrobox/core/config.hpp"

namespace nekrobox::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, resolves the effective
/// configuration (environment, then config file, then --log-level) and
/// dispatches to the registered subcommands (run, workflow, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    /// Runs once parsing is complete, before any subcommand callback.
    void apply_global_options();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
};

} // namespace nekrobox::cli
