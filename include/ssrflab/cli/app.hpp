#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "ssrflab/cli/commands.hpp"
#include "ssrflab/core/config.hpp"

namespace ssrflab::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, resolves the configuration
/// (defaults, optional JSON file, environment, flags) and then runs the
/// selected subcommand (serve, check, config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// Access the loaded configuration.
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    Config config_;
    CommandOverrides overrides_;
    std::string config_path_;
    std::string log_level_;
    Command selected_;
};

} // namespace ssrflab::cli
