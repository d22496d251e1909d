#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <CLI/CLI.hpp>

#include "ssrflab/core/config.hpp"

namespace ssrflab::cli {

/// Deferred body of a subcommand; runs once the configuration is final.
/// Returns the process exit code.
using Command = std::function<int(Config&)>;

/// Values captured from subcommand options that override the configuration.
struct CommandOverrides {
    uint16_t port = 0;
    std::string bind;
    std::string check_url;
};

/// Register the `serve` subcommand.
/// Starts the public app and the loopback-only internal debug service.
void register_serve_command(CLI::App& app, CommandOverrides& overrides, Command& selected);

/// Register the `check` subcommand.
/// Runs the fetch validation policy on one URL and prints the decision.
void register_check_command(CLI::App& app, CommandOverrides& overrides, Command& selected);

/// Register the `config` subcommand.
/// Prints the effective configuration with the secret redacted.
void register_config_command(CLI::App& app, Command& selected);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app, Command& selected);

/// Exit code of `check` for a verdict: 0 allowed, 1 forbidden, 2 unsupported scheme.
auto check_exit_code(Verdict verdict) -> int;

} // namespace ssrflab::cli
