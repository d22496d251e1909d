#include "ssrflab/cli/app.hpp"
#include "ssrflab/core/logger.hpp"

#include <filesystem>

namespace ssrflab::cli {

App::App()
    : cli_("ssrflab", "DEVS legacy SSRF demo: public fetch proxy and internal debug service")
{
    cli_.set_version_flag("--version", SSRFLAB_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("SSRFLAB_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("LOG_LEVEL");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // Defaults, then the file, then the environment, then flags.
    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_));
    }
    apply_env_overrides(config_);
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }

    Logger::init("ssrflab", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Configuration loaded from: {}", config_path_);
    }

    if (!selected_) {
        return 1;
    }
    return selected_(config_);
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
    register_serve_command(cli_, overrides_, selected_);
    register_check_command(cli_, overrides_, selected_);
    register_config_command(cli_, selected_);
    register_version_command(cli_, selected_);
}

} // namespace ssrflab::cli
