#include "ssrflab/cli/commands.hpp"
#include "ssrflab/core/logger.hpp"
#include "ssrflab/core/secret.hpp"
#include "ssrflab/core/utils.hpp"

#include <csignal>
#include <iostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "ssrflab/gateway/internal_service.hpp"
#include "ssrflab/gateway/public_gateway.hpp"
#include "ssrflab/infra/fetch_guard.hpp"
#include "ssrflab/infra/ports.hpp"

namespace ssrflab::cli {

auto check_exit_code(Verdict verdict) -> int {
    switch (verdict) {
        case Verdict::Allowed: return 0;
        case Verdict::Forbidden: return 1;
        case Verdict::UnsupportedScheme: return 2;
    }
    return 2;
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

namespace {

auto run_serve(Config& config) -> int {
    LOG_INFO("Starting ssrflab {}", SSRFLAB_VERSION_STRING);
    if (config.flag == kDefaultFlag) {
        LOG_WARN("FLAG not set, the internal service uses the placeholder secret");
    }

    // Set up the Boost.Asio io_context and signal handling.
    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

    signals.async_wait([&ioc](auto ec, auto /*sig*/) {
        if (!ec) {
            LOG_INFO("Received shutdown signal");
            ioc.stop();
        }
    });

    if (!infra::is_port_available(kInternalPort)) {
        LOG_WARN("Port {} already appears to be in use on loopback", kInternalPort);
    }

    // The secret goes to the internal service only.
    gateway::InternalService internal(ioc, Secret(config.flag));
    auto internal_ep = internal.listen();
    if (!internal_ep) {
        LOG_ERROR("Internal debug service failed to start: {}", internal_ep.error().what());
        return 1;
    }

    gateway::PublicGateway app(ioc, config.public_listener, config.fetch);
    auto public_ep = app.listen();
    if (!public_ep) {
        LOG_ERROR("Public app failed to start: {}", public_ep.error().what());
        return 1;
    }

    boost::asio::co_spawn(ioc, internal.run(), boost::asio::detached);
    boost::asio::co_spawn(ioc, app.run(), boost::asio::detached);

    LOG_INFO("Endpoints: /api/fetch?url=<url>    (naive protection)");
    ioc.run();

    LOG_INFO("Stopped.");
    Logger::flush();
    return 0;
}

} // anonymous namespace

void register_serve_command(CLI::App& app, CommandOverrides& overrides, Command& selected) {
    auto* sub = app.add_subcommand("serve", "Start the public app and the internal debug service");

    sub->add_option("-p,--port", overrides.port, "Public listen port (overrides config)")
        ->check(CLI::Range(1, 65535));

    sub->add_option("-b,--bind", overrides.bind, "Public bind mode: loopback or all")
        ->check(CLI::IsMember({"loopback", "all"}));

    sub->callback([&overrides, &selected]() {
        selected = [&overrides](Config& config) -> int {
            if (overrides.port != 0) {
                config.public_listener.port = overrides.port;
            }
            if (!overrides.bind.empty()) {
                config.public_listener.bind =
                    (overrides.bind == "all") ? BindMode::All : BindMode::Loopback;
            }
            return run_serve(config);
        };
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, CommandOverrides& overrides, Command& selected) {
    auto* sub = app.add_subcommand("check", "Run the fetch validation policy on a URL");

    sub->add_option("url", overrides.check_url, "Candidate URL")
        ->required();

    sub->callback([&overrides, &selected]() {
        selected = [&overrides](Config& /*config*/) -> int {
            auto url = utils::trim(overrides.check_url);
            auto decision = infra::FetchGuard::validate(url);
            nlohmann::json out = {
                {"url", url},
                {"verdict", decision.verdict},
            };
            if (decision.reason) {
                out["reason"] = *decision.reason;
            }
            std::cout << out.dump(2) << std::endl;
            return check_exit_code(decision.verdict);
        };
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, Command& selected) {
    auto* sub = app.add_subcommand("config", "Show the effective configuration");

    sub->callback([&selected]() {
        selected = [](Config& config) -> int {
            json j = config;
            redact_config_json(j);
            j["internal_listener"] = {
                {"address", kInternalAddress},
                {"port", kInternalPort},
            };
            std::cout << j.dump(2) << std::endl;
            return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, Command& selected) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&selected]() {
        selected = [](Config& /*config*/) -> int {
            std::cout << "ssrflab " << SSRFLAB_VERSION_STRING << std::endl;
            return 0;
        };
    });
}

} // namespace ssrflab::cli
