#include "ssrflab/gateway/internal_service.hpp"

#include "ssrflab/core/logger.hpp"
#include "ssrflab/core/utils.hpp"

namespace ssrflab::gateway {

InternalService::InternalService(net::io_context& ioc, Secret secret, uint16_t port)
    : server_(ioc, "Internal debug service")
    , secret_(std::move(secret))
    , port_(port) {
    register_routes();
}

auto InternalService::flag_body(const Secret& secret) -> std::string {
    return "admin-secret: " + std::string(secret.value()) + "\n";
}

auto InternalService::info() -> json {
    return json{
        {"name", kName},
        {"uptime", utils::process_uptime_seconds()},
    };
}

void InternalService::register_routes() {
    server_.route(http::verb::get, "/internal/flag",
        [this](const Request& req) -> awaitable<Response> {
            co_return make_text_response(req, http::status::ok, flag_body(secret_));
        });

    server_.route(http::verb::get, "/internal/info",
        [](const Request& req) -> awaitable<Response> {
            co_return make_json_response(req, http::status::ok, info());
        });
}

auto InternalService::listen() -> Result<tcp::endpoint> {
    auto endpoint = server_.listen(kInternalAddress, port_);
    if (!endpoint) {
        return endpoint;
    }

    if (!endpoint->address().is_loopback()) {
        server_.stop();
        return std::unexpected(
            make_error(ErrorCode::Forbidden,
                       "Internal service must only listen on loopback",
                       endpoint->address().to_string()));
    }
    return endpoint;
}

auto InternalService::run() -> awaitable<void> {
    co_await server_.run();
}

void InternalService::stop() {
    server_.stop();
}

} // namespace ssrflab::gateway
