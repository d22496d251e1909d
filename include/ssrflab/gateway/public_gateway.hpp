#pragma once

#include <optional>
#include <string>

#include "ssrflab/core/config.hpp"
#include "ssrflab/gateway/http_server.hpp"
#include "ssrflab/gateway/static_files.hpp"
#include "ssrflab/infra/fetcher.hpp"

namespace ssrflab::gateway {

/// Status and JSON body produced by the fetch endpoint.
struct FetchReply {
    int status = 200;
    json body;
};

/// The public listener: /api/fetch, /api/info, /api/health and static files.
///
/// Built from the public and fetch sections of the configuration only; it
/// never holds the internal secret.
class PublicGateway {
public:
    PublicGateway(net::io_context& ioc, PublicConfig listener, FetchConfig fetch);

    /// Binds according to the listener config (port 0 allowed).
    auto listen() -> Result<tcp::endpoint>;
    auto run() -> awaitable<void>;
    void stop();

    /// /api/fetch logic for the raw `url` query value (nullopt when absent):
    /// trim, validate, fetch only if allowed, shape the reply.
    auto handle_fetch(std::optional<std::string> url_param) -> awaitable<FetchReply>;

    /// Body of GET /api/info.
    [[nodiscard]] static auto info() -> json;

    [[nodiscard]] auto server() noexcept -> HttpServer& { return server_; }

private:
    void register_routes();

    PublicConfig listener_;
    HttpServer server_;
    infra::Fetcher fetcher_;
    StaticFiles static_files_;
};

} // namespace ssrflab::gateway
