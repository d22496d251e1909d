#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ssrflab/core/config.hpp"
#include "ssrflab/core/secret.hpp"
#include "ssrflab/gateway/http_server.hpp"

namespace ssrflab::gateway {

/// Internal debug listener holding the privileged secret.
///
/// There is no credential check on its routes. The only protection is the
/// bind: the listener is always on kInternalAddress, and listen() refuses
/// to run if the bound endpoint turns out not to be loopback.
class InternalService {
public:
    static constexpr std::string_view kName = "internal-debug";

    /// `port` defaults to kInternalPort; other values are for tests only.
    InternalService(net::io_context& ioc, Secret secret, uint16_t port = kInternalPort);

    auto listen() -> Result<tcp::endpoint>;
    auto run() -> awaitable<void>;
    void stop();

    /// Plain-text body of GET /internal/flag.
    [[nodiscard]] static auto flag_body(const Secret& secret) -> std::string;

    /// JSON body of GET /internal/info.
    [[nodiscard]] static auto info() -> json;

    [[nodiscard]] auto server() noexcept -> HttpServer& { return server_; }

private:
    void register_routes();

    HttpServer server_;
    const Secret secret_;
    uint16_t port_;
};

} // namespace ssrflab::gateway
