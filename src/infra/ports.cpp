#include "ssrflab/infra/ports.hpp"
#include "ssrflab/core/logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace ssrflab::infra {

namespace net = boost::asio;
using tcp = net::ip::tcp;

auto is_port_available(uint16_t port) -> bool {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc);
    boost::system::error_code ec;

    tcp::endpoint endpoint{net::ip::address_v4::loopback(), port};
    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        LOG_ERROR("Failed to create socket: {}", ec.message());
        return false;
    }

    // Allow immediate reuse
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
    acceptor.bind(endpoint, ec);
    bool available = !ec;

    acceptor.close(ec);
    return available;
}

auto find_free_port(uint16_t start_port, uint16_t max_attempts)
    -> std::optional<uint16_t> {
    for (uint16_t i = 0; i < max_attempts; ++i) {
        auto candidate = static_cast<uint16_t>(start_port + i);
        // Guard against overflow past valid port range
        if (candidate < start_port) {
            break;
        }
        if (is_port_available(candidate)) {
            LOG_DEBUG("Found free port: {}", candidate);
            return candidate;
        }
    }
    LOG_WARN("No free port found in range [{}, {})",
             start_port, start_port + max_attempts);
    return std::nullopt;
}

} // namespace ssrflab::infra
