#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include "ssrflab/core/error.hpp"
#include "ssrflab/core/types.hpp"

namespace ssrflab::gateway {

using boost::asio::awaitable;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;
using Handler = std::function<awaitable<Response>(const Request&)>;
using ResponseDecorator = std::function<void(Response&)>;

/// Request target as a std::string (beast's string_view type varies by Boost version).
auto target_of(const Request& req) -> std::string;
auto method_of(const Request& req) -> std::string;

auto make_text_response(const Request& req, http::status status, std::string body,
                        std::string_view content_type = "text/plain; charset=utf-8")
    -> Response;

/// JSON body; invalid UTF-8 in string values is replaced, never rejected.
auto make_json_response(const Request& req, http::status status, const json& body)
    -> Response;

/// Minimal HTTP/1.1 listener on Boost.Beast.
///
/// Every accepted socket gets its own coroutine, so a handler suspended on
/// slow I/O only holds up its own connection. Routes match the exact path
/// (query string excluded) and method; HEAD falls back to the GET route
/// and is answered without a body.
class HttpServer {
public:
    static constexpr auto kIdleTimeout = std::chrono::seconds(30);

    HttpServer(net::io_context& ioc, std::string name);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(http::verb method, std::string path, Handler handler);

    /// Handler for requests no route matches. Without one they get a 404.
    void set_fallback(Handler handler);

    /// Applied to every response before it is written.
    void set_response_decorator(ResponseDecorator decorator);

    /// One access log line per request when enabled.
    void set_access_log(bool enabled) noexcept { access_log_ = enabled; }

    /// Binds and listens. Port 0 picks an ephemeral port.
    auto listen(std::string_view address, uint16_t port) -> Result<tcp::endpoint>;

    /// Accept loop; returns after stop().
    auto run() -> awaitable<void>;

    /// Closes the acceptor. Open connections finish their current exchange.
    void stop();

    /// Routes one request. Exposed so handlers can be exercised without a socket.
    auto dispatch(const Request& req) -> awaitable<Response>;

    [[nodiscard]] auto local_endpoint() const -> std::optional<tcp::endpoint>;

private:
    auto handle_connection(tcp::socket socket) -> awaitable<void>;
    void log_access(const Request& req, const Response& res,
                    std::chrono::steady_clock::duration elapsed) const;

    net::io_context& ioc_;
    std::string name_;
    tcp::acceptor acceptor_;

    std::map<std::pair<http::verb, std::string>, Handler> routes_;
    Handler fallback_;
    ResponseDecorator decorator_;
    bool access_log_ = false;

    std::atomic<bool> running_{false};
};

} // namespace ssrflab::gateway
