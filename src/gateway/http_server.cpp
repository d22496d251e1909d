#include "ssrflab/gateway/http_server.hpp"

#include "ssrflab/core/logger.hpp"
#include "ssrflab/core/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

namespace ssrflab::gateway {

namespace {

auto to_string(beast::string_view sv) -> std::string {
    return std::string(sv.data(), sv.size());
}

} // anonymous namespace

auto target_of(const Request& req) -> std::string {
    return to_string(req.target());
}

auto method_of(const Request& req) -> std::string {
    return to_string(req.method_string());
}

auto make_text_response(const Request& req, http::status status, std::string body,
                        std::string_view content_type) -> Response {
    Response res{status, req.version()};
    res.set(http::field::content_type, std::string(content_type));
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

auto make_json_response(const Request& req, http::status status, const json& body)
    -> Response {
    return make_text_response(
        req, status,
        body.dump(-1, ' ', false, json::error_handler_t::replace),
        "application/json; charset=utf-8");
}

HttpServer::HttpServer(net::io_context& ioc, std::string name)
    : ioc_(ioc)
    , name_(std::move(name))
    , acceptor_(ioc) {}

void HttpServer::route(http::verb method, std::string path, Handler handler) {
    routes_[{method, std::move(path)}] = std::move(handler);
}

void HttpServer::set_fallback(Handler handler) {
    fallback_ = std::move(handler);
}

void HttpServer::set_response_decorator(ResponseDecorator decorator) {
    decorator_ = std::move(decorator);
}

auto HttpServer::listen(std::string_view address, uint16_t port) -> Result<tcp::endpoint> {
    boost::system::error_code ec;
    auto addr = net::ip::make_address(std::string(address), ec);
    if (ec) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "Invalid bind address",
                       std::string(address)));
    }

    auto endpoint = tcp::endpoint{addr, port};
    auto where = std::string(address) + ":" + std::to_string(port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return std::unexpected(
            make_error(ErrorCode::IoError, "Failed to open listener socket",
                       where + ": " + ec.message()));
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        acceptor_.close();
        return std::unexpected(
            make_error(ErrorCode::IoError, "Failed to bind " + name_,
                       where + ": " + ec.message()));
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        acceptor_.close();
        return std::unexpected(
            make_error(ErrorCode::IoError, "Failed to listen",
                       where + ": " + ec.message()));
    }

    auto local = acceptor_.local_endpoint();
    LOG_INFO("{} listening on {}:{}", name_, local.address().to_string(), local.port());
    return local;
}

auto HttpServer::local_endpoint() const -> std::optional<tcp::endpoint> {
    if (!acceptor_.is_open()) return std::nullopt;
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    if (ec) return std::nullopt;
    return ep;
}

auto HttpServer::run() -> awaitable<void> {
    if (!acceptor_.is_open()) {
        LOG_ERROR("{}: run() called before listen()", name_);
        co_return;
    }

    running_ = true;
    while (running_) {
        try {
            auto socket = co_await acceptor_.async_accept(net::use_awaitable);

            // Spawn connection handler as a detached coroutine.
            net::co_spawn(
                ioc_,
                handle_connection(std::move(socket)),
                net::detached);

        } catch (const boost::system::system_error& e) {
            if (!running_) break;  // Expected during shutdown.
            if (e.code() == net::error::operation_aborted) break;
            LOG_ERROR("{}: accept error: {}", name_, e.what());
        }
    }
    running_ = false;
}

void HttpServer::stop() {
    running_ = false;
    net::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

auto HttpServer::dispatch(const Request& req) -> awaitable<Response> {
    auto target = target_of(req);
    auto path = std::string(utils::target_path(target));

    Handler* handler = nullptr;
    auto it = routes_.find({req.method(), path});
    if (it == routes_.end() && req.method() == http::verb::head) {
        it = routes_.find({http::verb::get, path});
    }
    if (it != routes_.end()) {
        handler = &it->second;
    } else if (fallback_) {
        handler = &fallback_;
    }

    std::optional<Response> res;
    if (handler) {
        std::string failure;
        try {
            res = co_await (*handler)(req);
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (!res) {
            LOG_ERROR("{}: handler for {} {} threw: {}", name_,
                      method_of(req), path, failure);
            res = make_json_response(req, http::status::internal_server_error,
                                     json{{"error", "internal error"}});
        }
    } else {
        res = make_text_response(req, http::status::not_found,
                                 "Cannot " + method_of(req) + " " + path);
    }

    if (decorator_) {
        decorator_(*res);
    }
    res->keep_alive(req.keep_alive());
    res->prepare_payload();

    // HEAD gets the GET headers, Content-Length included, without the body.
    if (req.method() == http::verb::head) {
        auto length = res->payload_size();
        res->body().clear();
        if (length) res->content_length(*length);
    }
    co_return std::move(*res);
}

auto HttpServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    auto conn_id = utils::generate_id(12);
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    boost::system::error_code ec;

    LOG_DEBUG("{}: connection {} from {}", name_, conn_id,
              stream.socket().remote_endpoint(ec).address().to_string());

    for (;;) {
        stream.expires_after(kIdleTimeout);

        Request req;
        co_await http::async_read(stream, buffer, req,
                                  net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            if (ec != beast::error::timeout) {
                LOG_DEBUG("{}: [{}] read error: {}", name_, conn_id, ec.message());
            }
            break;
        }

        // Handler time (an outbound fetch, say) is not bounded by the idle timer.
        stream.expires_never();
        auto started = std::chrono::steady_clock::now();
        auto res = co_await dispatch(req);
        if (access_log_) {
            log_access(req, res, std::chrono::steady_clock::now() - started);
        }

        bool keep_alive = res.keep_alive();
        stream.expires_after(kIdleTimeout);
        co_await http::async_write(stream, res,
                                   net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("{}: [{}] write error: {}", name_, conn_id, ec.message());
            break;
        }
        if (!keep_alive) break;
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    LOG_DEBUG("{}: connection {} closed", name_, conn_id);
}

void HttpServer::log_access(const Request& req, const Response& res,
                            std::chrono::steady_clock::duration elapsed) const {
    auto ms = std::chrono::duration<double, std::milli>(elapsed).count();
    auto length = res.find(http::field::content_length) != res.end()
        ? to_string(res[http::field::content_length])
        : std::string("-");
    LOG_INFO("{} {} {} {} - {:.3f} ms",
             method_of(req), target_of(req),
             res.result_int(), length, ms);
}

} // namespace ssrflab::gateway
