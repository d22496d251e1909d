#include "ssrflab/infra/http_client.hpp"

#include "ssrflab/core/logger.hpp"
#include "ssrflab/core/types.hpp"
#include "ssrflab/core/utils.hpp"

#include <httplib.h>

#include <charconv>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ssrflab::infra {

namespace net = boost::asio;

namespace {

auto to_http_response(const httplib::Result& result, std::string body)
    -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        std::string detail;
        switch (err) {
            case httplib::Error::Connection:
                detail = "Connection failed";
                break;
            case httplib::Error::BindIPAddress:
                detail = "Bind IP address failed";
                break;
            case httplib::Error::Read:
                detail = "Read error";
                break;
            case httplib::Error::Write:
                detail = "Write error";
                break;
            case httplib::Error::ExceedRedirectCount:
                detail = "Exceeded redirect count";
                break;
            case httplib::Error::Canceled:
                detail = "Request canceled";
                break;
            case httplib::Error::SSLConnection:
                detail = "SSL connection error";
                break;
            case httplib::Error::SSLLoadingCerts:
                detail = "SSL certificate loading error";
                break;
            case httplib::Error::SSLServerVerification:
                detail = "SSL server verification failed";
                break;
            case httplib::Error::ConnectionTimeout:
                return std::unexpected(
                    make_error(ErrorCode::Timeout,
                               "HTTP request timed out",
                               "Connection timeout"));
            default:
                detail = "httplib error code " + std::to_string(static_cast<int>(err));
                break;
        }
        return std::unexpected(
            make_error(ErrorCode::ConnectionFailed, "HTTP request failed", detail));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = std::move(body);
    return response;
}

constexpr auto kSocketTimeoutSlack = std::chrono::milliseconds(1000);

// Shared between a worker thread and the coroutine waiting for it.
struct GetState {
    std::mutex mtx;
    std::optional<Result<HttpResponse>> result;
    bool abandoned = false;
};

/// Marks the state abandoned when the waiting coroutine frame goes away,
/// whether it completed or was destroyed with its io_context.
struct AbandonOnExit {
    std::shared_ptr<GetState> state;

    ~AbandonOnExit() {
        std::lock_guard lock(state->mtx);
        state->abandoned = true;
    }
};

auto perform_get(const std::string& url, const UrlParts& parts,
                 const HttpClientConfig& config, Clock::time_point deadline)
    -> Result<HttpResponse> {
    httplib::Client client(parts.origin);
    if (!client.is_valid()) {
        return std::unexpected(
            make_error(ErrorCode::ConnectionFailed, "HTTP request failed",
                       "Unsupported origin " + parts.origin));
    }

    // Socket timeouts trail the overall deadline so a stalled upstream is
    // always reported by the deadline, as a Timeout.
    auto timeout = std::chrono::milliseconds(config.timeout_ms) + kSocketTimeoutSlack;
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_follow_location(config.follow_redirects);
    client.enable_server_certificate_verification(config.verify_ssl);

    if (parts.username) {
        client.set_basic_auth(*parts.username, parts.password.value_or(""));
    }

    httplib::Headers headers{
        {"User-Agent", config.user_agent},
        {"Accept", "*/*"},
    };

    // Read timeouts are per recv, so a body trickling in would never end on
    // its own. The receiver cancels the transfer once the deadline passes.
    std::string body;
    auto res = client.Get(parts.path, headers,
        httplib::ContentReceiver([&body, deadline](const char* data, size_t length) {
            if (Clock::now() >= deadline) return false;
            body.append(data, length);
            return true;
        }));

    if (!res && res.error() == httplib::Error::Canceled) {
        return std::unexpected(
            make_error(ErrorCode::Timeout, "network timeout at: " + url));
    }
    return to_http_response(res, std::move(body));
}

/// Runs perform_get, turning anything httplib throws (it parses ports with
/// std::stoi, including those in redirect targets) into a ConnectionFailed.
auto guarded_get(const std::string& url, const UrlParts& parts,
                 const HttpClientConfig& config, Clock::time_point deadline)
    -> Result<HttpResponse> {
    try {
        return perform_get(url, parts, config, deadline);
    } catch (const std::exception& e) {
        LOG_WARN("GET {} threw: {}", url, e.what());
        return std::unexpected(
            make_error(ErrorCode::ConnectionFailed, "HTTP request failed", e.what()));
    }
}

} // anonymous namespace

HttpClient::HttpClient(HttpClientConfig config)
    : config_(std::move(config)) {}

auto HttpClient::split_url(std::string_view url) -> Result<UrlParts> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "Only absolute URLs are supported",
                       std::string(url)));
    }

    auto scheme = utils::to_lower(url.substr(0, scheme_end));
    auto rest = url.substr(scheme_end + 3);

    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    auto tail = authority_end == std::string_view::npos
        ? std::string_view{}
        : rest.substr(authority_end);

    UrlParts parts;

    auto at_pos = authority.rfind('@');
    if (at_pos != std::string_view::npos) {
        auto userinfo = authority.substr(0, at_pos);
        authority = authority.substr(at_pos + 1);
        auto colon = userinfo.find(':');
        parts.username = utils::url_decode(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            parts.password = utils::url_decode(userinfo.substr(colon + 1));
        }
    }

    if (authority.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument, "Invalid URL: missing host",
                       std::string(url)));
    }

    // httplib parses the port with std::stoi; only hand it ports that fit.
    auto host_end = authority.front() == '[' ? authority.find(']') : std::string_view::npos;
    auto port_colon = authority.find(':', host_end == std::string_view::npos ? 0 : host_end);
    if (port_colon != std::string_view::npos) {
        auto port_text = authority.substr(port_colon + 1);
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(),
                                         port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 65535) {
            return std::unexpected(
                make_error(ErrorCode::InvalidArgument, "Invalid URL: bad port",
                           std::string(url)));
        }
    }

    auto hash = tail.find('#');
    if (hash != std::string_view::npos) {
        tail = tail.substr(0, hash);
    }

    parts.origin = scheme + "://" + std::string(authority);
    if (tail.empty()) {
        parts.path = "/";
    } else if (tail.front() == '?') {
        parts.path = "/" + std::string(tail);
    } else {
        parts.path = std::string(tail);
    }
    return parts;
}

auto HttpClient::get(std::string url)
    -> net::awaitable<Result<HttpResponse>> {
    auto parts = split_url(url);
    if (!parts) {
        co_return make_fail(parts.error());
    }

    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<GetState>();
    auto timer = std::make_shared<net::steady_timer>(
        executor, std::chrono::milliseconds(config_.timeout_ms));
    AbandonOnExit abandon{state};

    LOG_DEBUG("GET {}", url);

    auto deadline = Clock::now() + std::chrono::milliseconds(config_.timeout_ms);

    // The worker never owns the timer and only touches the executor while
    // this frame is alive, so it may safely outlive the io_context.
    std::thread([state, executor, weak_timer = std::weak_ptr<net::steady_timer>(timer),
                 url, parts = std::move(*parts), config = config_, deadline]() {
        auto result = guarded_get(url, parts, config, deadline);

        std::lock_guard lock(state->mtx);
        state->result = std::move(result);
        if (!state->abandoned) {
            net::post(executor, [weak_timer] {
                if (auto t = weak_timer.lock()) t->cancel();
            });
        }
    }).detach();

    boost::system::error_code ec;
    co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));

    std::lock_guard lock(state->mtx);
    if (!state->result.has_value()) {
        LOG_WARN("GET {} exceeded {} ms deadline", url, config_.timeout_ms);
        co_return make_fail(
            make_error(ErrorCode::Timeout, "network timeout at: " + url));
    }
    co_return std::move(*state->result);
}

} // namespace ssrflab::infra
