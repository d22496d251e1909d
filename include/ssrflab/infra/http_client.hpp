#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "ssrflab/core/error.hpp"

namespace ssrflab::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    long timeout_ms = 5000;  // overall deadline per request
    bool follow_redirects = true;
    bool verify_ssl = true;
    std::string user_agent = "ssrflab/1.0";
};

/// An absolute URL split the way cpp-httplib wants it.
struct UrlParts {
    std::string origin;  // scheme://host[:port]
    std::string path;    // path and query, at least "/"
    std::optional<std::string> username;
    std::optional<std::string> password;
};

/// Asynchronous GET client for absolute URLs, wrapping cpp-httplib.
///
/// Each request runs the blocking httplib call on its own worker thread
/// and the calling coroutine waits on a steady_timer armed with the
/// overall deadline, so a slow upstream only suspends its own caller.
/// A worker that misses the deadline cancels its transfer at the next
/// received chunk (or at the socket timeout if nothing arrives) and its
/// result is dropped.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config = {});

    /// Performs a GET on an absolute http(s) URL. Redirects are followed
    /// by httplib itself when follow_redirects is set.
    auto get(std::string url) -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Splits an absolute URL into origin and request path.
    [[nodiscard]] static auto split_url(std::string_view url) -> Result<UrlParts>;

    [[nodiscard]] auto config() const noexcept -> const HttpClientConfig& { return config_; }

private:
    HttpClientConfig config_;
};

} // namespace ssrflab::infra
