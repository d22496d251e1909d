#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "ssrflab/core/config.hpp"
#include "ssrflab/core/error.hpp"
#include "ssrflab/core/types.hpp"
#include "ssrflab/infra/http_client.hpp"

namespace ssrflab::infra {

struct TruncatedBody {
    std::string text;
    bool truncated = false;
};

/// Outbound fetch pipeline behind /api/fetch.
///
/// Callers must only hand it URLs that already passed FetchGuard. The
/// pipeline itself performs no filtering: it issues the GET, lets
/// redirects through, bounds the call by the configured deadline and
/// shapes the body.
class Fetcher {
public:
    static constexpr std::string_view kTruncationMarker = "\n\n...[truncated]";

    explicit Fetcher(FetchConfig config);

    /// GETs `url`. Errors are Timeout or ConnectionFailed (InvalidArgument
    /// for URLs httplib cannot address).
    auto fetch(std::string url) -> boost::asio::awaitable<Result<FetchResult>>;

    /// Keeps the first `max_chars` UTF-8 characters and appends the marker
    /// when the text is longer than that.
    [[nodiscard]] static auto truncate_body(std::string_view text, size_t max_chars)
        -> TruncatedBody;

    [[nodiscard]] auto config() const noexcept -> const FetchConfig& { return config_; }

private:
    FetchConfig config_;
    HttpClient http_;
};

} // namespace ssrflab::infra
