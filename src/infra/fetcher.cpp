#include "ssrflab/infra/fetcher.hpp"

#include "ssrflab/core/logger.hpp"

namespace ssrflab::infra {

namespace {

auto is_continuation_byte(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

auto client_config_for(const FetchConfig& config) -> HttpClientConfig {
    HttpClientConfig hc;
    hc.timeout_ms = config.timeout_ms;
    hc.follow_redirects = true;
    hc.verify_ssl = config.verify_tls;
    hc.user_agent = config.user_agent;
    return hc;
}

} // anonymous namespace

Fetcher::Fetcher(FetchConfig config)
    : config_(std::move(config))
    , http_(client_config_for(config_)) {}

auto Fetcher::truncate_body(std::string_view text, size_t max_chars) -> TruncatedBody {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_continuation_byte(text[i])) continue;
        if (chars == max_chars) {
            std::string kept(text.substr(0, i));
            kept += kTruncationMarker;
            return {std::move(kept), true};
        }
        ++chars;
    }
    return {std::string(text), false};
}

auto Fetcher::fetch(std::string url) -> boost::asio::awaitable<Result<FetchResult>> {
    auto response = co_await http_.get(url);
    if (!response) {
        LOG_WARN("Fetch of {} failed: {}", url, response.error().what());
        co_return make_fail(response.error());
    }

    auto body = truncate_body(response->body, config_.max_body_chars);
    LOG_DEBUG("Fetched {} -> {} ({} bytes{})", url, response->status,
              response->body.size(), body.truncated ? ", truncated" : "");

    FetchResult result;
    result.status_code = response->status;
    result.url = std::move(url);
    result.body = std::move(body.text);
    result.truncated = body.truncated;
    co_return result;
}

} // namespace ssrflab::infra
