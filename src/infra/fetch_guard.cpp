#include "ssrflab/infra/fetch_guard.hpp"

#include "ssrflab/core/utils.hpp"

namespace ssrflab::infra {

auto FetchGuard::contains_blocked_host(std::string_view url) -> bool {
    auto lowered = utils::to_lower(url);
    for (auto needle : kBlockedSubstrings) {
        if (lowered.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

auto FetchGuard::has_http_scheme(std::string_view url) -> bool {
    auto lowered = utils::to_lower(url.substr(0, 8));
    return utils::starts_with(lowered, "http://") || utils::starts_with(lowered, "https://");
}

auto FetchGuard::validate(std::string_view url) -> ValidationDecision {
    if (contains_blocked_host(url)) {
        return {Verdict::Forbidden, std::string(kForbiddenReason)};
    }
    if (!has_http_scheme(url)) {
        return {Verdict::UnsupportedScheme, std::string(kUnsupportedSchemeReason)};
    }
    return {Verdict::Allowed, std::nullopt};
}

} // namespace ssrflab::infra
