#pragma once

#include <array>
#include <string_view>

#include "ssrflab/core/types.hpp"

namespace ssrflab::infra {

/// Naive SSRF filter for the public fetch endpoint.
///
/// A purely syntactic check on the caller's string: the lowercased URL is
/// matched against a fixed set of loopback spellings, then the scheme
/// prefix is checked. Nothing is resolved or canonicalized, so alternate
/// IPv4 notations (2130706433, 0177.0.0.1, 0x7f.0.0.1), bracketed IPv6
/// and private ranges pass. Redirect targets are never seen by this guard.
class FetchGuard {
public:
    static constexpr std::array<std::string_view, 3> kBlockedSubstrings = {
        "localhost", "127.0.0.1", "::1",
    };

    static constexpr std::string_view kForbiddenReason = "local addresses are not allowed";
    static constexpr std::string_view kUnsupportedSchemeReason = "only http and https allowed";

    /// Decides whether `url` may be fetched. Blacklist first, then scheme.
    [[nodiscard]] static auto validate(std::string_view url) -> ValidationDecision;

    /// True if the lowercased url contains one of kBlockedSubstrings.
    [[nodiscard]] static auto contains_blocked_host(std::string_view url) -> bool;

    /// True if url starts with http:// or https://, case-insensitively.
    [[nodiscard]] static auto has_http_scheme(std::string_view url) -> bool;
};

} // namespace ssrflab::infra
