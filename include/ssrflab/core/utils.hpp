#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ssrflab::utils {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

auto generate_id(std::size_t length = 12) -> std::string;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto starts_with(std::string_view s, std::string_view prefix) -> bool;

/// Percent-decodes `s` as a URL path: '+' is kept. Malformed escapes are kept literally.
auto percent_decode(std::string_view s) -> std::string;

/// Percent-decodes `s`; '+' decodes to a space as in form-encoded query strings.
/// Malformed escapes are kept literally.
auto url_decode(std::string_view s) -> std::string;

/// Splits the query part of a request target into decoded pairs, in order.
auto parse_query(std::string_view target) -> QueryParams;

/// First value of `key` in the target's query string.
auto query_param(std::string_view target, std::string_view key) -> std::optional<std::string>;

/// Request target without its query string or fragment.
auto target_path(std::string_view target) -> std::string_view;

/// Seconds elapsed since the process started.
auto process_uptime_seconds() -> double;

} // namespace ssrflab::utils
