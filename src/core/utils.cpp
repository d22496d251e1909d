#include "ssrflab/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>

namespace ssrflab::utils {

namespace {

const auto g_process_start = std::chrono::steady_clock::now();

auto hex_digit_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

namespace {

auto decode(std::string_view s, bool plus_as_space) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (plus_as_space && s[i] == '+') {
            result += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hex_digit_value(s[i + 1]) >= 0 && hex_digit_value(s[i + 2]) >= 0) {
            result += static_cast<char>((hex_digit_value(s[i + 1]) << 4) |
                                        hex_digit_value(s[i + 2]));
            i += 2;
        } else {
            result += s[i];
        }
    }
    return result;
}

} // anonymous namespace

auto percent_decode(std::string_view s) -> std::string {
    return decode(s, false);
}

auto url_decode(std::string_view s) -> std::string {
    return decode(s, true);
}

auto parse_query(std::string_view target) -> QueryParams {
    QueryParams params;

    auto qpos = target.find('?');
    if (qpos == std::string_view::npos) return params;
    auto query = target.substr(qpos + 1);
    auto hash = query.find('#');
    if (hash != std::string_view::npos) query = query.substr(0, hash);

    size_t pos = 0;
    while (pos <= query.size()) {
        auto next = query.find('&', pos);
        auto part = query.substr(pos, next == std::string_view::npos ? std::string_view::npos
                                                                     : next - pos);
        if (!part.empty()) {
            auto eq = part.find('=');
            if (eq == std::string_view::npos) {
                params.emplace_back(url_decode(part), "");
            } else {
                params.emplace_back(url_decode(part.substr(0, eq)),
                                    url_decode(part.substr(eq + 1)));
            }
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return params;
}

auto query_param(std::string_view target, std::string_view key) -> std::optional<std::string> {
    for (auto& [k, v] : parse_query(target)) {
        if (k == key) return std::move(v);
    }
    return std::nullopt;
}

auto target_path(std::string_view target) -> std::string_view {
    auto end = target.find_first_of("?#");
    return end == std::string_view::npos ? target : target.substr(0, end);
}

auto process_uptime_seconds() -> double {
    auto elapsed = std::chrono::steady_clock::now() - g_process_start;
    return std::chrono::duration<double>(elapsed).count();
}

} // namespace ssrflab::utils
