#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ssrflab {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

enum class BindMode {
    Loopback,
    All,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BindMode, {
    {BindMode::Loopback, "loopback"},
    {BindMode::All, "all"},
})

/// Outcome of the validation policy for one candidate URL.
enum class Verdict {
    Allowed,
    Forbidden,
    UnsupportedScheme,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Verdict, {
    {Verdict::Allowed, "allowed"},
    {Verdict::Forbidden, "forbidden"},
    {Verdict::UnsupportedScheme, "unsupported-scheme"},
})

struct ValidationDecision {
    Verdict verdict = Verdict::Allowed;
    std::optional<std::string> reason;

    [[nodiscard]] auto allowed() const noexcept -> bool {
        return verdict == Verdict::Allowed;
    }
};

/// Shaped result of one outbound fetch.
struct FetchResult {
    int status_code = 0;
    std::string url;   // echo of the caller's input, not the post-redirect URL
    std::string body;  // possibly truncated
    bool truncated = false;
};

} // namespace ssrflab
