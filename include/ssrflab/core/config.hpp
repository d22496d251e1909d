#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ssrflab/core/types.hpp"

namespace ssrflab {

/// Internal debug listener. Deliberately not part of Config.
inline constexpr std::string_view kInternalAddress = "127.0.0.1";
inline constexpr uint16_t kInternalPort = 8000;

inline constexpr std::string_view kDefaultFlag = "FLAG{ssrf_decimal_wrap}";

struct PublicConfig {
    uint16_t port = 3000;
    BindMode bind = BindMode::All;
    std::string web_root = "web";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PublicConfig, port, bind, web_root)

struct FetchConfig {
    long timeout_ms = 5000;
    size_t max_body_chars = 2000;
    std::string user_agent = "ssrflab/1.0";
    bool verify_tls = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(FetchConfig, timeout_ms, max_body_chars, user_agent, verify_tls)

struct Config {
    PublicConfig public_listener;
    FetchConfig fetch;
    std::string flag = std::string(kDefaultFlag);
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, public_listener, fetch, flag, log_level)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Overlays FLAG, PORT and LOG_LEVEL from the environment onto `config`.
void apply_env_overrides(Config& config);

/// Replaces secret-bearing string values with "***REDACTED***".
void redact_config_json(json& j);

} // namespace ssrflab
