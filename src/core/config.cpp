#include "ssrflab/core/config.hpp"
#include "ssrflab/core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace ssrflab {

namespace {

auto parse_port(std::string_view text) -> std::optional<uint16_t> {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (value == 0 || value > 65535) return std::nullopt;
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("FLAG")) {
        config.flag = val;
    }
    if (auto* val = std::getenv("PORT")) {
        if (auto port = parse_port(val)) {
            config.public_listener.port = *port;
        } else {
            LOG_WARN("Ignoring invalid PORT value '{}'", val);
        }
    }
    if (auto* val = std::getenv("LOG_LEVEL")) {
        config.log_level = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

void redact_config_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "flag", "secret", "token",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = false;
            for (const auto& key : sensitive_keys) {
                if (it.key() == key) {
                    is_sensitive = true;
                    break;
                }
            }
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_config_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_config_json(elem);
        }
    }
}

} // namespace ssrflab
