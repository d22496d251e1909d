#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "ssrflab/core/config.hpp"

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(name_); }

private:
    const char* name_;
};

auto write_temp_config(const std::string& name, const std::string& content)
    -> std::filesystem::path {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path;
}

} // anonymous namespace

TEST_CASE("default_config returns the lab defaults", "[config]") {
    auto cfg = ssrflab::default_config();

    SECTION("public listener") {
        CHECK(cfg.public_listener.port == 3000);
        CHECK(cfg.public_listener.bind == ssrflab::BindMode::All);
        CHECK(cfg.public_listener.web_root == "web");
    }

    SECTION("fetch pipeline") {
        CHECK(cfg.fetch.timeout_ms == 5000);
        CHECK(cfg.fetch.max_body_chars == 2000);
        CHECK(cfg.fetch.verify_tls);
    }

    SECTION("flag and log level") {
        CHECK(cfg.flag == ssrflab::kDefaultFlag);
        CHECK(cfg.log_level == "info");
    }
}

TEST_CASE("Internal listener address is fixed", "[config]") {
    CHECK(ssrflab::kInternalAddress == "127.0.0.1");
    CHECK(ssrflab::kInternalPort == 8000);
}

TEST_CASE("apply_env_overrides reads FLAG, PORT and LOG_LEVEL", "[config][env]") {
    SECTION("FLAG replaces the secret") {
        EnvGuard flag("FLAG", "FLAG{from_env}");
        auto cfg = ssrflab::load_config_from_env();
        CHECK(cfg.flag == "FLAG{from_env}");
    }

    SECTION("valid PORT changes the public port") {
        EnvGuard port("PORT", "8080");
        auto cfg = ssrflab::load_config_from_env();
        CHECK(cfg.public_listener.port == 8080);
    }

    SECTION("invalid PORT values are ignored") {
        for (const char* bad : {"abc", "0", "70000", "80x", ""}) {
            EnvGuard port("PORT", bad);
            auto cfg = ssrflab::load_config_from_env();
            CHECK(cfg.public_listener.port == 3000);
        }
    }

    SECTION("LOG_LEVEL") {
        EnvGuard level("LOG_LEVEL", "debug");
        ssrflab::Config cfg;
        ssrflab::apply_env_overrides(cfg);
        CHECK(cfg.log_level == "debug");
    }

    SECTION("nothing set keeps defaults") {
        ::unsetenv("FLAG");
        ::unsetenv("PORT");
        ::unsetenv("LOG_LEVEL");
        auto cfg = ssrflab::load_config_from_env();
        CHECK(cfg.flag == ssrflab::kDefaultFlag);
        CHECK(cfg.public_listener.port == 3000);
    }
}

TEST_CASE("load_config reads a JSON file", "[config]") {
    SECTION("partial file keeps defaults for missing keys") {
        auto path = write_temp_config("ssrflab_test_partial.json", R"({
            "public_listener": {"port": 4000, "bind": "loopback"},
            "fetch": {"timeout_ms": 250}
        })");
        auto cfg = ssrflab::load_config(path);
        CHECK(cfg.public_listener.port == 4000);
        CHECK(cfg.public_listener.bind == ssrflab::BindMode::Loopback);
        CHECK(cfg.public_listener.web_root == "web");
        CHECK(cfg.fetch.timeout_ms == 250);
        CHECK(cfg.fetch.max_body_chars == 2000);
        std::filesystem::remove(path);
    }

    SECTION("missing file falls back to defaults") {
        auto cfg = ssrflab::load_config("/nonexistent/ssrflab.json");
        CHECK(cfg.public_listener.port == 3000);
    }

    SECTION("malformed file falls back to defaults") {
        auto path = write_temp_config("ssrflab_test_bad.json", "{not json");
        auto cfg = ssrflab::load_config(path);
        CHECK(cfg.fetch.timeout_ms == 5000);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Config JSON round trip preserves the bind mode spelling", "[config]") {
    ssrflab::Config cfg;
    cfg.public_listener.bind = ssrflab::BindMode::Loopback;
    ssrflab::json j = cfg;
    CHECK(j["public_listener"]["bind"] == "loopback");

    auto back = j.get<ssrflab::Config>();
    CHECK(back.public_listener.bind == ssrflab::BindMode::Loopback);
}

TEST_CASE("redact_config_json hides the flag", "[config][redaction]") {
    ssrflab::Config cfg;
    cfg.flag = "FLAG{do_not_print}";
    ssrflab::json j = cfg;
    ssrflab::redact_config_json(j);

    CHECK(j["flag"] == "***REDACTED***");
    CHECK(j.dump().find("do_not_print") == std::string::npos);
    CHECK(j["public_listener"]["port"] == 3000);
    CHECK(j["log_level"] == "info");
}

TEST_CASE("redact_config_json recurses into nested values", "[config][redaction]") {
    ssrflab::json j = {
        {"outer", {{"token", "abc"}, {"name", "keep"}}},
        {"list", ssrflab::json::array({{{"secret", "xyz"}}})},
        {"flag", ""},
    };
    ssrflab::redact_config_json(j);

    CHECK(j["outer"]["token"] == "***REDACTED***");
    CHECK(j["outer"]["name"] == "keep");
    CHECK(j["list"][0]["secret"] == "***REDACTED***");
    CHECK(j["flag"] == "");
}
