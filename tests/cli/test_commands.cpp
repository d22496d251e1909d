#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ssrflab/cli/app.hpp"
#include "ssrflab/cli/commands.hpp"

using namespace ssrflab;
using namespace ssrflab::cli;

namespace {

// Redirects std::cout into a buffer for the lifetime of the guard.
class CaptureStdout {
public:
    CaptureStdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStdout() { std::cout.rdbuf(previous_); }

    auto str() const -> std::string { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

auto run_app(std::vector<std::string> args, std::string& output) -> int {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    App app;
    CaptureStdout capture;
    int code = app.run(static_cast<int>(argv.size()), argv.data());
    output = capture.str();
    return code;
}

} // anonymous namespace

TEST_CASE("check_exit_code maps verdicts", "[cli]") {
    CHECK(check_exit_code(Verdict::Allowed) == 0);
    CHECK(check_exit_code(Verdict::Forbidden) == 1);
    CHECK(check_exit_code(Verdict::UnsupportedScheme) == 2);
}

TEST_CASE("check prints the validation decision", "[cli][check]") {
    std::string out;

    SECTION("decimal loopback passes the filter") {
        CHECK(run_app({"ssrflab", "check", "http://2130706433:8000/internal/flag"}, out) == 0);
        auto j = json::parse(out);
        CHECK(j["verdict"] == "allowed");
        CHECK_FALSE(j.contains("reason"));
    }

    SECTION("blacklisted host") {
        CHECK(run_app({"ssrflab", "check", "http://localhost:8000/"}, out) == 1);
        auto j = json::parse(out);
        CHECK(j["verdict"] == "forbidden");
        CHECK(j["reason"] == "local addresses are not allowed");
    }

    SECTION("unsupported scheme") {
        CHECK(run_app({"ssrflab", "check", "ftp://example.com/"}, out) == 2);
        CHECK(json::parse(out)["verdict"] == "unsupported-scheme");
    }
}

TEST_CASE("config command redacts the flag", "[cli][config]") {
    ::setenv("FLAG", "FLAG{cli_secret}", 1);
    std::string out;
    CHECK(run_app({"ssrflab", "config"}, out) == 0);
    ::unsetenv("FLAG");

    CHECK(out.find("FLAG{cli_secret}") == std::string::npos);
    auto j = json::parse(out);
    CHECK(j["flag"] == "***REDACTED***");
    CHECK(j["internal_listener"]["address"] == "127.0.0.1");
    CHECK(j["internal_listener"]["port"] == 8000);
    CHECK(j["public_listener"]["port"] == 3000);
}

TEST_CASE("version command prints the project name", "[cli]") {
    std::string out;
    CHECK(run_app({"ssrflab", "version"}, out) == 0);
    CHECK(out == std::string("ssrflab ") + SSRFLAB_VERSION_STRING + "\n");
}

TEST_CASE("a subcommand is required", "[cli]") {
    std::string out;
    CHECK(run_app({"ssrflab"}, out) != 0);
}
