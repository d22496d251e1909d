#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <httplib.h>

#include "ssrflab/gateway/http_server.hpp"
#include "support/harness.hpp"

using namespace ssrflab;
using namespace ssrflab::gateway;
using ssrflab::testing::run_sync;

namespace {

auto make_request(http::verb method, std::string target) -> Request {
    Request req{method, target, 11};
    req.set(http::field::host, "test");
    return req;
}

auto echo_path() -> Handler {
    return [](const Request& req) -> awaitable<Response> {
        co_return make_text_response(req, http::status::ok, target_of(req));
    };
}

} // anonymous namespace

TEST_CASE("HttpServer routes by method and exact path", "[gateway][http_server]") {
    net::io_context ioc;
    HttpServer server(ioc, "test");
    server.route(http::verb::get, "/api/echo", echo_path());

    SECTION("query string is not part of the match") {
        auto res = run_sync(server.dispatch(make_request(http::verb::get, "/api/echo?x=1")));
        CHECK(res.result() == http::status::ok);
        CHECK(res.body() == "/api/echo?x=1");
    }

    SECTION("other methods fall through to 404") {
        auto res = run_sync(server.dispatch(make_request(http::verb::post, "/api/echo")));
        CHECK(res.result() == http::status::not_found);
        CHECK(res.body() == "Cannot POST /api/echo");
    }

    SECTION("HEAD uses the GET route without a body") {
        auto res = run_sync(server.dispatch(make_request(http::verb::head, "/api/echo?x=1")));
        CHECK(res.result() == http::status::ok);
        CHECK(res.body().empty());
        CHECK(res[http::field::content_length] == "13");
    }

    SECTION("unknown path") {
        auto res = run_sync(server.dispatch(make_request(http::verb::get, "/nope?a=b")));
        CHECK(res.result() == http::status::not_found);
        CHECK(res.body() == "Cannot GET /nope");
    }
}

TEST_CASE("HttpServer fallback and decorator", "[gateway][http_server]") {
    net::io_context ioc;
    HttpServer server(ioc, "test");
    server.route(http::verb::get, "/known", echo_path());
    server.set_fallback([](const Request& req) -> awaitable<Response> {
        co_return make_text_response(req, http::status::ok, "fallback");
    });
    server.set_response_decorator([](Response& res) {
        res.set("X-Test", "decorated");
    });

    auto fallback = run_sync(server.dispatch(make_request(http::verb::get, "/other")));
    CHECK(fallback.body() == "fallback");
    CHECK(fallback["X-Test"] == "decorated");

    auto known = run_sync(server.dispatch(make_request(http::verb::get, "/known")));
    CHECK(known.body() == "/known");
    CHECK(known["X-Test"] == "decorated");
}

TEST_CASE("HttpServer turns handler exceptions into 500", "[gateway][http_server]") {
    net::io_context ioc;
    HttpServer server(ioc, "test");
    server.route(http::verb::get, "/boom", [](const Request&) -> awaitable<Response> {
        throw std::runtime_error("handler failed");
        co_return Response{};
    });

    auto res = run_sync(server.dispatch(make_request(http::verb::get, "/boom")));
    CHECK(res.result() == http::status::internal_server_error);
    CHECK(res.body() == R"({"error":"internal error"})");
    CHECK(res[http::field::content_type] == "application/json; charset=utf-8");
}

TEST_CASE("make_json_response tolerates invalid UTF-8", "[gateway][http_server]") {
    auto req = make_request(http::verb::get, "/");
    auto res = make_json_response(req, http::status::ok, json{{"body", "ok\xFF"}});
    CHECK(res.result() == http::status::ok);
    CHECK(res.body().find("ok") != std::string::npos);
}

TEST_CASE("HttpServer listen rejects bad addresses", "[gateway][http_server]") {
    net::io_context ioc;
    HttpServer server(ioc, "test");
    auto result = server.listen("not-an-address", 0);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InvalidConfig);
}

TEST_CASE("HttpServer serves concurrent connections independently",
          "[gateway][http_server]") {
    struct Fixture {
        ssrflab::testing::IoThread io;
        HttpServer server{io.ioc(), "test"};
        ~Fixture() { io.stop(); }
    } fx;

    fx.server.route(http::verb::get, "/slow", [](const Request& req) -> awaitable<Response> {
        net::steady_timer timer(co_await net::this_coro::executor, std::chrono::seconds(1));
        co_await timer.async_wait(net::use_awaitable);
        co_return make_text_response(req, http::status::ok, "slow");
    });
    fx.server.route(http::verb::get, "/fast", echo_path());

    auto endpoint = fx.server.listen("127.0.0.1", 0);
    REQUIRE(endpoint.has_value());
    auto port = endpoint->port();
    fx.io.spawn(fx.server.run());
    fx.io.start();

    auto slow = std::async(std::launch::async, [port] {
        httplib::Client client("127.0.0.1", port);
        auto res = client.Get("/slow");
        return res ? res->body : std::string();
    });

    // Give the slow request a head start so it is in flight.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    httplib::Client client("127.0.0.1", port);
    auto started = std::chrono::steady_clock::now();
    auto fast = client.Get("/fast");
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(fast);
    CHECK(fast->status == 200);
    CHECK(fast->body == "/fast");
    CHECK(elapsed < std::chrono::milliseconds(800));

    CHECK(slow.get() == "slow");
}

TEST_CASE("HttpServer keeps connections alive", "[gateway][http_server]") {
    struct Fixture {
        ssrflab::testing::IoThread io;
        HttpServer server{io.ioc(), "test"};
        ~Fixture() { io.stop(); }
    } fx;

    fx.server.route(http::verb::get, "/a", echo_path());
    auto endpoint = fx.server.listen("127.0.0.1", 0);
    REQUIRE(endpoint.has_value());
    fx.io.spawn(fx.server.run());
    fx.io.start();

    httplib::Client client("127.0.0.1", endpoint->port());
    client.set_keep_alive(true);
    for (int i = 0; i < 3; ++i) {
        auto res = client.Get("/a");
        REQUIRE(res);
        CHECK(res->status == 200);
    }
}
