#include "ssrflab/gateway/public_gateway.hpp"

#include "ssrflab/core/logger.hpp"
#include "ssrflab/core/utils.hpp"
#include "ssrflab/infra/fetch_guard.hpp"

namespace ssrflab::gateway {

namespace {

auto error_reply(int status, std::string_view message) -> FetchReply {
    return {status, json{{"error", message}}};
}

} // anonymous namespace

PublicGateway::PublicGateway(net::io_context& ioc, PublicConfig listener, FetchConfig fetch)
    : listener_(std::move(listener))
    , server_(ioc, "Public app")
    , fetcher_(std::move(fetch))
    , static_files_(listener_.web_root) {
    server_.set_access_log(true);
    server_.set_response_decorator([](Response& res) {
        res.set(http::field::access_control_allow_origin, "*");
    });
    register_routes();
}

auto PublicGateway::info() -> json {
    return json{
        {"name", "DEVS legacy (SSRF demo)"},
        {"endpoints", json::array({"/api/fetch?url=...", "/api/info", "/api/health"})},
        {"note", "Public fetch tool blocks obvious local hostnames but not all IP encodings."},
    };
}

auto PublicGateway::handle_fetch(std::optional<std::string> url_param) -> awaitable<FetchReply> {
    auto url = utils::trim(url_param.value_or(""));
    if (url.empty()) {
        co_return error_reply(400, "url parameter required");
    }

    auto decision = infra::FetchGuard::validate(url);
    switch (decision.verdict) {
        case Verdict::Forbidden:
            LOG_INFO("Blocked fetch of {}", url);
            co_return error_reply(http_status_for(ErrorCode::Forbidden),
                                  decision.reason.value_or("forbidden"));
        case Verdict::UnsupportedScheme:
            co_return error_reply(http_status_for(ErrorCode::UnsupportedScheme),
                                  infra::FetchGuard::kUnsupportedSchemeReason);
        case Verdict::Allowed:
            break;
    }

    auto result = co_await fetcher_.fetch(url);
    if (!result) {
        co_return FetchReply{500, json{
            {"error", "fetch failed"},
            {"detail", result.error().what()},
        }};
    }

    co_return FetchReply{200, json{
        {"status", result->status_code},
        {"url", result->url},
        {"body", result->body},
    }};
}

void PublicGateway::register_routes() {
    server_.route(http::verb::get, "/api/fetch",
        [this](const Request& req) -> awaitable<Response> {
            auto reply = co_await handle_fetch(utils::query_param(target_of(req), "url"));
            co_return make_json_response(req, static_cast<http::status>(reply.status),
                                         reply.body);
        });

    server_.route(http::verb::get, "/api/info",
        [](const Request& req) -> awaitable<Response> {
            co_return make_json_response(req, http::status::ok, info());
        });

    server_.route(http::verb::get, "/api/health",
        [](const Request& req) -> awaitable<Response> {
            co_return make_text_response(req, http::status::ok, "ok");
        });

    server_.set_fallback(
        [this](const Request& req) -> awaitable<Response> {
            if (req.method() == http::verb::options) {
                Response res{http::status::no_content, req.version()};
                res.set(http::field::access_control_allow_methods,
                        "GET,HEAD,PUT,PATCH,POST,DELETE");
                auto requested = req.find(http::field::access_control_request_headers);
                if (requested != req.end()) {
                    res.set(http::field::access_control_allow_headers, requested->value());
                }
                co_return res;
            }
            co_return static_files_.serve(req);
        });
}

auto PublicGateway::listen() -> Result<tcp::endpoint> {
    auto address = listener_.bind == BindMode::All ? "0.0.0.0" : "127.0.0.1";
    return server_.listen(address, listener_.port);
}

auto PublicGateway::run() -> awaitable<void> {
    co_await server_.run();
}

void PublicGateway::stop() {
    server_.stop();
}

} // namespace ssrflab::gateway
