#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "ssrflab/gateway/static_files.hpp"
#include "ssrflab/core/utils.hpp"

using namespace ssrflab::gateway;
namespace fs = std::filesystem;

namespace {

// A web root with an index, a stylesheet, a subdirectory and a file next
// to (not inside) the root.
struct WebRoot {
    fs::path base = fs::temp_directory_path() / ("ssrflab_static_" + ssrflab::utils::generate_id(8));
    fs::path root = base / "web";

    WebRoot() {
        fs::create_directories(root / "docs");
        std::ofstream(root / "index.html") << "<h1>index</h1>";
        std::ofstream(root / "app.CSS") << "body{}";
        std::ofstream(root / "docs" / "index.html") << "docs";
        std::ofstream(root / "docs" / "notes.txt") << "notes";
        std::ofstream(base / "outside.txt") << "outside";
    }

    ~WebRoot() {
        std::error_code ec;
        fs::remove_all(base, ec);
    }
};

auto get(std::string target) -> Request {
    Request req{http::verb::get, target, 11};
    req.set(http::field::host, "test");
    return req;
}

} // anonymous namespace

TEST_CASE("StaticFiles resolves files under the root", "[gateway][static]") {
    WebRoot web;
    StaticFiles files(web.root);

    CHECK(files.resolve("/") == files.root() / "index.html");
    CHECK(files.resolve("/docs") == files.root() / "docs" / "index.html");
    CHECK(files.resolve("/docs/notes.txt") == files.root() / "docs" / "notes.txt");
    CHECK_FALSE(files.resolve("/missing.html").has_value());
}

TEST_CASE("StaticFiles refuses paths outside the root", "[gateway][static]") {
    WebRoot web;
    StaticFiles files(web.root);

    CHECK_FALSE(files.resolve("/../outside.txt").has_value());
    CHECK_FALSE(files.resolve("/docs/../../outside.txt").has_value());
    CHECK_FALSE(files.resolve(std::string_view("/index.html\0x", 13)).has_value());

    auto res = files.serve(get("/%2e%2e/outside.txt"));
    CHECK(res.result() == http::status::not_found);
    CHECK(res.body() == "Cannot GET /%2e%2e/outside.txt");
}

TEST_CASE("StaticFiles serves content with a type by extension", "[gateway][static]") {
    WebRoot web;
    StaticFiles files(web.root);

    auto index = files.serve(get("/?utm=1"));
    CHECK(index.result() == http::status::ok);
    CHECK(index.body() == "<h1>index</h1>");
    CHECK(index[http::field::content_type] == "text/html; charset=utf-8");

    auto css = files.serve(get("/app.CSS"));
    CHECK(css.result() == http::status::ok);
    CHECK(css[http::field::content_type] == "text/css; charset=utf-8");
}

TEST_CASE("StaticFiles answers HEAD like GET", "[gateway][static]") {
    WebRoot web;
    StaticFiles files(web.root);

    Request req{http::verb::head, "/docs/notes.txt", 11};
    auto res = files.serve(req);
    CHECK(res.result() == http::status::ok);
    CHECK(res[http::field::content_type] == "text/plain; charset=utf-8");
}

TEST_CASE("StaticFiles only answers GET and HEAD", "[gateway][static]") {
    WebRoot web;
    StaticFiles files(web.root);

    Request req{http::verb::post, "/index.html", 11};
    auto res = files.serve(req);
    CHECK(res.result() == http::status::not_found);
    CHECK(res.body() == "Cannot POST /index.html");
}

TEST_CASE("content_type_for defaults to octet-stream", "[gateway][static]") {
    CHECK(StaticFiles::content_type_for("a.js") == "application/javascript; charset=utf-8");
    CHECK(StaticFiles::content_type_for("a.png") == "image/png");
    CHECK(StaticFiles::content_type_for("a.bin") == "application/octet-stream");
    CHECK(StaticFiles::content_type_for("README") == "application/octet-stream");
}
