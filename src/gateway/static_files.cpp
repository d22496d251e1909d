#include "ssrflab/gateway/static_files.hpp"

#include "ssrflab/core/logger.hpp"
#include "ssrflab/core/utils.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>

namespace ssrflab::gateway {

namespace fs = std::filesystem;

namespace {

/// True if `path` is `root` or lies below it. Both must be canonical.
auto is_within(const fs::path& path, const fs::path& root) -> bool {
    auto [root_end, path_it] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return root_end == root.end();
}

} // anonymous namespace

StaticFiles::StaticFiles(fs::path root) {
    std::error_code ec;
    root_ = fs::weakly_canonical(root, ec);
    if (ec) {
        root_ = std::move(root);
    }
}

auto StaticFiles::content_type_for(const fs::path& file) -> std::string_view {
    static const std::map<std::string, std::string_view> types = {
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".css", "text/css; charset=utf-8"},
        {".js", "application/javascript; charset=utf-8"},
        {".json", "application/json; charset=utf-8"},
        {".txt", "text/plain; charset=utf-8"},
        {".svg", "image/svg+xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".ico", "image/x-icon"},
    };
    auto it = types.find(utils::to_lower(file.extension().string()));
    return it != types.end() ? it->second : "application/octet-stream";
}

auto StaticFiles::resolve(std::string_view path) const -> std::optional<fs::path> {
    if (path.find('\0') != std::string_view::npos) return std::nullopt;

    auto relative = fs::path(path).relative_path();
    std::error_code ec;
    auto candidate = fs::weakly_canonical(root_ / relative, ec);
    if (ec || !is_within(candidate, root_)) {
        return std::nullopt;
    }

    if (fs::is_directory(candidate, ec)) {
        candidate /= "index.html";
    }
    if (!fs::is_regular_file(candidate, ec)) {
        return std::nullopt;
    }
    return candidate;
}

auto StaticFiles::serve(const Request& req) const -> Response {
    auto target = target_of(req);
    auto raw_path = utils::target_path(target);
    auto not_found = "Cannot " + method_of(req) + " " + std::string(raw_path);

    if (req.method() != http::verb::get && req.method() != http::verb::head) {
        return make_text_response(req, http::status::not_found, not_found);
    }

    auto file = resolve(utils::percent_decode(raw_path));
    if (!file) {
        return make_text_response(req, http::status::not_found, not_found);
    }

    std::ifstream in(*file, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Static file {} could not be opened", file->string());
        return make_text_response(req, http::status::not_found, not_found);
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    return make_text_response(req, http::status::ok, std::move(content),
                              content_type_for(*file));
}

} // namespace ssrflab::gateway
