#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "ssrflab/gateway/http_server.hpp"

namespace ssrflab::gateway {

/// Serves files below a web root for GET and HEAD. Directories map to their
/// index.html; anything resolving outside the root is a 404.
class StaticFiles {
public:
    explicit StaticFiles(std::filesystem::path root);

    [[nodiscard]] auto serve(const Request& req) const -> Response;

    /// File under the root for a decoded request path, if it exists.
    [[nodiscard]] auto resolve(std::string_view path) const
        -> std::optional<std::filesystem::path>;

    [[nodiscard]] static auto content_type_for(const std::filesystem::path& file)
        -> std::string_view;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace ssrflab::gateway
