#pragma once

#include <string>
#include <string_view>

namespace ssrflab {

/// The privileged value guarded by the internal service. Set once at
/// process start and immutable afterwards.
class Secret {
public:
    explicit Secret(std::string value) : value_(std::move(value)) {}

    Secret(const Secret&) = default;
    Secret& operator=(const Secret&) = delete;

    [[nodiscard]] auto value() const noexcept -> std::string_view { return value_; }

private:
    const std::string value_;
};

} // namespace ssrflab
