#pragma once

#include <cstdint>
#include <optional>

namespace ssrflab::infra {

/// Checks whether the given TCP port is free on the loopback interface.
auto is_port_available(uint16_t port) -> bool;

/// Finds the first available loopback TCP port starting from `start_port`.
/// Scans up to `max_attempts` ports sequentially.
/// Returns std::nullopt if no free port is found within the range.
auto find_free_port(uint16_t start_port = 18000,
                    uint16_t max_attempts = 100) -> std::optional<uint16_t>;

} // namespace ssrflab::infra
