#pragma once
#include <cstddef>
#include <string>
#include <utility>

#include "PoolConfig.hpp"

/**
 * @file Preflight.hpp
 * @brief RAM sanity check for a pool configuration.
 *
 * @details
 * Worst-case pool memory is `capacity * buffer_size`. The check adds headroom and compares
 * against the RAM the caller reports as available.
 *
 * @return `{ok, message}` where `message` summarizes byte counts and the conversion mode.
 */

namespace chunkpool::io
{

// Returns {ok, message}. If ok=false and preflight is enabled, the app should abort.
std::pair<bool, std::string> run_preflight(const PoolConfig& cfg, std::size_t available_ram_bytes);

// Best-effort free RAM from sysinfo; 0 when unknown.
std::size_t query_available_ram_bytes() noexcept;

} // namespace chunkpool::io
