#pragma once
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "Log.hpp"
#include "io/PoolConfig.hpp"

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML -> AppConfig loader and schema for the chunkpool simulator.
 *
 * @details
 * @rst
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    pool:
 *      buffer_size: 4MB             # bytes; integer or B/KB/MB/GB suffix (1024-based)
 *      capacity: 8                  # buffers; if absent, derived from max_bytes
 *      max_bytes: 32MB              # capacity = max_bytes / buffer_size (at least 1)
 *      conversion: copy             # copy | wrap
 *
 *    log:
 *      level: info                  # quiet | error | warn | info | debug
 *
 *    preflight:
 *      enabled: true
 *      ram_bytes: auto              # auto | size
 *
 *    sim:
 *      chunks: 64                   # simulated writes
 *      write_bytes: 1MB             # bytes per write
 *      seed: 7
 *
 * **Semantics**
 *
 * - ``pool.capacity`` takes precedence; else ``pool.max_bytes`` derives it via
 *   ``max(1, max_bytes / buffer_size)``.
 * - ``log.level`` is applied with :cpp:func:`chunkpool::logx::init`; leaving it at ``info``
 *   still lets ``CHUNKPOOL_LOG`` override.
 * - ``preflight`` checks ``capacity * buffer_size`` against RAM before the pool is built.
 * @endrst
 */

struct AppConfig
{
    chunkpool::io::PoolConfig pool{};
    std::optional<std::size_t> pool_max_bytes; // optional

    chunkpool::logx::Level log_level = chunkpool::logx::Level::Info;

    struct Preflight
    {
        bool enabled = true;
        std::optional<std::size_t> ram_bytes;
    } preflight;

    struct Sim
    {
        int chunks = 64;
        std::size_t write_bytes = 1u << 20;
        std::uint32_t seed = 7;
    } sim;
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

// "4096", "64KB", "4MB", "1 GB", "512b" -> bytes (1024-based). Throws on garbage.
static inline std::size_t parse_bytes(const std::string& text)
{
    std::string s = to_lower(text);
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }),
            s.end());
    std::size_t i = 0;
    while (i < s.size() && std::isdigit((unsigned char) s[i]))
        ++i;
    if (i == 0)
        throw std::runtime_error("[config] not a byte size: '" + text + "'");

    unsigned long long n = 0;
    try
    {
        n = std::stoull(s.substr(0, i));
    }
    catch (const std::out_of_range&)
    {
        throw std::runtime_error("[config] size overflows: '" + text + "'");
    }
    const std::string unit = s.substr(i);
    unsigned long long mult = 1;
    if (unit.empty() || unit == "b")
        mult = 1;
    else if (unit == "k" || unit == "kb")
        mult = 1ull << 10;
    else if (unit == "m" || unit == "mb")
        mult = 1ull << 20;
    else if (unit == "g" || unit == "gb")
        mult = 1ull << 30;
    else
        throw std::runtime_error("[config] unknown size unit '" + unit + "' in '" + text + "'");
    if (n > std::numeric_limits<std::size_t>::max() / mult)
        throw std::runtime_error("[config] size overflows: '" + text + "'");
    return (std::size_t) (n * mult);
}

static inline chunkpool::io::PoolConfig::Conversion parse_conversion(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "wrap" || v == "unsafe")
        return chunkpool::io::PoolConfig::Conversion::Wrap;
    return chunkpool::io::PoolConfig::Conversion::Copy;
}

inline AppConfig load_config_from_yaml(const std::string& path)
{
    AppConfig cfg;
    YAML::Node root = YAML::LoadFile(path);

    bool capacity_set = false;
    if (auto p = root["pool"])
    {
        if (auto n = p["buffer_size"])
            cfg.pool.buffer_size = parse_bytes(n.as<std::string>());
        if (auto n = p["capacity"])
        {
            const long long c = n.as<long long>();
            if (c <= 0)
                throw std::runtime_error("[config] pool.capacity must be positive");
            cfg.pool.capacity = (std::size_t) c;
            capacity_set = true;
        }
        if (auto n = p["max_bytes"])
            cfg.pool_max_bytes = parse_bytes(n.as<std::string>());
        if (auto n = p["conversion"])
            cfg.pool.conversion = parse_conversion(n.as<std::string>());
    }
    if (cfg.pool.buffer_size == 0)
        throw std::runtime_error("[config] pool.buffer_size must be positive");

    if (auto l = root["log"])
    {
        if (auto n = l["level"])
            cfg.log_level = chunkpool::logx::parse_level(n.as<std::string>());
    }

    if (auto P = root["preflight"])
    {
        if (auto n = P["enabled"])
            cfg.preflight.enabled = n.as<bool>();
        if (auto n = P["ram_bytes"])
        {
            const auto s = to_lower(n.as<std::string>());
            if (s != "auto")
                cfg.preflight.ram_bytes = parse_bytes(s);
        }
    }

    if (auto S = root["sim"])
    {
        if (auto n = S["chunks"])
            cfg.sim.chunks = std::max(0, n.as<int>());
        if (auto n = S["write_bytes"])
            cfg.sim.write_bytes = parse_bytes(n.as<std::string>());
        if (auto n = S["seed"])
            cfg.sim.seed = n.as<std::uint32_t>();
    }

    // derive capacity from max_bytes if provided
    if (!capacity_set && cfg.pool_max_bytes.has_value())
        cfg.pool.capacity = std::max<std::size_t>(1, *cfg.pool_max_bytes / cfg.pool.buffer_size);

    return cfg;
}
