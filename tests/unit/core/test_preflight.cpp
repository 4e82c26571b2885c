#include "io/Preflight.hpp"
#include <catch2/catch_test_macros.hpp>
#include <limits>

using namespace chunkpool::io;

TEST_CASE("Preflight passes when the worst case fits in RAM", "[preflight]")
{
    PoolConfig cfg;
    cfg.buffer_size = 4u << 20;
    cfg.capacity = 8; // 32 MB worst case

    auto [ok, msg] = run_preflight(cfg, 1ull << 30);
    CHECK(ok);
    CHECK(msg.find("worst_case_bytes=33554432") != std::string::npos);
    CHECK(msg.find("conversion=copy") != std::string::npos);
    CHECK(msg.find("RAM check failed") == std::string::npos);
}

TEST_CASE("Preflight fails when the worst case plus headroom exceeds RAM", "[preflight]")
{
    PoolConfig cfg;
    cfg.buffer_size = 64u << 20;
    cfg.capacity = 16; // 1 GB worst case
    cfg.conversion = PoolConfig::Conversion::Wrap;

    auto [ok, msg] = run_preflight(cfg, 1ull << 30);
    CHECK_FALSE(ok);
    CHECK(msg.find("RAM check failed") != std::string::npos);
    CHECK(msg.find("conversion=wrap") != std::string::npos);
}

TEST_CASE("Preflight with unknown RAM fails closed", "[preflight]")
{
    PoolConfig cfg;
    auto [ok, msg] = run_preflight(cfg, 0);
    CHECK_FALSE(ok);
}

TEST_CASE("Worst case saturates instead of wrapping", "[preflight]")
{
    PoolConfig cfg;
    cfg.buffer_size = std::size_t{16} << 30;
    cfg.capacity = std::size_t{1} << 30; // 2^64 bytes, wraps to 0 if unchecked

    CHECK(cfg.worst_case_bytes() == std::numeric_limits<std::size_t>::max());

    auto [ok, msg] = run_preflight(cfg, 1ull << 30);
    CHECK_FALSE(ok);
    CHECK(msg.find("overflows") != std::string::npos);
    CHECK(msg.find("RAM check failed") != std::string::npos);
}

TEST_CASE("Headroom on a near-limit worst case does not wrap", "[preflight]")
{
    PoolConfig cfg;
    cfg.buffer_size = 1;
    cfg.capacity = std::numeric_limits<std::size_t>::max() - (1u << 20); // + 64MB overhead wraps

    auto [ok, msg] = run_preflight(cfg, std::numeric_limits<std::size_t>::max());
    CHECK_FALSE(ok);
}
