#include "io/PoolConfig.hpp"
#include "io/WireBytes.hpp"
#include "memory/BufferPool.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace chunkpool::io;
using chunkpool::memory::BufferPool;
using chunkpool::memory::ChunkBuffer;

static std::vector<std::byte> seq(std::size_t n, unsigned char start)
{
    std::vector<std::byte> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::byte>(start + i);
    return v;
}

TEST_CASE("Copy conversion survives buffer reuse", "[io][conversion]")
{
    BufferPool pool(8, 1, make_copy_conversion());
    ChunkBuffer& b = pool.allocate_or_reuse_active();
    b.put(seq(8, 10));

    WireBytes wire = pool.conversion()(b.written());
    CHECK(wire.owns_storage());
    CHECK(wire.data() != b.data());

    pool.release(b);
    ChunkBuffer& again = pool.allocate_or_reuse_active();
    REQUIRE(&again == &b);
    again.put(seq(8, 100)); // overwrite the same memory

    CHECK(wire == WireBytes::copy_of(seq(8, 10)));
}

TEST_CASE("Wrap conversion is a zero-copy view of the buffer", "[io][conversion]")
{
    BufferPool pool(8, 1, make_wrap_conversion());
    ChunkBuffer& b = pool.allocate_or_reuse_active();
    b.put(seq(5, 1));

    WireBytes wire = pool.conversion()(b.written());
    CHECK_FALSE(wire.owns_storage());
    CHECK(wire.data() == b.data());
    CHECK(wire.size() == 5);
    CHECK(wire == WireBytes::copy_of(seq(5, 1)));
}

TEST_CASE("create_byte_buffer_conversion selects by flag", "[io][conversion]")
{
    const auto data = seq(3, 0);
    CHECK(create_byte_buffer_conversion(false)(data).owns_storage());
    CHECK_FALSE(create_byte_buffer_conversion(true)(data).owns_storage());

    PoolConfig cfg;
    cfg.conversion = PoolConfig::Conversion::Wrap;
    CHECK_FALSE(make_conversion(cfg)(data).owns_storage());
}

TEST_CASE("WireBytes compares content", "[io]")
{
    CHECK(WireBytes{} == WireBytes::copy_of({}));
    CHECK(WireBytes{}.empty());
    CHECK_FALSE(WireBytes::copy_of(seq(2, 1)) == WireBytes::copy_of(seq(2, 2)));
    CHECK_FALSE(WireBytes::copy_of(seq(2, 1)) == WireBytes::copy_of(seq(3, 1)));
}

TEST_CASE("Pool built without a conversion falls back to copy", "[io][conversion]")
{
    BufferPool pool(8, 1, ByteStringConversion{});
    REQUIRE(static_cast<bool>(pool.conversion()));
    ChunkBuffer& b = pool.allocate_or_reuse_active();
    b.put(seq(2, 7));
    CHECK(pool.conversion()(b.written()).owns_storage());
}
