#include "memory/AlignedAlloc.hpp"
#include "memory/ChunkBuffer.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <cstdint>

using namespace chunkpool::memory;

TEST_CASE("Chunk buffers respect HW boundary", "[memory][alignment]")
{
    const std::size_t bytes = GENERATE(1, 63, 64, 1000, 4096, 1 << 20);
    ChunkBuffer b(bytes);
    REQUIRE(reinterpret_cast<std::uintptr_t>(b.data()) % HW_ALIGN == 0);
}

TEST_CASE("aligned_malloc honours page alignment and falls back on bad alignment",
          "[memory][alignment]")
{
    void* p = aligned_malloc(5000, PAGE_ALIGN);
    CHECK(reinterpret_cast<std::uintptr_t>(p) % PAGE_ALIGN == 0);
    aligned_free(p);

    void* q = aligned_malloc(100, 48); // not a power of two
    CHECK(reinterpret_cast<std::uintptr_t>(q) % HW_ALIGN == 0);
    aligned_free(q);
}
