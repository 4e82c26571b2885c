#pragma once
#include <cstddef>
#include <memory>
#include <span>

/**
 * @file ChunkBuffer.hpp
 * @ingroup memory
 * @brief Fixed-capacity, aligned byte region with a write cursor.
 *
 * @details
 * A ChunkBuffer owns `capacity()` bytes allocated once with `aligned_malloc`. Writers append
 * at `position()`; `clear()` rewinds the cursor without touching the allocation so the region
 * can be reused for the next chunk. Buffers are neither copyable nor movable: the pool hands
 * out references and checks release order by identity.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   ChunkBuffer buf(4096);
 *   std::size_t n = buf.put_some(payload);  // may be < payload.size() when full
 *   auto filled  = buf.written();           // [0, position)
 *   buf.clear();                            // position == 0, memory retained
 * @endrst
 */

namespace chunkpool::memory
{

class ChunkBuffer
{
  public:
    explicit ChunkBuffer(std::size_t capacity);
    ~ChunkBuffer();

    ChunkBuffer(const ChunkBuffer&) = delete;
    ChunkBuffer& operator=(const ChunkBuffer&) = delete;

    std::size_t capacity() const noexcept { return cap_; }
    std::size_t position() const noexcept { return pos_; }
    std::size_t remaining() const noexcept { return cap_ - pos_; }
    bool has_remaining() const noexcept { return pos_ < cap_; }

    // Append all of `bytes`; throws std::out_of_range (buffer unchanged) if they do not fit.
    void put(std::span<const std::byte> bytes);

    // Append as much of `bytes` as fits and return the count copied.
    std::size_t put_some(std::span<const std::byte> bytes) noexcept;

    // Bytes written since the last clear().
    std::span<const std::byte> written() const noexcept { return {data(), pos_}; }

    // Rewind the write cursor. Capacity and memory are retained.
    void clear() noexcept { pos_ = 0; }

    std::byte* data() noexcept { return static_cast<std::byte*>(mem_.get()); }
    const std::byte* data() const noexcept { return static_cast<const std::byte*>(mem_.get()); }

    // Identity, never content.
    friend bool operator==(const ChunkBuffer& a, const ChunkBuffer& b) noexcept
    {
        return &a == &b;
    }

  private:
    struct Deleter
    {
        void operator()(void* p) const noexcept;
    };

    std::unique_ptr<void, Deleter> mem_{nullptr};
    std::size_t cap_ = 0;
    std::size_t pos_ = 0;
};

} // namespace chunkpool::memory
