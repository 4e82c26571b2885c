#pragma once
#include <cstddef>
#include <memory>
#include <vector>

#include "io/WireBytes.hpp"
#include "memory/ChunkBuffer.hpp"

/**
 * @file BufferPool.hpp
 * @ingroup memory
 * @brief Bounded pool of reusable staging buffers with strict FIFO release.
 *
 * @details
 * The pool hands out the buffer a write-stream should fill next, packs small writes into the
 * active buffer until it is full, and allocates lazily up to `capacity()` buffers of
 * `buffer_size()` bytes each. Worst-case memory is `capacity() * buffer_size()`.
 *
 * Layout of the buffer sequence (oldest allocation first):
 *
 * @rst
 * .. code-block:: text
 *
 *   index:  0 .. active_index()        active_index()+1 .. size()-1
 *           in flight (FIFO order)     cleared, free for reuse
 * @endrst
 *
 * Buffers are released strictly in allocation order once downstream has accepted their data.
 * A released buffer is cleared and rotated to the tail, so the next rotation reuses it without
 * a fresh allocation. `reset()` drops every buffer (abort/close paths).
 *
 * Contract violations (growing past capacity, out-of-order or double release, releasing an
 * empty pool, `assert_empty()` with bytes staged) throw `std::invalid_argument`.
 *
 * ### Thread-safety
 * None. One write-stream owns the pool; concurrent callers must serialize externally.
 */

namespace chunkpool::memory
{

class BufferPool
{
  public:
    // Uses the copying conversion.
    BufferPool(std::size_t buffer_size, std::size_t capacity);
    BufferPool(std::size_t buffer_size, std::size_t capacity, io::ByteStringConversion conversion);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // Buffer to write into next: the active one while it has room, else the next free or a
    // freshly allocated buffer.
    ChunkBuffer& allocate_or_reuse_active();

    // `buffer` must be the oldest in-flight buffer.
    void release(const ChunkBuffer& buffer);

    // Active buffer, or nullptr when nothing is in flight. Never allocates.
    ChunkBuffer* current_buffer() noexcept;
    const ChunkBuffer* current_buffer() const noexcept;

    void reset() noexcept;

    void assert_empty() const;
    std::size_t total_buffered_bytes() const noexcept;

    std::size_t size() const noexcept { return buffers_.size(); }
    ChunkBuffer& buffer_at(std::size_t index);
    const ChunkBuffer& buffer_at(std::size_t index) const;
    int active_index() const noexcept { return current_; }
    std::size_t in_flight() const noexcept { return static_cast<std::size_t>(current_ + 1); }

    std::size_t buffer_size() const noexcept { return buffer_size_; }
    std::size_t capacity() const noexcept { return capacity_; }
    const io::ByteStringConversion& conversion() const noexcept { return conversion_; }

  private:
    std::size_t buffer_size_;
    std::size_t capacity_;
    io::ByteStringConversion conversion_;
    std::vector<std::unique_ptr<ChunkBuffer>> buffers_;
    int current_ = -1; // -1 == empty
};

} // namespace chunkpool::memory
