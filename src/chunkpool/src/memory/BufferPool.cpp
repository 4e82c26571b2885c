#include "memory/BufferPool.hpp"
#include "Log.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkpool::memory
{

[[noreturn]] static void contract_violation(const std::string& what)
{
    LOGE("[buffer_pool] %s\n", what.c_str());
    throw std::invalid_argument("[buffer_pool] " + what);
}

BufferPool::BufferPool(std::size_t buffer_size, std::size_t capacity)
    : BufferPool(buffer_size, capacity, io::create_byte_buffer_conversion(false))
{
}

BufferPool::BufferPool(std::size_t buffer_size, std::size_t capacity,
                       io::ByteStringConversion conversion)
    : buffer_size_(buffer_size), capacity_(capacity), conversion_(std::move(conversion))
{
    if (buffer_size_ == 0 || capacity_ == 0)
        throw std::invalid_argument("[buffer_pool] buffer_size and capacity must be non-zero");
    if (!conversion_)
        conversion_ = io::create_byte_buffer_conversion(false);
    buffers_.reserve(capacity_);
}

ChunkBuffer* BufferPool::current_buffer() noexcept
{
    return current_ < 0 ? nullptr : buffers_[static_cast<std::size_t>(current_)].get();
}

const ChunkBuffer* BufferPool::current_buffer() const noexcept
{
    return current_ < 0 ? nullptr : buffers_[static_cast<std::size_t>(current_)].get();
}

ChunkBuffer& BufferPool::allocate_or_reuse_active()
{
    if (ChunkBuffer* active = current_buffer(); active && active->has_remaining())
        return *active;

    const std::size_t next = static_cast<std::size_t>(current_ + 1);
    ChunkBuffer* buffer = nullptr;
    if (next < buffers_.size())
    {
        buffer = buffers_[next].get();
        // Free slots are cleared on release; anything else means the tail was written behind
        // the pool's back.
        if (buffer->position() != 0)
            contract_violation("reused buffer at index " + std::to_string(next) +
                               " is not empty (position=" + std::to_string(buffer->position()) +
                               ")");
        LOGD("[buffer_pool] reuse index=%zu\n", next);
    }
    else
    {
        if (buffers_.size() >= capacity_)
            contract_violation("allocation beyond capacity=" + std::to_string(capacity_) +
                               "; all buffers are in flight");
        buffers_.push_back(std::make_unique<ChunkBuffer>(buffer_size_));
        buffer = buffers_.back().get();
        LOGD("[buffer_pool] allocate index=%zu bytes=%zu\n", next, buffer_size_);
    }
    ++current_;
    return *buffer;
}

void BufferPool::release(const ChunkBuffer& buffer)
{
    if (current_ < 0)
        contract_violation("release with no buffer in flight");
    // Acknowledgments arrive in write order, so only the head can be released.
    if (!(*buffers_.front() == buffer))
        contract_violation("release of a buffer that is not the oldest in flight");

    buffers_.front()->clear();
    std::rotate(buffers_.begin(), buffers_.begin() + 1, buffers_.end());
    --current_;
    LOGD("[buffer_pool] release -> active=%d in_flight=%zu\n", current_, in_flight());
}

void BufferPool::reset() noexcept
{
    if (!buffers_.empty())
        LOGI("[buffer_pool] reset: dropping %zu buffers (%zu bytes staged)\n", buffers_.size(),
             total_buffered_bytes());
    buffers_.clear();
    current_ = -1;
}

void BufferPool::assert_empty() const
{
    const std::size_t staged = total_buffered_bytes();
    if (staged != 0)
        contract_violation("pool still holds " + std::to_string(staged) + " unflushed bytes");
}

std::size_t BufferPool::total_buffered_bytes() const noexcept
{
    std::size_t sum = 0;
    for (const auto& b : buffers_)
        sum += b->position();
    return sum;
}

ChunkBuffer& BufferPool::buffer_at(std::size_t index)
{
    if (index >= buffers_.size())
        throw std::out_of_range("[buffer_pool] index " + std::to_string(index) +
                                " out of range (size=" + std::to_string(buffers_.size()) + ")");
    return *buffers_[index];
}

const ChunkBuffer& BufferPool::buffer_at(std::size_t index) const
{
    if (index >= buffers_.size())
        throw std::out_of_range("[buffer_pool] index " + std::to_string(index) +
                                " out of range (size=" + std::to_string(buffers_.size()) + ")");
    return *buffers_[index];
}

} // namespace chunkpool::memory
