#pragma once
#include <cstddef>
#include <limits>

#include "io/WireBytes.hpp"

/**
 * @file PoolConfig.hpp
 * @brief Constructor-time sizing of a BufferPool.
 *
 * @details
 * `buffer_size` is the size of every buffer; `capacity` bounds how many buffers may be in
 * flight at once, so worst-case memory is `capacity * buffer_size`. `conversion` selects how a
 * filled region becomes wire bytes (copy into owned storage, or zero-copy wrap).
 *
 * @rst
 * .. code-block:: cpp
 *
 *   PoolConfig cfg;
 *   cfg.buffer_size = 4u << 20;
 *   cfg.capacity    = 8;
 *   BufferPool pool(cfg.buffer_size, cfg.capacity, make_conversion(cfg));
 * @endrst
 */

namespace chunkpool::io
{

struct PoolConfig
{
    enum class Conversion
    {
        Copy,
        Wrap
    };

    std::size_t buffer_size = 4u << 20; // 4 MB
    std::size_t capacity = 8;
    Conversion conversion = Conversion::Copy;

    // Saturates at SIZE_MAX instead of wrapping.
    std::size_t worst_case_bytes() const noexcept
    {
        if (buffer_size != 0 && capacity > std::numeric_limits<std::size_t>::max() / buffer_size)
            return std::numeric_limits<std::size_t>::max();
        return buffer_size * capacity;
    }
};

inline ByteStringConversion make_conversion(const PoolConfig& cfg)
{
    return create_byte_buffer_conversion(cfg.conversion == PoolConfig::Conversion::Wrap);
}

} // namespace chunkpool::io
