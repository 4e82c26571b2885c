#include "memory/ChunkBuffer.hpp"
#include "memory/AlignedAlloc.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace chunkpool::memory
{

ChunkBuffer::ChunkBuffer(std::size_t capacity) : mem_(aligned_malloc(capacity)), cap_(capacity)
{
}

ChunkBuffer::~ChunkBuffer() = default;

void ChunkBuffer::put(std::span<const std::byte> bytes)
{
    if (bytes.size() > remaining())
        throw std::out_of_range("[chunk_buffer] put of " + std::to_string(bytes.size()) +
                                " bytes exceeds remaining " + std::to_string(remaining()));
    if (!bytes.empty())
        std::memcpy(data() + pos_, bytes.data(), bytes.size());
    pos_ += bytes.size();
}

std::size_t ChunkBuffer::put_some(std::span<const std::byte> bytes) noexcept
{
    const std::size_t n = std::min(bytes.size(), remaining());
    if (n)
        std::memcpy(data() + pos_, bytes.data(), n);
    pos_ += n;
    return n;
}

/// \cond DOXYGEN_EXCLUDE
void ChunkBuffer::Deleter::operator()(void* p) const noexcept
{
    aligned_free(p);
}
/// \endcond

} // namespace chunkpool::memory
