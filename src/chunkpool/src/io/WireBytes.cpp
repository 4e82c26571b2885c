#include "io/WireBytes.hpp"
#include <algorithm>

namespace chunkpool::io
{

WireBytes WireBytes::copy_of(std::span<const std::byte> bytes)
{
    WireBytes w;
    auto storage = std::make_shared<const std::vector<std::byte>>(bytes.begin(), bytes.end());
    w.view_ = std::span<const std::byte>(storage->data(), storage->size());
    w.owner_ = std::move(storage);
    return w;
}

WireBytes WireBytes::wrap(std::span<const std::byte> bytes) noexcept
{
    WireBytes w;
    w.view_ = bytes;
    return w;
}

bool operator==(const WireBytes& a, const WireBytes& b) noexcept
{
    return std::equal(a.view_.begin(), a.view_.end(), b.view_.begin(), b.view_.end());
}

ByteStringConversion make_copy_conversion()
{
    return [](std::span<const std::byte> region) { return WireBytes::copy_of(region); };
}

ByteStringConversion make_wrap_conversion()
{
    return [](std::span<const std::byte> region) { return WireBytes::wrap(region); };
}

ByteStringConversion create_byte_buffer_conversion(bool unsafe_wrap)
{
    return unsafe_wrap ? make_wrap_conversion() : make_copy_conversion();
}

} // namespace chunkpool::io
