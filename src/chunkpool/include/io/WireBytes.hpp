#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <vector>

/**
 * @file WireBytes.hpp
 * @brief Immutable wire-ready byte sequences and the conversions that produce them.
 *
 * @details
 * A filled ChunkBuffer region is turned into :cpp:class:`WireBytes` at flush time by a
 * :cpp:type:`ByteStringConversion`. Two conversions are provided:
 *
 * - **copy**: the bytes are copied into shared, owned storage. The result stays valid after
 *   the source buffer is cleared and reused.
 * - **wrap**: zero-copy view of the source region. Only valid until the buffer is released
 *   back to the pool; callers must keep the buffer in flight while the view is alive.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto conv = create_byte_buffer_conversion(false); // copy
 *   WireBytes w = conv(buf.written());
 * @endrst
 */

namespace chunkpool::io
{

class WireBytes
{
  public:
    WireBytes() = default;

    // Owned copy of `bytes`.
    static WireBytes copy_of(std::span<const std::byte> bytes);
    // Non-owning view of `bytes`; the caller keeps the storage alive.
    static WireBytes wrap(std::span<const std::byte> bytes) noexcept;

    std::span<const std::byte> bytes() const noexcept { return view_; }
    const std::byte* data() const noexcept { return view_.data(); }
    std::size_t size() const noexcept { return view_.size(); }
    bool empty() const noexcept { return view_.empty(); }
    bool owns_storage() const noexcept { return static_cast<bool>(owner_); }

    // Content comparison.
    friend bool operator==(const WireBytes& a, const WireBytes& b) noexcept;

  private:
    std::shared_ptr<const std::vector<std::byte>> owner_;
    std::span<const std::byte> view_;
};

using ByteStringConversion = std::function<WireBytes(std::span<const std::byte>)>;

ByteStringConversion make_copy_conversion();
ByteStringConversion make_wrap_conversion();

// unsafe_wrap == true selects the zero-copy conversion.
ByteStringConversion create_byte_buffer_conversion(bool unsafe_wrap);

} // namespace chunkpool::io
