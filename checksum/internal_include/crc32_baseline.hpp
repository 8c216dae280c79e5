#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace pcrc::internal::crc32 {
    /// Extends the CRC-32 @code prev@endcode over @code buf@endcode using slice-by-16 table lookups,
    /// 64 bytes per iteration. Bytes that do not fill a whole 64-byte block are handed to @code updateSlow@endcode.
    /// Both @code prev@endcode and the result are un-complemented CRC values.
    [[nodiscard]] uint32_t updateFast16(uint32_t prev, std::span<const std::byte> buf);

    /// Classic byte-at-a-time CRC-32 update
    [[nodiscard]] uint32_t updateSlow(uint32_t prev, std::span<const std::byte> buf);

    /// Portable table-driven engine. Always constructible.
    class ScalarEngine final {
        uint32_t state;

    public:
        explicit ScalarEngine(uint32_t state);

        void update(std::span<const std::byte> buf);

        [[nodiscard]] uint32_t finalize() const;

        /// Sets the remainder to zero, regardless of the initial state
        void reset();

        /// See @code pcrc::internal::crc32::combine@endcode
        void combine(uint32_t other, uint64_t amount);
    };
}
