#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace pcrc::internal::crc32 {
    /// CRC-32 engine folding 128 bytes per iteration with carry-less multiplication (PCLMULQDQ),
    /// after Intel's "Fast CRC Computation for Generic Polynomials Using PCLMULQDQ Instruction".
    /// Inputs shorter than 128 bytes, and the final bytes not filling a 16-byte lane,
    /// go through the slice-by-16 scalar path.
    class SimdEngine final {
        uint32_t state;

        explicit SimdEngine(uint32_t state);

    public:
        /// Returns std::nullopt if the executing CPU lacks sse2, sse4.1 or pclmulqdq.
        /// Callers are expected to fall back to @code ScalarEngine@endcode in that case.
        [[nodiscard]] static std::optional<SimdEngine> tryCreate(uint32_t state);

        void update(std::span<const std::byte> buf);

        [[nodiscard]] uint32_t finalize() const;

        /// Sets the remainder to zero, regardless of the initial state
        void reset();

        /// See @code pcrc::internal::crc32::combine@endcode
        void combine(uint32_t other, uint64_t amount);
    };
}
