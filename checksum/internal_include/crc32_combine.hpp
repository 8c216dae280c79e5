#pragma once

#include <cstdint>

namespace pcrc::internal::crc32 {
    /// Multiplies two polynomials modulo the CRC-32 generator polynomial.
    /// Both operands use the reflected bit order of the CRC: bit 31 is the coefficient of x^0.
    [[nodiscard]] uint32_t multModP(uint32_t a, uint32_t b);

    /// Returns x^(8 * n) modulo the CRC-32 generator polynomial, i.e. the operator that
    /// shifts a CRC over n zero bytes. O(log n).
    [[nodiscard]] uint32_t xPow8nModP(uint64_t n);

    /// Given @code crc1@endcode over some prefix and @code crc2@endcode over the following
    /// @code len2@endcode bytes, returns the CRC-32 of the concatenation.
    /// Works on final CRC values only, so the result does not depend on the engine that produced them.
    [[nodiscard]] uint32_t combine(uint32_t crc1, uint32_t crc2, uint64_t len2);
}
