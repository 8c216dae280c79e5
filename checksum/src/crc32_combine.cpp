#include "crc32_combine.hpp"

#include <array>
#include <cstddef>

#include "crc32_table.hpp"

namespace pcrc::internal::crc32 {
    namespace {
        /// x^0 in reflected representation
        constexpr uint32_t X_POW_0 = 1u << 31;

        [[nodiscard]] constexpr uint32_t multModPImpl(const uint32_t a, uint32_t b) {
            uint32_t product = 0;
            for (uint32_t m = X_POW_0; m != 0; m >>= 1) {
                if (a & m) {
                    product ^= b;
                }
                // b *= x
                b = (b & 1) ? (b >> 1) ^ CRC32_POLYNOMIAL : (b >> 1);
            }
            return product;
        }

        // x^(8 * n) for a 64-bit n needs powers up to x^(2^66)
        constexpr size_t X2N_TABLE_SIZE = 64 + 3;

        /// X2N_TABLE[k] = x^(2^k) mod P(x)
        [[nodiscard]] constexpr std::array<uint32_t, X2N_TABLE_SIZE> makeX2nTable() {
            std::array<uint32_t, X2N_TABLE_SIZE> table{};
            uint32_t p = X_POW_0 >> 1; // x^1
            table[0] = p;
            for (size_t k = 1; k < X2N_TABLE_SIZE; ++k) {
                p = multModPImpl(p, p);
                table[k] = p;
            }
            return table;
        }

        constexpr std::array<uint32_t, X2N_TABLE_SIZE> X2N_TABLE = makeX2nTable();

        static_assert(X2N_TABLE[3] == (X_POW_0 >> 8)); // x^8
        static_assert(X2N_TABLE[4] == (X_POW_0 >> 16)); // x^16
    } // end anonymous namespace

    uint32_t multModP(const uint32_t a, const uint32_t b) {
        return multModPImpl(a, b);
    }

    uint32_t xPow8nModP(uint64_t n) {
        uint32_t p = X_POW_0;
        // square-and-multiply over the bits of n; bit i contributes x^(2^(i + 3))
        for (size_t k = 3; n != 0; n >>= 1, ++k) {
            if (n & 1) {
                p = multModPImpl(X2N_TABLE[k], p);
            }
        }
        return p;
    }

    uint32_t combine(const uint32_t crc1, const uint32_t crc2, const uint64_t len2) {
        return multModPImpl(xPow8nModP(len2), crc1) ^ crc2;
    }
} // namespace pcrc::internal::crc32
