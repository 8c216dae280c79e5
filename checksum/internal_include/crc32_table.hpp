#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace pcrc::internal::crc32 {
    /// Reflected form of the CRC-32/ISO-HDLC generator polynomial 0x04c11db7
    inline constexpr uint32_t CRC32_POLYNOMIAL = 0xedb88320;

    inline constexpr size_t CRC32_TABLE_SLICES = 16;

    using crc32_table_t = std::array<std::array<uint32_t, 256>, CRC32_TABLE_SLICES>;

    [[nodiscard]] constexpr crc32_table_t makeCrc32Table() {
        crc32_table_t table{};
        for (uint32_t n = 0; n < 256; ++n) {
            uint32_t crc = n;
            for (int k = 0; k < 8; ++k) {
                crc = (crc & 1) ? (crc >> 1) ^ CRC32_POLYNOMIAL : (crc >> 1);
            }
            table[0][n] = crc;
        }
        for (size_t slice = 1; slice < CRC32_TABLE_SLICES; ++slice) {
            for (size_t n = 0; n < 256; ++n) {
                const uint32_t prev = table[slice - 1][n];
                table[slice][n] = (prev >> 8) ^ table[0][prev & 0xff];
            }
        }
        return table;
    }

    /// Slice-by-16 skew tables.
    /// Row k holds the CRC contribution of a byte that is followed by k further bytes.
    inline constexpr crc32_table_t CRC32_TABLE = makeCrc32Table();

    static_assert(CRC32_TABLE[0][1] == 0x77073096);
    static_assert(CRC32_TABLE[0][255] == 0x2d02ef8d);
}
