#include "crc32_baseline.hpp"

#include "crc32_combine.hpp"
#include "crc32_table.hpp"

uint32_t pcrc::internal::crc32::updateFast16(const uint32_t prev, const std::span<const std::byte> buf) {
    constexpr size_t UNROLL = 4;
    constexpr size_t BYTES_AT_ONCE = 16 * UNROLL;

    const auto &t = CRC32_TABLE;
    const auto *p = reinterpret_cast<const uint8_t *>(buf.data());
    size_t size = buf.size();

    uint32_t crc = ~prev;
    while (size >= BYTES_AT_ONCE) {
        for (size_t i = 0; i < UNROLL; ++i) {
            crc = t[0x0][p[0xf]]
                  ^ t[0x1][p[0xe]]
                  ^ t[0x2][p[0xd]]
                  ^ t[0x3][p[0xc]]
                  ^ t[0x4][p[0xb]]
                  ^ t[0x5][p[0xa]]
                  ^ t[0x6][p[0x9]]
                  ^ t[0x7][p[0x8]]
                  ^ t[0x8][p[0x7]]
                  ^ t[0x9][p[0x6]]
                  ^ t[0xa][p[0x5]]
                  ^ t[0xb][p[0x4]]
                  ^ t[0xc][p[0x3] ^ static_cast<uint8_t>(crc >> 24)]
                  ^ t[0xd][p[0x2] ^ static_cast<uint8_t>(crc >> 16)]
                  ^ t[0xe][p[0x1] ^ static_cast<uint8_t>(crc >> 8)]
                  ^ t[0xf][p[0x0] ^ static_cast<uint8_t>(crc)];
            p += 16;
        }
        size -= BYTES_AT_ONCE;
    }

    return updateSlow(~crc, {reinterpret_cast<const std::byte *>(p), size});
}

uint32_t pcrc::internal::crc32::updateSlow(const uint32_t prev, const std::span<const std::byte> buf) {
    const auto &t0 = CRC32_TABLE[0];
    uint32_t crc = ~prev;
    for (const std::byte b: buf) {
        crc = t0[static_cast<uint8_t>(crc) ^ std::to_integer<uint8_t>(b)] ^ (crc >> 8);
    }
    return ~crc;
}

pcrc::internal::crc32::ScalarEngine::ScalarEngine(const uint32_t state) : state(state) {
}

void pcrc::internal::crc32::ScalarEngine::update(const std::span<const std::byte> buf) {
    state = updateFast16(state, buf);
}

uint32_t pcrc::internal::crc32::ScalarEngine::finalize() const {
    return state;
}

void pcrc::internal::crc32::ScalarEngine::reset() {
    state = 0;
}

void pcrc::internal::crc32::ScalarEngine::combine(const uint32_t other, const uint64_t amount) {
    state = crc32::combine(state, other, amount);
}
