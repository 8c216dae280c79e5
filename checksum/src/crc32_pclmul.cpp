#include "crc32_pclmul.hpp"

#include "cpu_features.hpp"
#include "crc32_baseline.hpp"
#include "crc32_combine.hpp"
#include "crc32_table.hpp"

#if defined(__x86_64__) || defined(_M_X64)
#define PCRC_HAS_PCLMUL_ENGINE 1
#ifdef _MSC_VER
#include <intrin.h>
#define PCRC_TARGET_PCLMUL
#else
#include <immintrin.h>
#define PCRC_TARGET_PCLMUL __attribute__((target("pclmul,sse2,sse4.1")))
#endif
#else
#define PCRC_HAS_PCLMUL_ENGINE 0
#endif

#if PCRC_HAS_PCLMUL_ENGINE
namespace {
    // Folding constants for the reflected polynomial, (x^n mod P(x))' << 1
    constexpr int64_t K1 = 0x154442bd4; // x^(4*128+32)
    constexpr int64_t K2 = 0x1c6e41596; // x^(4*128-32)
    constexpr int64_t K3 = 0x1751997d0; // x^(128+32)
    constexpr int64_t K4 = 0x0ccaa009e; // x^(128-32)
    constexpr int64_t K5 = 0x163cd6124; // x^64
    constexpr int64_t K6 = 0x1db710640; // x^32

    // Barrett reduction: P(x)' and floor(x^64 / P(x))'
    constexpr int64_t P_X = 0x1db710641;
    constexpr int64_t U_PRIME = 0x1f7011641;

    // x^32 mod P(x) is the polynomial without its x^32 term
    static_assert(K6 == static_cast<int64_t>(uint64_t{pcrc::internal::crc32::CRC32_POLYNOMIAL} << 1));
    static_assert(P_X == (K6 | 1));

    constexpr size_t MIN_FOLD_SIZE = 128;

    PCRC_TARGET_PCLMUL inline __m128i load128(const uint8_t *&p) {
        const __m128i r = _mm_loadu_si128(reinterpret_cast<const __m128i *>(p));
        p += 16;
        return r;
    }

    /// (a.lo * keys.lo) ^ (a.hi * keys.hi) ^ b
    PCRC_TARGET_PCLMUL inline __m128i reduce128(const __m128i a, const __m128i b, const __m128i keys) {
        const __m128i t1 = _mm_clmulepi64_si128(a, keys, 0x00);
        const __m128i t2 = _mm_clmulepi64_si128(a, keys, 0x11);
        return _mm_xor_si128(_mm_xor_si128(b, t1), t2);
    }

    PCRC_TARGET_PCLMUL uint32_t calculate(const uint32_t crc, const std::span<const std::byte> buf) {
        if (buf.size() < MIN_FOLD_SIZE) {
            return pcrc::internal::crc32::updateFast16(crc, buf);
        }
        const auto *p = reinterpret_cast<const uint8_t *>(buf.data());
        size_t size = buf.size();

        __m128i x3 = load128(p);
        __m128i x2 = load128(p);
        __m128i x1 = load128(p);
        __m128i x0 = load128(p);
        size -= 64;

        // fold in the running CRC
        x3 = _mm_xor_si128(x3, _mm_cvtsi32_si128(static_cast<int>(~crc)));

        const __m128i k1k2 = _mm_set_epi64x(K2, K1);
        while (size >= 64) {
            x3 = reduce128(x3, load128(p), k1k2);
            x2 = reduce128(x2, load128(p), k1k2);
            x1 = reduce128(x1, load128(p), k1k2);
            x0 = reduce128(x0, load128(p), k1k2);
            size -= 64;
        }

        const __m128i k3k4 = _mm_set_epi64x(K4, K3);
        __m128i x = reduce128(x3, x2, k3k4);
        x = reduce128(x, x1, k3k4);
        x = reduce128(x, x0, k3k4);

        while (size >= 16) {
            x = reduce128(x, load128(p), k3k4);
            size -= 16;
        }

        // 128 -> 64 bits
        x = _mm_xor_si128(_mm_clmulepi64_si128(x, k3k4, 0x10), _mm_srli_si128(x, 8));

        // 64 -> 32 bits
        const __m128i low32 = _mm_set_epi32(0, 0, 0, ~0);
        x = _mm_xor_si128(
            _mm_clmulepi64_si128(_mm_and_si128(x, low32), _mm_set_epi64x(0, K5), 0x00),
            _mm_srli_si128(x, 4));

        // Barrett reduction down to the 32-bit remainder
        const __m128i pu = _mm_set_epi64x(U_PRIME, P_X);
        const __m128i t1 = _mm_clmulepi64_si128(_mm_and_si128(x, low32), pu, 0x10);
        const __m128i t2 = _mm_clmulepi64_si128(_mm_and_si128(t1, low32), pu, 0x00);
        const auto c = static_cast<uint32_t>(_mm_extract_epi32(_mm_xor_si128(x, t2), 1));

        if (size != 0) {
            return pcrc::internal::crc32::updateFast16(~c, {reinterpret_cast<const std::byte *>(p), size});
        }
        return ~c;
    }
} // end anonymous namespace
#endif

pcrc::internal::crc32::SimdEngine::SimdEngine(const uint32_t state) : state(state) {
}

std::optional<pcrc::internal::crc32::SimdEngine> pcrc::internal::crc32::SimdEngine::tryCreate(const uint32_t state) {
#if PCRC_HAS_PCLMUL_ENGINE
    if (cpu::hasPclmulEngineSupport()) {
        return SimdEngine(state);
    }
#endif
    return std::nullopt;
}

void pcrc::internal::crc32::SimdEngine::update(const std::span<const std::byte> buf) {
#if PCRC_HAS_PCLMUL_ENGINE
    state = calculate(state, buf);
#else
    // unreachable: tryCreate never yields an engine on targets without PCLMULQDQ
    state = updateFast16(state, buf);
#endif
}

uint32_t pcrc::internal::crc32::SimdEngine::finalize() const {
    return state;
}

void pcrc::internal::crc32::SimdEngine::reset() {
    state = 0;
}

void pcrc::internal::crc32::SimdEngine::combine(const uint32_t other, const uint64_t amount) {
    state = crc32::combine(state, other, amount);
}
