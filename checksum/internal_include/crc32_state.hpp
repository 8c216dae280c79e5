#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>

#include "crc32_baseline.hpp"
#include "crc32_pclmul.hpp"

namespace pcrc {
    /// Running CRC-32/ISO-HDLC checksum.
    /// The backing engine is chosen once at construction: the PCLMULQDQ engine if the CPU supports it,
    /// the slice-by-16 table engine otherwise. Results are identical for both.
    /// Not synchronized; independent instances may be computed in parallel and merged with combine().
    class ChecksumState final {
        std::variant<internal::crc32::ScalarEngine, internal::crc32::SimdEngine> engine;

        explicit ChecksumState(internal::crc32::ScalarEngine engine);

        explicit ChecksumState(internal::crc32::SimdEngine engine);

    public:
        /// @param initial_state 0 for a fresh checksum, or a previously finalized CRC to continue it
        explicit ChecksumState(uint32_t initial_state = 0);

        /// Returns std::nullopt if the CPU lacks the features of the accelerated engine
        [[nodiscard]] static std::optional<ChecksumState> tryNewAccelerated(uint32_t initial_state);

        /// Always backed by the table-driven engine
        [[nodiscard]] static ChecksumState newScalar(uint32_t initial_state);

        void update(std::span<const std::byte> data);

        void update(const void *data, size_t size);

        /// Returns the CRC of all data processed so far.
        /// Consumes the state; call as std::move(state).finalize().
        /// The moved-from state keeps its remainder, so further update() calls continue the
        /// same checksum; call reset() to start a new one.
        [[nodiscard]] uint32_t finalize() &&;

        /// Resets the remainder to 0 (not to the initial state passed at construction)
        void reset();

        /// Extends this checksum by @code other_len@endcode bytes whose CRC, computed independently
        /// starting from 0, is @code other_crc@endcode.
        void combine(uint32_t other_crc, uint64_t other_len);

        /// True if backed by the PCLMULQDQ engine
        [[nodiscard]] bool isAccelerated() const;
    };
}
