#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "crc32_state.hpp"

namespace pcrc {
    /// CRC-32 hasher that also tracks how many bytes it has processed,
    /// so that two hashers over consecutive data can be merged without passing lengths around.
    class Hasher final {
        uint64_t amount;
        ChecksumState state;

    public:
        Hasher();

        explicit Hasher(uint32_t initial_state);

        /// @param amount number of bytes already covered by @code initial_state@endcode
        Hasher(uint32_t initial_state, uint64_t amount);

        /// Wraps an existing state, e.g. one obtained from @code ChecksumState::tryNewAccelerated@endcode
        Hasher(const ChecksumState &state, uint64_t amount);

        void update(std::span<const std::byte> data);

        void update(const void *data, size_t size);

        /// Consumes the hasher; call as std::move(hasher).finalize().
        /// Like ChecksumState::finalize, the moved-from hasher keeps its remainder and byte count.
        [[nodiscard]] uint32_t finalize() &&;

        /// Resets both the CRC and the byte count to zero
        void reset();

        /// Appends the data seen by @code other@endcode to this hasher's data.
        /// @code other@endcode is left unchanged.
        void combine(const Hasher &other);

        [[nodiscard]] uint64_t getAmount() const;

        [[nodiscard]] bool isAccelerated() const;
    };

    /// Computes the CRC-32 of @code data@endcode in one shot
    [[nodiscard]] uint32_t crc32(std::span<const std::byte> data);

    [[nodiscard]] uint32_t crc32(const void *data, size_t size);
}
