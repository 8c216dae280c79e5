#include "crc32_hasher.hpp"

#include <utility>

pcrc::Hasher::Hasher() : Hasher(0, 0) {
}

pcrc::Hasher::Hasher(const uint32_t initial_state) : Hasher(initial_state, 0) {
}

pcrc::Hasher::Hasher(const uint32_t initial_state, const uint64_t amount) : amount(amount), state(initial_state) {
}

pcrc::Hasher::Hasher(const ChecksumState &state, const uint64_t amount) : amount(amount), state(state) {
}

void pcrc::Hasher::update(const std::span<const std::byte> data) {
    amount += data.size();
    state.update(data);
}

void pcrc::Hasher::update(const void *data, const size_t size) {
    update(std::span(static_cast<const std::byte *>(data), size));
}

uint32_t pcrc::Hasher::finalize() && {
    return std::move(state).finalize();
}

void pcrc::Hasher::reset() {
    amount = 0;
    state.reset();
}

void pcrc::Hasher::combine(const Hasher &other) {
    ChecksumState other_state = other.state;
    const uint64_t other_amount = other.amount;
    amount += other_amount;
    state.combine(std::move(other_state).finalize(), other_amount);
}

uint64_t pcrc::Hasher::getAmount() const {
    return amount;
}

bool pcrc::Hasher::isAccelerated() const {
    return state.isAccelerated();
}

uint32_t pcrc::crc32(const std::span<const std::byte> data) {
    Hasher hasher;
    hasher.update(data);
    return std::move(hasher).finalize();
}

uint32_t pcrc::crc32(const void *data, const size_t size) {
    return crc32(std::span(static_cast<const std::byte *>(data), size));
}
