#include "crc32_state.hpp"

#include <utility>

using namespace pcrc::internal::crc32;

pcrc::ChecksumState::ChecksumState(ScalarEngine engine) : engine(std::move(engine)) {
}

pcrc::ChecksumState::ChecksumState(SimdEngine engine) : engine(std::move(engine)) {
}

pcrc::ChecksumState::ChecksumState(const uint32_t initial_state) : engine(ScalarEngine(initial_state)) {
    if (auto simd_engine = SimdEngine::tryCreate(initial_state)) {
        engine = *simd_engine;
    }
}

std::optional<pcrc::ChecksumState> pcrc::ChecksumState::tryNewAccelerated(const uint32_t initial_state) {
    auto simd_engine = SimdEngine::tryCreate(initial_state);
    if (!simd_engine) {
        return std::nullopt;
    }
    return ChecksumState(*simd_engine);
}

pcrc::ChecksumState pcrc::ChecksumState::newScalar(const uint32_t initial_state) {
    return ChecksumState(ScalarEngine(initial_state));
}

void pcrc::ChecksumState::update(const std::span<const std::byte> data) {
    std::visit([data](auto &e) { e.update(data); }, engine);
}

void pcrc::ChecksumState::update(const void *data, const size_t size) {
    update(std::span(static_cast<const std::byte *>(data), size));
}

uint32_t pcrc::ChecksumState::finalize() && {
    return std::visit([](const auto &e) { return e.finalize(); }, engine);
}

void pcrc::ChecksumState::reset() {
    std::visit([](auto &e) { e.reset(); }, engine);
}

void pcrc::ChecksumState::combine(const uint32_t other_crc, const uint64_t other_len) {
    std::visit([=](auto &e) { e.combine(other_crc, other_len); }, engine);
}

bool pcrc::ChecksumState::isAccelerated() const {
    return std::holds_alternative<SimdEngine>(engine);
}
