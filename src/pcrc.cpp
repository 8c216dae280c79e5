#include "pcrc.h"
#include "pcrc_internal.hpp"

#include <optional>
#include <utility>

#define PCRC_VALIDATE_NOT_FINALIZED(hasher) \
    if ((hasher)->finalized) { \
        LOG(ERR) << "Hasher " << (hasher) << " used after pcrcFinalize without pcrcReset"; \
        return (pcrcInvalidUsage); \
    }

pcrcResult_t pcrcCreateHasher(const uint32_t initial_state, pcrcHasher_t **hasher_out) {
    PCRC_VALIDATE(hasher_out != nullptr, pcrcInvalidArgument);
    *hasher_out = new pcrcHasher_t(pcrc::Hasher(initial_state));
    return pcrcSuccess;
}

pcrcResult_t pcrcCreateAcceleratedHasher(const uint32_t initial_state, pcrcHasher_t **hasher_out) {
    PCRC_VALIDATE(hasher_out != nullptr, pcrcInvalidArgument);
    const std::optional<pcrc::ChecksumState> state = pcrc::ChecksumState::tryNewAccelerated(initial_state);
    if (!state) {
        LOG(DEBUG) << "Accelerated CRC-32 engine unavailable on this CPU";
        return pcrcAcceleratorUnavailable;
    }
    *hasher_out = new pcrcHasher_t(pcrc::Hasher(*state, 0));
    return pcrcSuccess;
}

pcrcResult_t pcrcDestroyHasher(pcrcHasher_t *hasher) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    delete hasher;
    return pcrcSuccess;
}

pcrcResult_t pcrcUpdate(pcrcHasher_t *hasher, const void *data, const size_t size) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE(data != nullptr || size == 0, pcrcInvalidArgument);
    PCRC_VALIDATE_NOT_FINALIZED(hasher);
    if (size == 0) {
        return pcrcSuccess;
    }
    hasher->hasher.update(data, size);
    return pcrcSuccess;
}

pcrcResult_t pcrcFinalize(pcrcHasher_t *hasher, uint32_t *crc_out) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE(crc_out != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE_NOT_FINALIZED(hasher);

    // the handle keeps a copy so that pcrcReset can revive it
    pcrc::Hasher consumed = hasher->hasher;
    *crc_out = std::move(consumed).finalize();
    hasher->finalized = true;
    return pcrcSuccess;
}

pcrcResult_t pcrcReset(pcrcHasher_t *hasher) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    hasher->hasher.reset();
    hasher->finalized = false;
    return pcrcSuccess;
}

pcrcResult_t pcrcCombine(pcrcHasher_t *hasher, const uint32_t other_crc, const uint64_t other_len) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE_NOT_FINALIZED(hasher);
    hasher->hasher.combine(pcrc::Hasher(other_crc, other_len));
    return pcrcSuccess;
}

pcrcResult_t pcrcCombineHasher(pcrcHasher_t *hasher, const pcrcHasher_t *other) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE(other != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE_NOT_FINALIZED(hasher);
    PCRC_VALIDATE_NOT_FINALIZED(other);
    hasher->hasher.combine(other->hasher);
    return pcrcSuccess;
}

pcrcResult_t pcrcGetAmount(const pcrcHasher_t *hasher, uint64_t *amount_out) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE(amount_out != nullptr, pcrcInvalidArgument);
    *amount_out = hasher->hasher.getAmount();
    return pcrcSuccess;
}

pcrcResult_t pcrcIsAccelerated(const pcrcHasher_t *hasher, bool *accelerated_out) {
    PCRC_VALIDATE(hasher != nullptr, pcrcInvalidArgument);
    PCRC_VALIDATE(accelerated_out != nullptr, pcrcInvalidArgument);
    *accelerated_out = hasher->hasher.isAccelerated();
    return pcrcSuccess;
}

pcrcResult_t pcrcChecksum(const void *data, const size_t size, uint32_t *crc_out) {
    PCRC_VALIDATE(data != nullptr || size == 0, pcrcInvalidArgument);
    PCRC_VALIDATE(crc_out != nullptr, pcrcInvalidArgument);
    *crc_out = size == 0 ? 0 : pcrc::crc32(data, size);
    return pcrcSuccess;
}
