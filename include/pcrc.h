#pragma once

#ifdef __cplusplus
#include <cstddef>
#include <cstdint>
#else
#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>
#endif

#ifdef _MSC_VER
#define PCRC_EXPORT __declspec(dllexport)
#else
#define PCRC_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef enum pcrcResult_t {
    pcrcSuccess = 0,
    pcrcInvalidArgument = 1,
    pcrcInvalidUsage = 2,
    pcrcAcceleratorUnavailable = 3
} pcrcResult_t;

/// Opaque CRC-32 hasher handle.
/// A handle must not be used by more than one thread at a time.
typedef struct pcrcHasher_t pcrcHasher_t;

/**
 * Creates a CRC-32 hasher backed by the fastest engine the CPU supports.
 *
 * @param initial_state 0 for a fresh checksum, or a previously obtained CRC to continue it.
 * @param hasher_out receives the new hasher handle. Must be released with @code pcrcDestroyHasher@endcode.
 *
 * @return @code pcrcSuccess@endcode if the hasher was created.
 * @return @code pcrcInvalidArgument@endcode if @code hasher_out@endcode is NULL.
 */
PCRC_EXPORT pcrcResult_t pcrcCreateHasher(uint32_t initial_state, pcrcHasher_t **hasher_out);

/**
 * Creates a CRC-32 hasher backed by the PCLMULQDQ engine.
 *
 * @param initial_state 0 for a fresh checksum, or a previously obtained CRC to continue it.
 * @param hasher_out receives the new hasher handle. Left untouched on failure.
 *
 * @return @code pcrcSuccess@endcode if the hasher was created.
 * @return @code pcrcInvalidArgument@endcode if @code hasher_out@endcode is NULL.
 * @return @code pcrcAcceleratorUnavailable@endcode if the CPU lacks sse2, sse4.1 or pclmulqdq.
 * Callers should fall back to @code pcrcCreateHasher@endcode.
 */
PCRC_EXPORT pcrcResult_t pcrcCreateAcceleratedHasher(uint32_t initial_state, pcrcHasher_t **hasher_out);

/**
 * Destroys a hasher handle.
 *
 * @return @code pcrcInvalidArgument@endcode if @code hasher@endcode is NULL.
 */
PCRC_EXPORT pcrcResult_t pcrcDestroyHasher(pcrcHasher_t *hasher);

/**
 * Feeds @code size@endcode bytes into the hasher.
 * @code data@endcode may be NULL if @code size@endcode is 0.
 *
 * @return @code pcrcInvalidUsage@endcode if the hasher has been finalized and not reset since.
 */
PCRC_EXPORT pcrcResult_t pcrcUpdate(pcrcHasher_t *hasher, const void *data, size_t size);

/**
 * Obtains the CRC of all data fed into the hasher.
 * After this call the hasher only accepts @code pcrcReset@endcode and @code pcrcDestroyHasher@endcode.
 *
 * @return @code pcrcInvalidUsage@endcode if the hasher has already been finalized.
 */
PCRC_EXPORT pcrcResult_t pcrcFinalize(pcrcHasher_t *hasher, uint32_t *crc_out);

/**
 * Resets the CRC and the byte count to 0. Makes a finalized hasher usable again.
 */
PCRC_EXPORT pcrcResult_t pcrcReset(pcrcHasher_t *hasher);

/**
 * Appends @code other_len@endcode bytes whose independently computed CRC is @code other_crc@endcode.
 *
 * @return @code pcrcInvalidUsage@endcode if the hasher has been finalized.
 */
PCRC_EXPORT pcrcResult_t pcrcCombine(pcrcHasher_t *hasher, uint32_t other_crc, uint64_t other_len);

/**
 * Appends the data seen by @code other@endcode to @code hasher@endcode. @code other@endcode is left unchanged.
 *
 * @return @code pcrcInvalidUsage@endcode if either hasher has been finalized.
 */
PCRC_EXPORT pcrcResult_t pcrcCombineHasher(pcrcHasher_t *hasher, const pcrcHasher_t *other);

/**
 * Obtains the number of bytes processed since creation or the last reset,
 * including bytes appended through combine.
 */
PCRC_EXPORT pcrcResult_t pcrcGetAmount(const pcrcHasher_t *hasher, uint64_t *amount_out);

/**
 * Reports whether the hasher is backed by the PCLMULQDQ engine.
 */
PCRC_EXPORT pcrcResult_t pcrcIsAccelerated(const pcrcHasher_t *hasher, bool *accelerated_out);

/**
 * Computes the CRC-32 of a buffer in one shot.
 */
PCRC_EXPORT pcrcResult_t pcrcChecksum(const void *data, size_t size, uint32_t *crc_out);

#ifdef __cplusplus
}
#endif
