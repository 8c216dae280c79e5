#include <pcrc.h>
#include <pcrc_log.hpp>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <vector>

void panic(const int exit_code) { exit(exit_code); }

#define PCRC_CHECK(status)                                                                                             \
    {                                                                                                                  \
        pcrcResult_t status_val = status;                                                                              \
        if (status_val != pcrcSuccess) {                                                                               \
            std::cerr << __FILE__ << ":" << __LINE__ << ": Error: " << status_val << std::endl;                        \
            panic(1);                                                                                                  \
        }                                                                                                              \
    }

#define EXPECT_STATUS(status, expected)                                                                                \
    {                                                                                                                  \
        pcrcResult_t status_val = status;                                                                              \
        if (status_val != (expected)) {                                                                                \
            std::cerr << __FILE__ << ":" << __LINE__ << ": expected status " << (expected) << ", got " << status_val  \
                      << std::endl;                                                                                    \
            panic(1);                                                                                                  \
        }                                                                                                              \
    }

#define EXPECT_EQUAL(actual, expected)                                                                                 \
    {                                                                                                                  \
        const auto actual_val = (actual);                                                                              \
        const auto expected_val = (expected);                                                                          \
        if (actual_val != expected_val) {                                                                              \
            std::cerr << __FILE__ << ":" << __LINE__ << ": " #actual " == " << std::hex << actual_val                  \
                      << ", expected " << expected_val << std::dec << std::endl;                                       \
            panic(1);                                                                                                  \
        }                                                                                                              \
    }

/// Bit-at-a-time CRC-32, independent of both engines
static uint32_t bitwiseCrc32(const uint8_t *data, const size_t size) {
    uint32_t crc = 0xffffffff;
    for (size_t i = 0; i < size; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ 0xedb88320 : (crc >> 1);
        }
    }
    return ~crc;
}

static void testKnownVectors() {
    constexpr char hello[] = "hello world";
    uint32_t crc{};
    PCRC_CHECK(pcrcChecksum(hello, strlen(hello), &crc));
    EXPECT_EQUAL(crc, 0x0d4a1185u);

    PCRC_CHECK(pcrcChecksum(nullptr, 0, &crc));
    EXPECT_EQUAL(crc, 0u);

    std::vector<uint8_t> zeros(32, 0);
    PCRC_CHECK(pcrcChecksum(zeros.data(), zeros.size(), &crc));
    EXPECT_EQUAL(crc, 0x190a55adu);

    std::vector<uint8_t> increasing(32);
    for (size_t i = 0; i < increasing.size(); ++i) {
        increasing[i] = static_cast<uint8_t>(i);
    }
    PCRC_CHECK(pcrcChecksum(increasing.data(), increasing.size(), &crc));
    EXPECT_EQUAL(crc, 0x91267e8au);
}

static void testHasherLifecycle() {
    std::mt19937 gen(42);
    std::vector<uint8_t> data(100000);
    for (auto &b: data) {
        b = static_cast<uint8_t>(gen());
    }
    uint32_t expected{};
    PCRC_CHECK(pcrcChecksum(data.data(), data.size(), &expected));

    pcrcHasher_t *hasher{};
    PCRC_CHECK(pcrcCreateHasher(0, &hasher));
    PCRC_CHECK(pcrcUpdate(hasher, data.data(), 12345));
    PCRC_CHECK(pcrcUpdate(hasher, nullptr, 0));
    PCRC_CHECK(pcrcUpdate(hasher, data.data() + 12345, data.size() - 12345));

    uint64_t amount{};
    PCRC_CHECK(pcrcGetAmount(hasher, &amount));
    EXPECT_EQUAL(amount, static_cast<uint64_t>(data.size()));

    uint32_t crc{};
    PCRC_CHECK(pcrcFinalize(hasher, &crc));
    EXPECT_EQUAL(crc, expected);

    // a finalized hasher rejects everything but reset and destroy
    EXPECT_STATUS(pcrcUpdate(hasher, data.data(), 1), pcrcInvalidUsage);
    EXPECT_STATUS(pcrcFinalize(hasher, &crc), pcrcInvalidUsage);
    EXPECT_STATUS(pcrcCombine(hasher, 0, 0), pcrcInvalidUsage);

    PCRC_CHECK(pcrcReset(hasher));
    PCRC_CHECK(pcrcGetAmount(hasher, &amount));
    EXPECT_EQUAL(amount, 0ull);
    PCRC_CHECK(pcrcFinalize(hasher, &crc));
    EXPECT_EQUAL(crc, 0u);

    PCRC_CHECK(pcrcReset(hasher));
    PCRC_CHECK(pcrcUpdate(hasher, data.data(), data.size()));
    PCRC_CHECK(pcrcFinalize(hasher, &crc));
    EXPECT_EQUAL(crc, expected);

    PCRC_CHECK(pcrcDestroyHasher(hasher));
}

static void testInvalidArguments() {
    uint32_t crc{};
    EXPECT_STATUS(pcrcCreateHasher(0, nullptr), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcCreateAcceleratedHasher(0, nullptr), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcDestroyHasher(nullptr), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcUpdate(nullptr, &crc, 1), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcFinalize(nullptr, &crc), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcChecksum(nullptr, 1, &crc), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcChecksum(&crc, sizeof(crc), nullptr), pcrcInvalidArgument);

    pcrcHasher_t *hasher{};
    PCRC_CHECK(pcrcCreateHasher(0, &hasher));
    EXPECT_STATUS(pcrcUpdate(hasher, nullptr, 1), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcFinalize(hasher, nullptr), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcCombineHasher(hasher, nullptr), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcGetAmount(hasher, nullptr), pcrcInvalidArgument);
    EXPECT_STATUS(pcrcIsAccelerated(hasher, nullptr), pcrcInvalidArgument);
    PCRC_CHECK(pcrcDestroyHasher(hasher));
}

static void testAcceleratedHasher() {
    pcrcHasher_t *accelerated{};
    const pcrcResult_t status = pcrcCreateAcceleratedHasher(0, &accelerated);
    if (status == pcrcAcceleratorUnavailable) {
        std::cout << "Accelerated engine unavailable, falling back to the default hasher" << std::endl;
        if (accelerated != nullptr) {
            std::cerr << "hasher_out must be left untouched on failure" << std::endl;
            panic(1);
        }
        return;
    }
    PCRC_CHECK(status);

    bool is_accelerated = false;
    PCRC_CHECK(pcrcIsAccelerated(accelerated, &is_accelerated));
    EXPECT_EQUAL(is_accelerated, true);

    // the default hasher selects the same engine when it is available
    pcrcHasher_t *defaulted{};
    PCRC_CHECK(pcrcCreateHasher(0, &defaulted));
    PCRC_CHECK(pcrcIsAccelerated(defaulted, &is_accelerated));
    EXPECT_EQUAL(is_accelerated, true);
    PCRC_CHECK(pcrcDestroyHasher(defaulted));

    for (const size_t size: {size_t{0}, size_t{1}, size_t{127}, size_t{128}, size_t{129}, size_t{4099}}) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<uint8_t>(i * 31 + 7);
        }
        PCRC_CHECK(pcrcReset(accelerated));
        PCRC_CHECK(pcrcUpdate(accelerated, data.data(), data.size()));
        uint32_t crc{};
        PCRC_CHECK(pcrcFinalize(accelerated, &crc));
        EXPECT_EQUAL(crc, bitwiseCrc32(data.data(), data.size()));
    }
    PCRC_CHECK(pcrcDestroyHasher(accelerated));
}

/// Runs in both CTest configurations; under PCRC_FORCE_SCALAR this is the table engine
static void testDefaultHasherMatchesBitwise() {
    std::mt19937 gen(7);
    std::vector<uint8_t> data(10007);
    for (auto &b: data) {
        b = static_cast<uint8_t>(gen());
    }
    pcrcHasher_t *hasher{};
    PCRC_CHECK(pcrcCreateHasher(0, &hasher));
    bool is_accelerated = false;
    PCRC_CHECK(pcrcIsAccelerated(hasher, &is_accelerated));
    const char *force_scalar = std::getenv("PCRC_FORCE_SCALAR");
    if (force_scalar != nullptr && strcmp(force_scalar, "1") == 0) {
        EXPECT_EQUAL(is_accelerated, false);
    }
    for (const size_t size: {size_t{0}, size_t{15}, size_t{64}, size_t{129}, data.size()}) {
        PCRC_CHECK(pcrcReset(hasher));
        PCRC_CHECK(pcrcUpdate(hasher, data.data(), size));
        uint32_t crc{};
        PCRC_CHECK(pcrcFinalize(hasher, &crc));
        EXPECT_EQUAL(crc, bitwiseCrc32(data.data(), size));
    }
    PCRC_CHECK(pcrcDestroyHasher(hasher));
}

static void testContinueFromCrc() {
    constexpr char text[] = "The quick brown fox jumps over the lazy dog";
    const size_t size = strlen(text);

    uint32_t head{};
    PCRC_CHECK(pcrcChecksum(text, 10, &head));

    pcrcHasher_t *hasher{};
    PCRC_CHECK(pcrcCreateHasher(head, &hasher));
    PCRC_CHECK(pcrcUpdate(hasher, text + 10, size - 10));
    uint32_t crc{};
    PCRC_CHECK(pcrcFinalize(hasher, &crc));
    EXPECT_EQUAL(crc, 0x414fa339u);
    PCRC_CHECK(pcrcDestroyHasher(hasher));
}

int main() {
    testKnownVectors();
    testHasherLifecycle();
    testInvalidArguments();
    testAcceleratedHasher();
    testDefaultHasherMatchesBitwise();
    testContinueFromCrc();
    LOG(INFO) << "basic_checksum_test passed";
    return 0;
}
