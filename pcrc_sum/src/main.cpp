#include <pcrc.h>
#include <pcrc_log.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#define PCRC_CHECK(status) { pcrcResult_t status_val = status; if (status_val != pcrcSuccess) { std::cerr << "Error: " << status_val << std::endl; exit(1); } }

static constexpr int DEFAULT_CHUNK_SIZE = 1 << 20;

static int GetIntEnvVar(const std::string &var_name, const int default_value) {
    const char *env_var = std::getenv(var_name.c_str());
    if (env_var == nullptr) {
        return default_value;
    }
    try {
        size_t n_parsed = 0;
        const int value = std::stoi(env_var, &n_parsed);
        if (env_var[n_parsed] != '\0') {
            throw std::invalid_argument(var_name);
        }
        if (value <= 0) {
            LOG(WARN) << "Ignoring non-positive value for environment variable " << var_name << ": " << env_var;
            return default_value;
        }
        return value;
    } catch (const std::invalid_argument &) {
        LOG(WARN) << "Invalid value for environment variable " << var_name << ": " << env_var;
        return default_value;
    } catch (const std::out_of_range &) {
        LOG(WARN) << "Out of range value for environment variable " << var_name << ": " << env_var;
        return default_value;
    }
}

struct FileRange {
    uint64_t offset;
    uint64_t length;
};

/// Feeds the given byte range of the file into the hasher, chunk_size bytes at a time
static bool hashRange(const std::filesystem::path &path, const FileRange range, const size_t chunk_size,
                      pcrcHasher_t *hasher) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG(ERR) << "Failed to open " << path;
        return false;
    }
    if (!file.seekg(static_cast<std::streamoff>(range.offset))) {
        LOG(ERR) << "Failed to seek to offset " << range.offset << " in " << path;
        return false;
    }
    std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(chunk_size, range.length)));
    uint64_t remaining = range.length;
    while (remaining > 0) {
        const auto n_bytes = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
        if (!file.read(buffer.data(), static_cast<std::streamsize>(n_bytes))) {
            LOG(ERR) << "Failed to read " << n_bytes << " bytes at offset " << (range.offset + range.length - remaining)
                    << " from " << path;
            return false;
        }
        if (const pcrcResult_t status = pcrcUpdate(hasher, buffer.data(), n_bytes); status != pcrcSuccess) {
            LOG(BUG) << "pcrcUpdate failed with status " << status;
            return false;
        }
        remaining -= n_bytes;
    }
    return true;
}

/// Splits the file into one contiguous range of whole chunks per worker, hashes the ranges
/// in parallel and merges the partial checksums in file order.
static std::optional<uint32_t> checksumFile(const std::filesystem::path &path, const size_t n_threads,
                                            const size_t chunk_size) {
    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        LOG(ERR) << "Failed to stat " << path << ": " << ec.message();
        return std::nullopt;
    }

    const uint64_t n_chunks = (file_size + chunk_size - 1) / chunk_size;
    const auto n_workers = static_cast<size_t>(std::max<uint64_t>(1, std::min<uint64_t>(n_threads, n_chunks)));
    const uint64_t range_size = n_chunks == 0 ? 0 : (n_chunks + n_workers - 1) / n_workers * chunk_size;

    std::vector<FileRange> ranges(n_workers);
    for (size_t i = 0; i < n_workers; ++i) {
        const uint64_t begin = std::min<uint64_t>(file_size, i * range_size);
        const uint64_t end = std::min<uint64_t>(file_size, begin + range_size);
        ranges[i] = FileRange{.offset = begin, .length = end - begin};
    }
    LOG(DEBUG) << "Hashing " << path << " (" << file_size << " bytes) with " << n_workers << " worker(s)";

    std::vector<pcrcHasher_t *> hashers(n_workers);
    for (auto &hasher: hashers) {
        PCRC_CHECK(pcrcCreateHasher(0, &hasher));
    }

    // one slot per worker, written concurrently
    std::vector<char> succeeded(n_workers, 0);
    if (n_workers == 1) {
        succeeded[0] = hashRange(path, ranges[0], chunk_size, hashers[0]);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(n_workers);
        for (size_t i = 0; i < n_workers; ++i) {
            workers.emplace_back([&, i] {
                succeeded[i] = hashRange(path, ranges[i], chunk_size, hashers[i]);
            });
        }
        for (auto &worker: workers) {
            worker.join();
        }
    }

    std::optional<uint32_t> result{};
    if (std::all_of(succeeded.begin(), succeeded.end(), [](const char ok) { return ok != 0; })) {
        for (size_t i = 1; i < n_workers; ++i) {
            PCRC_CHECK(pcrcCombineHasher(hashers[0], hashers[i]));
        }
        uint32_t crc{};
        PCRC_CHECK(pcrcFinalize(hashers[0], &crc));
        result = crc;
    }
    for (pcrcHasher_t *hasher: hashers) {
        PCRC_CHECK(pcrcDestroyHasher(hasher));
    }
    return result;
}

int main(const int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " FILE..." << std::endl;
        std::cerr << "environment: PCRC_SUM_THREADS, PCRC_SUM_CHUNK_SIZE, PCRC_LOG_LEVEL, PCRC_FORCE_SCALAR"
                << std::endl;
        return 2;
    }

    const int default_threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    const auto n_threads = static_cast<size_t>(GetIntEnvVar("PCRC_SUM_THREADS", default_threads));
    const auto chunk_size = static_cast<size_t>(GetIntEnvVar("PCRC_SUM_CHUNK_SIZE", DEFAULT_CHUNK_SIZE));

    int exit_code = 0;
    for (int i = 1; i < argc; ++i) {
        const std::filesystem::path path(argv[i]);
        const std::optional<uint32_t> crc = checksumFile(path, n_threads, chunk_size);
        if (!crc) {
            exit_code = 1;
            continue;
        }
        std::cout << std::hex << std::setw(8) << std::setfill('0') << *crc << std::dec << "  " << argv[i] << std::endl;
    }
    return exit_code;
}
