#pragma once

#include <crc32_hasher.hpp>
#include <pcrc_log.hpp>

#define PCRC_DEBUG(msg) LOG(DEBUG) << msg;

#define __PCRC_STRINGIFY(x) #x
#define __PCRC_TOSTRING(x) __PCRC_STRINGIFY(x)

#define PCRC_VALIDATE(condition, err) {  \
if (!(condition)) {                      \
PCRC_DEBUG(__FILE__ ":" __PCRC_TOSTRING(__LINE__) ": " #condition);         \
return err;                              \
}                                        \
}


struct pcrcHasher_t {
    pcrc::Hasher hasher;

    /// set by pcrcFinalize, cleared by pcrcReset
    bool finalized = false;

    explicit pcrcHasher_t(const pcrc::Hasher &hasher) : hasher(hasher) {
    }
};
