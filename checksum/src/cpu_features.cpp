#include "cpu_features.hpp"

#include <cstdlib>
#include <cstring>
#include <mutex>

#include <pcrc_log.hpp>

#ifndef PCRC_RUNTIME_CPU_DETECTION
#define PCRC_RUNTIME_CPU_DETECTION 1
#endif

#if PCRC_RUNTIME_CPU_DETECTION
#if defined(_MSC_VER)
#include <intrin.h>
#elif defined(__x86_64__) || defined(_M_X64)
#include <cpuid.h>
#endif
#endif

namespace pcrc::internal::cpu {
    namespace {
        constexpr unsigned int CPUID_EDX_SSE2 = 1u << 26;
        constexpr unsigned int CPUID_ECX_SSE41 = 1u << 19;
        constexpr unsigned int CPUID_ECX_PCLMUL = 1u << 1;

        CPUFeatures detectCPUFeatures() {
            CPUFeatures caps{};

#if PCRC_RUNTIME_CPU_DETECTION
#if defined(__x86_64__) || defined(_M_X64)
            unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
#if defined(_MSC_VER)
            int regs[4]{};
            __cpuid(regs, 0);
            if (regs[0] >= 1) {
                __cpuid(regs, 1);
                eax = static_cast<unsigned int>(regs[0]);
                ebx = static_cast<unsigned int>(regs[1]);
                ecx = static_cast<unsigned int>(regs[2]);
                edx = static_cast<unsigned int>(regs[3]);
            }
#else
            // EAX=1 => standard feature bits in ECX/EDX
            if (__get_cpuid_max(0, nullptr) >= 1) {
                __get_cpuid(1, &eax, &ebx, &ecx, &edx);
            }
#endif
            caps.hasSSE2 = (edx & CPUID_EDX_SSE2) != 0;
            caps.hasSSE41 = (ecx & CPUID_ECX_SSE41) != 0;
            caps.hasPCLMUL = (ecx & CPUID_ECX_PCLMUL) != 0;
#endif
#else
            // static detection: whatever the compiler was told the target supports
#if defined(__SSE2__)
            caps.hasSSE2 = true;
#endif
#if defined(__SSE4_1__)
            caps.hasSSE41 = true;
#endif
#if defined(__PCLMUL__)
            caps.hasPCLMUL = true;
#endif
#endif
            return caps;
        }

        bool isScalarForced() {
            const char *value = std::getenv("PCRC_FORCE_SCALAR");
            return value != nullptr && value[0] != '\0' && std::strcmp(value, "0") != 0;
        }

        std::once_flag g_initOnce;
        CPUFeatures g_features{};

        void initCPUFeatures() {
            g_features = detectCPUFeatures();
            LOG(DEBUG) << "CPU features: sse2=" << g_features.hasSSE2
                    << " sse4.1=" << g_features.hasSSE41
                    << " pclmulqdq=" << g_features.hasPCLMUL
                    << " (" << (PCRC_RUNTIME_CPU_DETECTION ? "runtime" : "static") << " detection)";
            if (isScalarForced()) {
                LOG(DEBUG) << "PCRC_FORCE_SCALAR is set; reporting pclmulqdq as unavailable";
                g_features.hasPCLMUL = false;
            }
            LOG(DEBUG) << "CRC-32 engine: "
                    << (g_features.hasSSE2 && g_features.hasSSE41 && g_features.hasPCLMUL
                            ? "pclmulqdq folding"
                            : "slice-by-16 table");
        }
    } // end anonymous namespace

    const CPUFeatures &getCPUFeatures() {
        std::call_once(g_initOnce, initCPUFeatures);
        return g_features;
    }

    bool hasPclmulEngineSupport() {
        const CPUFeatures &caps = getCPUFeatures();
        return caps.hasSSE2 && caps.hasSSE41 && caps.hasPCLMUL;
    }
} // namespace pcrc::internal::cpu
