#pragma once

namespace pcrc::internal::cpu {
    /// CPU feature flags relevant to the CRC-32 engines
    struct CPUFeatures {
        bool hasSSE2 = false; // x86 SSE2
        bool hasSSE41 = false; // x86 SSE4.1
        bool hasPCLMUL = false; // x86 PCLMULQDQ
    };

    /// Returns the feature set of the executing CPU.
    /// Detection runs exactly once per process; PCRC_FORCE_SCALAR is honored at that point.
    /// In a static detection build (PCRC_RUNTIME_CPU_DETECTION=0) the result reflects the
    /// compiler's target feature macros instead of CPUID.
    [[nodiscard]] const CPUFeatures &getCPUFeatures();

    /// True if every feature required by the PCLMULQDQ folding engine is present
    [[nodiscard]] bool hasPclmulEngineSupport();
}
