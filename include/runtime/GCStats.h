/***
 * Name: objkit::rt::RuntimeStats
 * Purpose: Expose GC counters to tests and tooling.
 */
#pragma once

#include <cstdint>

namespace objkit::rt {
    struct RuntimeStats {
        uint64_t numAllocated{0};
        uint64_t numFreed{0};
        uint64_t numCollections{0};
        uint64_t bytesAllocated{0};
        uint64_t bytesLive{0};
        uint64_t peakBytesLive{0};
        uint64_t lastReclaimedBytes{0};
    };
} // namespace objkit::rt
