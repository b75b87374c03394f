#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "BoardTypes.h"

namespace owlink::system {

struct DiagnosticEntry {
    uint64_t timestampMs = 0;
    LinkError error = LinkError::None;
    char category[12] = {0};
    char message[64] = {0};
};

/**
 * @brief Bounded log of notable link events (strategy attempts, failures).
 *
 * Keeps the newest `kCapacity` entries; older ones are overwritten. Every
 * recorded entry is echoed to serial with its category as the tag.
 *
 * Example:
 * @code
 * DiagnosticLog log;
 * log.record("strategy", LinkError::SentinelLocked, "DirectUnlock failed", millis());
 * for (size_t i = 0; i < log.size(); ++i) {
 *     printEntry(log.at(i));
 * }
 * @endcode
 */
class DiagnosticLog {
public:
    static constexpr size_t kCapacity = 32;

    void record(const char* category, LinkError error, const char* message, uint64_t nowMs);
    void clear();

    // Oldest first.
    const DiagnosticEntry& at(size_t index) const;
    size_t count(const char* category) const;

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] uint32_t totalRecorded() const { return total_; }

private:
    std::array<DiagnosticEntry, kCapacity> entries_{};
    size_t head_ = 0;
    size_t size_ = 0;
    uint32_t total_ = 0;
};

}  // namespace owlink::system
