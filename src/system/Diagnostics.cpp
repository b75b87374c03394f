#include "system/Diagnostics.h"

#include <cstring>

#ifdef ARDUINO
#include <Arduino.h>
#endif

namespace owlink::system {

namespace {

void copyText(const char* source, char* dest, size_t capacity) {
    std::memset(dest, 0, capacity);
    if (source) {
        std::strncpy(dest, source, capacity - 1);
    }
}

}  // namespace

void DiagnosticLog::record(const char* category, LinkError error, const char* message, uint64_t nowMs) {
    DiagnosticEntry& entry = entries_[head_];
    entry.timestampMs = nowMs;
    entry.error = error;
    copyText((category && category[0] != '\0') ? category : "link", entry.category, sizeof(entry.category));
    copyText(message, entry.message, sizeof(entry.message));

    head_ = (head_ + 1) % kCapacity;
    if (size_ < kCapacity) {
        ++size_;
    }
    ++total_;

#ifdef ARDUINO
    Serial.print("[DIAG] ");
    Serial.print(entry.category);
    Serial.print(" error=");
    Serial.print(toString(error));
    Serial.print(" ");
    Serial.println(entry.message);
#endif
}

void DiagnosticLog::clear() {
    entries_.fill(DiagnosticEntry{});
    head_ = 0;
    size_ = 0;
}

const DiagnosticEntry& DiagnosticLog::at(size_t index) const {
    const size_t oldest = (size_ < kCapacity) ? 0 : head_;
    return entries_[(oldest + index) % kCapacity];
}

size_t DiagnosticLog::count(const char* category) const {
    if (!category) {
        return 0;
    }
    size_t matches = 0;
    for (size_t i = 0; i < size_; ++i) {
        if (std::strncmp(at(i).category, category, sizeof(DiagnosticEntry::category)) == 0) {
            ++matches;
        }
    }
    return matches;
}

}  // namespace owlink::system
