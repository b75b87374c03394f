#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "TelemetryCodec.h"

namespace owlink {

// Opaque transport handle for a discovered characteristic.
using CharHandle = uint16_t;

struct CharacteristicInfo {
    std::string uuid;
    CharHandle handle = 0;
    bool canRead = false;
    bool canWrite = false;
    bool canNotify = false;
};

class CharacteristicRegistry {
public:
    // Replaces the registry with the discovered set and detects its layout.
    void populate(const std::vector<CharacteristicInfo>& discovered);
    void clear();

    const CharacteristicInfo* find(const std::string& uuid) const;
    const CharacteristicInfo* find(TelemetryField field) const;
    TelemetryField fieldOf(CharHandle handle) const;

    std::vector<CharacteristicInfo> notifiable() const;

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    CharacteristicLayout layout() const { return layout_; }

private:
    std::map<std::string, CharacteristicInfo> entries_;
    CharacteristicLayout layout_ = CharacteristicLayout::Legacy;
};

}  // namespace owlink
