#include "CharacteristicRegistry.h"

namespace owlink {

void CharacteristicRegistry::populate(const std::vector<CharacteristicInfo>& discovered) {
    entries_.clear();
    for (const auto& info : discovered) {
        CharacteristicInfo entry = info;
        entry.uuid = normalizeUuid(info.uuid);
        entries_[entry.uuid] = entry;
    }

    const bool extended =
        entries_.count(uuidFor(TelemetryField::FirmwareRevision, CharacteristicLayout::Extended)) > 0 ||
        entries_.count(uuidFor(TelemetryField::WriteChannel, CharacteristicLayout::Extended)) > 0;
    layout_ = extended ? CharacteristicLayout::Extended : CharacteristicLayout::Legacy;
}

void CharacteristicRegistry::clear() {
    entries_.clear();
    layout_ = CharacteristicLayout::Legacy;
}

const CharacteristicInfo* CharacteristicRegistry::find(const std::string& uuid) const {
    auto it = entries_.find(normalizeUuid(uuid));
    return it == entries_.end() ? nullptr : &it->second;
}

const CharacteristicInfo* CharacteristicRegistry::find(TelemetryField field) const {
    return find(uuidFor(field, layout_));
}

TelemetryField CharacteristicRegistry::fieldOf(CharHandle handle) const {
    for (const auto& entry : entries_) {
        if (entry.second.handle == handle) {
            return fieldFor(entry.first, layout_);
        }
    }
    return TelemetryField::Unknown;
}

std::vector<CharacteristicInfo> CharacteristicRegistry::notifiable() const {
    std::vector<CharacteristicInfo> out;
    for (const auto& entry : entries_) {
        if (entry.second.canNotify) {
            out.push_back(entry.second);
        }
    }
    return out;
}

}  // namespace owlink
