#include "DeviceFilter.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace owlink {

std::string normalizeAddress(const std::string& address) {
    std::string out;
    out.reserve(address.size());
    for (unsigned char c : address) {
        if (c == ':' || c == '-') {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

namespace {

bool nameMatches(const std::string& name, const std::vector<std::string>& fragments) {
    if (name.empty()) {
        return false;
    }
    return std::any_of(fragments.begin(), fragments.end(), [&](const std::string& fragment) {
        return containsIgnoreCase(name, fragment);
    });
}

bool addressMatches(const std::string& address, const std::vector<std::string>& prefixes) {
    const std::string normalized = normalizeAddress(address);
    return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
        const std::string p = normalizeAddress(prefix);
        return !p.empty() && normalized.compare(0, p.size(), p) == 0;
    });
}

bool advertisesService(const std::vector<std::string>& serviceIds, const std::string& serviceId) {
    const std::string wanted = toLower(serviceId);
    return std::any_of(serviceIds.begin(), serviceIds.end(), [&](const std::string& id) {
        return toLower(id) == wanted;
    });
}

}  // namespace

bool isBoardCandidate(const Advertisement& adv, const FilterConfig& config) {
    if (adv.rssi < config.minRssi) {
        return false;
    }

    if (nameMatches(adv.name, config.nameFragments)) {
        return true;
    }

    return adv.address.has_value() &&
           addressMatches(adv.address.value(), config.manufacturerPrefixes) &&
           advertisesService(adv.serviceIds, config.serviceId);
}

CandidateList::CandidateList(FilterConfig config) : config_(std::move(config)) {}

void CandidateList::applyBatch(const std::vector<Advertisement>& batch) {
    std::vector<DeviceCandidate> next;
    for (const auto& adv : batch) {
        if (!isBoardCandidate(adv, config_)) {
            continue;
        }
        DeviceCandidate candidate{adv.id, adv.name, adv.rssi, adv.serviceIds};
        auto existing = std::find_if(next.begin(), next.end(), [&](const DeviceCandidate& c) {
            return c.id == adv.id;
        });
        if (existing != next.end()) {
            *existing = std::move(candidate);
        } else {
            next.push_back(std::move(candidate));
        }
    }
    candidates_ = std::move(next);
}

const DeviceCandidate* CandidateList::find(const std::string& id) const {
    for (const auto& candidate : candidates_) {
        if (candidate.id == id) {
            return &candidate;
        }
    }
    return nullptr;
}

}  // namespace owlink
