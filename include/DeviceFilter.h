#pragma once

#include <string>
#include <vector>

#include "BoardTypes.h"
#include "Config.h"

namespace owlink {

struct FilterConfig {
    std::vector<std::string> nameFragments = defaultNameFragments();
    std::vector<std::string> manufacturerPrefixes = defaultManufacturerPrefixes();
    std::string serviceId = BOARD_SERVICE_UUID;
    int minRssi = MIN_CANDIDATE_RSSI;
};

// Strips ':' and '-' and upper-cases, so "00:13:43" and "001343" compare equal.
std::string normalizeAddress(const std::string& address);

/**
 * @brief Decide whether an advertisement looks like a board.
 *
 * A record qualifies when its name contains a known fragment, or when its
 * address carries a known manufacturer prefix and it advertises the board
 * service. Records weaker than `minRssi` never qualify.
 */
bool isBoardCandidate(const Advertisement& adv, const FilterConfig& config);

class CandidateList {
public:
    explicit CandidateList(FilterConfig config = FilterConfig{});

    // Replaces the list with the candidates from this batch, deduplicated by id.
    void applyBatch(const std::vector<Advertisement>& batch);
    void clear() { candidates_.clear(); }

    const std::vector<DeviceCandidate>& candidates() const { return candidates_; }
    const DeviceCandidate* find(const std::string& id) const;
    size_t size() const { return candidates_.size(); }

    void setMinRssi(int rssi) { config_.minRssi = rssi; }
    const FilterConfig& config() const { return config_; }

private:
    FilterConfig config_;
    std::vector<DeviceCandidate> candidates_;
};

}  // namespace owlink
