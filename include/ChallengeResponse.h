#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "BoardTypes.h"

namespace owlink {

constexpr size_t kSignatureBytes = 3;
constexpr size_t kDigestBytes = 16;
constexpr size_t kResponseBytes = kSignatureBytes + kDigestBytes + 1;

constexpr std::array<uint8_t, kSignatureBytes> kChallengeSignature = {0x43, 0x52, 0x58};

using SecretKey = std::array<uint8_t, 16>;
using Digest = std::array<uint8_t, kDigestBytes>;

struct SliceRange {
    size_t begin = 0;
    size_t end = 0;
};

bool hasValidSignature(const Bytes& challenge);

/**
 * @brief Portion of the challenge that is hashed with the secret key.
 *
 * Classic and unknown boards hash [3, len-1). The newer boards pick one of
 * the observed slicing schemes by challenge length:
 *   GT:   len >= 20 -> [3, len-1), len == 19 -> [3, 19), else [4, min(len, 16))
 *   GT-S: len >= 19 -> [3, 19), else [4, min(len, 16))
 *
 * Returns false when the resulting range is empty.
 */
bool challengeSlice(UnlockProfile profile, size_t challengeLen, SliceRange& out);

uint8_t xorChecksum(const uint8_t* data, size_t len);

// MD5 through mbedTLS. Returns false if the digest could not be computed.
bool md5(const uint8_t* data, size_t len, Digest& out);

/**
 * @brief Build the 20-byte unlock response for a challenge.
 *
 * Layout: "CRX" + MD5(slice ++ key) + XOR of the 19 preceding bytes.
 */
bool computeResponse(const Bytes& challenge, const SecretKey& key, UnlockProfile profile, Bytes& out);

}  // namespace owlink
