#include "ChallengeResponse.h"

#include <algorithm>
#include <utility>

#include <mbedtls/md5.h>

namespace owlink {

bool hasValidSignature(const Bytes& challenge) {
    if (challenge.size() < kSignatureBytes) {
        return false;
    }
    return std::equal(kChallengeSignature.begin(), kChallengeSignature.end(), challenge.begin());
}

bool challengeSlice(UnlockProfile profile, size_t challengeLen, SliceRange& out) {
    SliceRange range;
    switch (profile) {
        case UnlockProfile::Classic:
        case UnlockProfile::Unknown:
            range.begin = 3;
            range.end = (challengeLen > 0) ? challengeLen - 1 : 0;
            break;
        case UnlockProfile::GT:
            if (challengeLen >= 20) {
                range.begin = 3;
                range.end = challengeLen - 1;
            } else if (challengeLen >= 19) {
                range.begin = 3;
                range.end = 19;
            } else {
                range.begin = 4;
                range.end = std::min<size_t>(challengeLen, 16);
            }
            break;
        case UnlockProfile::GTS:
            if (challengeLen >= 19) {
                range.begin = 3;
                range.end = 19;
            } else {
                range.begin = 4;
                range.end = std::min<size_t>(challengeLen, 16);
            }
            break;
    }

    if (range.end <= range.begin || range.end > challengeLen) {
        return false;
    }
    out = range;
    return true;
}

uint8_t xorChecksum(const uint8_t* data, size_t len) {
    uint8_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        sum ^= data[i];
    }
    return sum;
}

bool md5(const uint8_t* data, size_t len, Digest& out) {
    mbedtls_md5_context ctx;
    mbedtls_md5_init(&ctx);

    int ret = mbedtls_md5_starts(&ctx);
    if (ret == 0) {
        ret = mbedtls_md5_update(&ctx, data, len);
    }
    if (ret == 0) {
        ret = mbedtls_md5_finish(&ctx, out.data());
    }
    mbedtls_md5_free(&ctx);
    return ret == 0;
}

bool computeResponse(const Bytes& challenge, const SecretKey& key, UnlockProfile profile, Bytes& out) {
    if (!hasValidSignature(challenge)) {
        return false;
    }

    SliceRange range;
    if (!challengeSlice(profile, challenge.size(), range)) {
        return false;
    }

    Bytes input(challenge.begin() + range.begin, challenge.begin() + range.end);
    input.insert(input.end(), key.begin(), key.end());

    Digest digest{};
    if (!md5(input.data(), input.size(), digest)) {
        return false;
    }

    Bytes response;
    response.reserve(kResponseBytes);
    response.insert(response.end(), kChallengeSignature.begin(), kChallengeSignature.end());
    response.insert(response.end(), digest.begin(), digest.end());
    response.push_back(xorChecksum(response.data(), response.size()));
    out = std::move(response);
    return true;
}

}  // namespace owlink
