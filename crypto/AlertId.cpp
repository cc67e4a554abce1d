#include "AlertId.hpp"
#include "../core/IClock.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace rtsae {

std::string AlertId::derive(const std::string& vehicleId,
                            const std::string& zoneId,
                            Timestamp transitionTs) {
    return sha256Hex(idempotencyKey(vehicleId, zoneId, transitionTs)).substr(0, 32);
}

std::string AlertId::idempotencyKey(const std::string& vehicleId,
                                    const std::string& zoneId,
                                    Timestamp transitionTs) {
    return vehicleId + "|" + zoneId + "|" + std::to_string(IClock::toEpochMillis(transitionTs));
}

std::string AlertId::sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

} // namespace rtsae
