#include "secure_random.hpp"

#include "digest.hpp"
#include "secure_memory.hpp"

#include <stdexcept>

#include <sodium.h>

namespace fd {

namespace {

constexpr std::size_t kServerSeedBytes = 32;
constexpr std::size_t kNonceBytes = 8;
constexpr std::size_t kRoundIdBytes = 12;
constexpr std::size_t kClientSeedBytes = 8;

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    if (sodium_init() < 0) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::string hex = bytesToHex(bytes.data(), bytes.size());
    secureZero(bytes.data(), bytes.size());
    return hex;
}

std::string generateServerSeed() {
    return secureRandomHex(kServerSeedBytes);
}

std::string generateRoundNonce() {
    return secureRandomHex(kNonceBytes);
}

std::string generateRoundId() {
    return secureRandomHex(kRoundIdBytes);
}

std::string generateClientSeed() {
    return secureRandomHex(kClientSeedBytes);
}

} // namespace fd
