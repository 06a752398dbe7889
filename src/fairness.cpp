#include "fairness.hpp"

#include "digest.hpp"
#include "errors.hpp"

#include <sstream>

namespace fd {

namespace {

constexpr char kSeparator = ':';

void requireNonEmpty(const std::string& value, const char* name) {
    if (value.empty()) {
        throw InvalidInput(std::string(name) + " must not be empty");
    }
}

} // namespace

std::string deriveCommitment(const std::string& serverSeed, const std::string& nonce) {
    requireNonEmpty(serverSeed, "serverSeed");
    requireNonEmpty(nonce, "nonce");

    std::ostringstream oss;
    oss << serverSeed << kSeparator << nonce;
    return sha256Hex(oss.str());
}

std::string deriveCombinedSeed(const std::string& serverSeed,
                               const std::string& clientSeed,
                               const std::string& nonce) {
    requireNonEmpty(serverSeed, "serverSeed");
    requireNonEmpty(clientSeed, "clientSeed");
    requireNonEmpty(nonce, "nonce");

    std::ostringstream oss;
    oss << serverSeed << kSeparator << clientSeed << kSeparator << nonce;
    return sha256Hex(oss.str());
}

bool verifyCommitment(const std::string& serverSeed,
                      const std::string& nonce,
                      const std::string& commitHex) {
    if (serverSeed.empty() || nonce.empty() || commitHex.empty()) {
        return false;
    }
    return digestsEqual(deriveCommitment(serverSeed, nonce), commitHex);
}

Xorshift32Rng initGenerator(const std::string& combinedSeedHex) {
    return Xorshift32Rng::fromCombinedSeed(combinedSeedHex);
}

} // namespace fd
