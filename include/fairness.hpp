#pragma once

#include "rng.hpp"

#include <string>

namespace fd {

// commitHex = SHA256(serverSeed ":" nonce). Published before the client seed is known.
std::string deriveCommitment(const std::string& serverSeed, const std::string& nonce);

// combinedSeed = SHA256(serverSeed ":" clientSeed ":" nonce).
std::string deriveCombinedSeed(const std::string& serverSeed,
                               const std::string& clientSeed,
                               const std::string& nonce);

bool verifyCommitment(const std::string& serverSeed,
                      const std::string& nonce,
                      const std::string& commitHex);

Xorshift32Rng initGenerator(const std::string& combinedSeedHex);

} // namespace fd
