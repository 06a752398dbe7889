#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fd {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

// 32 bytes, 64 hex characters. Never reproduced, only disclosed at reveal.
std::string generateServerSeed();
// 8 bytes, 16 hex characters.
std::string generateRoundNonce();
std::string generateRoundId();
// Used when a player leaves the client seed blank.
std::string generateClientSeed();

} // namespace fd
