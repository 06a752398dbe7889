#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fd {

// Lowercase hex SHA-256 of the raw bytes of `data`.
std::string sha256Hex(const std::string& data);

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::vector<unsigned char> hexToBytes(const std::string& hex);

bool isHexString(const std::string& value);
bool digestsEqual(const std::string& lhsHex, const std::string& rhsHex);

} // namespace fd
