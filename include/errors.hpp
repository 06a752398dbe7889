#pragma once

#include <stdexcept>
#include <string>

namespace fd {

// Empty or missing secret, nonce or client seed.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// Combined seed digest too short (or malformed) to yield the 4 seed bytes.
class InvalidSeedMaterial : public std::invalid_argument {
public:
    explicit InvalidSeedMaterial(const std::string& what) : std::invalid_argument(what) {}
};

// Drop column or bin index outside 0..kBoardRows.
class OutOfRangeParameter : public std::out_of_range {
public:
    explicit OutOfRangeParameter(const std::string& what) : std::out_of_range(what) {}
};

// Round lifecycle call made in the wrong status.
class InvalidRoundState : public std::logic_error {
public:
    explicit InvalidRoundState(const std::string& what) : std::logic_error(what) {}
};

} // namespace fd
