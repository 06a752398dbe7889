#include "rng.hpp"

#include "digest.hpp"
#include "errors.hpp"

#include <sstream>

namespace fd {

namespace {

constexpr std::size_t kSeedBytes = 4;
constexpr std::uint32_t kZeroStateFallback = 1;
constexpr double kTwoPow32 = 4294967296.0;

} // namespace

Xorshift32Rng::Xorshift32Rng(std::uint32_t seed)
    : state_(seed == 0 ? kZeroStateFallback : seed)
    , callCount_(0) {}

Xorshift32Rng Xorshift32Rng::fromCombinedSeed(const std::string& combinedSeedHex) {
    const std::size_t needed = kSeedBytes * 2;
    if (combinedSeedHex.size() < needed) {
        std::ostringstream oss;
        oss << "combined seed must provide at least " << kSeedBytes << " bytes (" << needed
            << " hex chars), got " << combinedSeedHex.size() << " chars";
        throw InvalidSeedMaterial(oss.str());
    }

    const std::string prefix = combinedSeedHex.substr(0, needed);
    if (!isHexString(prefix)) {
        throw InvalidSeedMaterial("combined seed prefix is not valid hex: " + prefix);
    }

    auto bytes = hexToBytes(prefix);
    std::uint32_t seed = 0;
    for (std::size_t i = 0; i < kSeedBytes; ++i) {
        seed = (seed << 8) | bytes[i];
    }
    return Xorshift32Rng(seed);
}

std::uint32_t Xorshift32Rng::nextU32() {
    std::uint32_t x = state_;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state_ = x;
    ++callCount_;
    return state_;
}

double Xorshift32Rng::uniform01() {
    return static_cast<double>(nextU32()) / kTwoPow32;
}

} // namespace fd
