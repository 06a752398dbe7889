#pragma once

#include <cstdint>
#include <string>

namespace fd {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform01() = 0;
};

// Marsaglia xorshift32 (13, 17, 5). The whole round draws from one instance in a fixed
// order, so instances are move-only.
class Xorshift32Rng : public RandomSource {
public:
    explicit Xorshift32Rng(std::uint32_t seed);

    Xorshift32Rng(const Xorshift32Rng&) = delete;
    Xorshift32Rng& operator=(const Xorshift32Rng&) = delete;
    Xorshift32Rng(Xorshift32Rng&&) noexcept = default;
    Xorshift32Rng& operator=(Xorshift32Rng&&) noexcept = default;

    // Seeds from the first four bytes (big-endian) of a hex digest.
    static Xorshift32Rng fromCombinedSeed(const std::string& combinedSeedHex);

    std::uint32_t nextU32();
    double uniform01() override;

    std::uint32_t getState() const { return state_; }
    std::uint64_t getCallCount() const { return callCount_; }

private:
    std::uint32_t state_;
    std::uint64_t callCount_;
};

} // namespace fd
