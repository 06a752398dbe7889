#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace fd {

// Fixed-point micro-units, used for payout multipliers so settlement never touches
// floating point.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits

    constexpr Fixed64() : raw_(0) {}
    static constexpr Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }

    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    constexpr std::int64_t raw() const { return raw_; }

    // floor(amount * this), for non-negative multipliers. Throws when the product does not
    // fit in a signed 64-bit integer.
    std::int64_t scaleAmount(std::uint64_t amount) const {
        if (raw_ < 0) {
            throw std::domain_error("Fixed64::scaleAmount requires a non-negative multiplier");
        }
        __int128 wide = static_cast<__int128>(amount) * static_cast<__int128>(raw_);
        wide /= kScale;
        if (wide > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            throw std::overflow_error("Fixed64::scaleAmount overflow");
        }
        return static_cast<std::int64_t>(wide);
    }

    Fixed64& operator+=(Fixed64 other) {
        __int128 wide = static_cast<__int128>(raw_) + static_cast<__int128>(other.raw_);
        raw_ = clampToInt64(wide);
        return *this;
    }

    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    struct RawTag {};
    constexpr Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}
    static std::int64_t clampToInt64(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    std::int64_t raw_;
};

} // namespace fd
