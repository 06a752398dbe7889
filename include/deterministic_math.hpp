#pragma once

#include <cstdint>
#include <string>

namespace fd {

// Decimal rounding that depends only on the exact binary value of a double, never on the
// platform's float formatting. Board biases pass through here before they are hashed.
class DeterministicMath {
public:
    static constexpr std::int64_t kMicroScale = 1'000'000;

    // Round-half-away-from-zero of value * 10^6, computed exactly.
    static std::int64_t roundToMicros(double value);
    // Nearest double to micros / 10^6.
    static double fromMicros(std::int64_t micros);
    static double roundTo6(double value);

    // Shortest decimal text for micros / 10^6 ("0.5", "0.422123", "1").
    static std::string formatMicros(std::int64_t micros);

    static double clampUnit(double value);
};

} // namespace fd
