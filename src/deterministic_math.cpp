#include "deterministic_math.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace fd {

namespace {

using boost::multiprecision::cpp_int;

constexpr int kMantissaBits = std::numeric_limits<double>::digits;

} // namespace

std::int64_t DeterministicMath::roundToMicros(double value) {
    if (!std::isfinite(value)) {
        throw std::domain_error("Cannot round a non-finite value");
    }
    if (value == 0.0) {
        return 0;
    }

    // |value| = mantissa * 2^exponent with an integral 53-bit mantissa.
    int exponent = 0;
    double fraction = std::frexp(std::fabs(value), &exponent);
    auto mantissa = static_cast<std::uint64_t>(std::ldexp(fraction, kMantissaBits));
    exponent -= kMantissaBits;

    cpp_int scaled = cpp_int(mantissa) * kMicroScale;
    cpp_int rounded;
    if (exponent >= 0) {
        rounded = scaled << exponent;
    } else {
        const auto shift = static_cast<unsigned>(-exponent);
        rounded = scaled >> shift;
        cpp_int remainder = scaled - (rounded << shift);
        if ((remainder << 1) >= (cpp_int(1) << shift)) {
            ++rounded;
        }
    }

    if (rounded > cpp_int(std::numeric_limits<std::int64_t>::max())) {
        throw std::overflow_error("Value too large for micro-unit rounding");
    }
    auto micros = rounded.convert_to<std::int64_t>();
    return value < 0.0 ? -micros : micros;
}

double DeterministicMath::fromMicros(std::int64_t micros) {
    return static_cast<double>(micros) / static_cast<double>(kMicroScale);
}

double DeterministicMath::roundTo6(double value) {
    return fromMicros(roundToMicros(value));
}

std::string DeterministicMath::formatMicros(std::int64_t micros) {
    std::string out;
    std::uint64_t magnitude = 0;
    if (micros < 0) {
        out.push_back('-');
        magnitude = static_cast<std::uint64_t>(-(micros + 1)) + 1;
    } else {
        magnitude = static_cast<std::uint64_t>(micros);
    }

    const auto scale = static_cast<std::uint64_t>(kMicroScale);
    out += std::to_string(magnitude / scale);
    std::uint64_t frac = magnitude % scale;
    if (frac == 0) {
        return out;
    }

    std::string digits = std::to_string(frac);
    digits.insert(0, 6 - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    out.push_back('.');
    out += digits;
    return out;
}

double DeterministicMath::clampUnit(double value) {
    if (value < 0.0) {
        return 0.0;
    }
    if (value > 1.0) {
        return 1.0;
    }
    return value;
}

} // namespace fd
