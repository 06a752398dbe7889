#include "deterministic_math.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "test_rounding failure: " << msg << std::endl;
    std::exit(1);
}

void expectMicros(double value, std::int64_t expected) {
    std::int64_t actual = fd::DeterministicMath::roundToMicros(value);
    if (actual != expected) {
        fail("roundToMicros(" + std::to_string(value) + ") = " + std::to_string(actual) + ", expected " +
             std::to_string(expected));
    }
}

void expectText(std::int64_t micros, const std::string& expected) {
    std::string actual = fd::DeterministicMath::formatMicros(micros);
    if (actual != expected) {
        fail("formatMicros(" + std::to_string(micros) + ") = " + actual + ", expected " + expected);
    }
}

} // namespace

int main() {
    using fd::DeterministicMath;

    expectMicros(0.42212333298, 422123);
    expectMicros(0.5525025843, 552503);
    expectMicros(0.0, 0);
    expectMicros(1.0, 1000000);

    // Exact binary ties round away from zero: 57/128 and 63/128.
    expectMicros(0.4453125, 445313);
    expectMicros(0.4921875, 492188);
    expectMicros(-0.4453125, -445313);

    // 0.1234565 is stored slightly below the decimal tie, so it rounds down.
    expectMicros(0.1234565, 123456);

    if (DeterministicMath::roundTo6(0.43654000000001) != 0.43654) {
        fail("roundTo6 did not land on the nearest double to 0.43654");
    }
    if (DeterministicMath::fromMicros(422123) != 0.422123) {
        fail("fromMicros is not the nearest double");
    }

    expectText(422123, "0.422123");
    expectText(468780, "0.46878");
    expectText(500000, "0.5");
    expectText(1000000, "1");
    expectText(0, "0");
    expectText(1, "0.000001");
    expectText(-250000, "-0.25");
    expectText(12345678, "12.345678");

    if (DeterministicMath::clampUnit(-0.01) != 0.0 || DeterministicMath::clampUnit(1.2) != 1.0 ||
        DeterministicMath::clampUnit(0.37) != 0.37) {
        fail("clampUnit misbehaves");
    }

    bool threw = false;
    try {
        DeterministicMath::roundToMicros(std::numeric_limits<double>::infinity());
    } catch (const std::domain_error&) {
        threw = true;
    }
    if (!threw) {
        fail("non-finite value was rounded");
    }

    std::cout << "test_rounding passed" << std::endl;
    return 0;
}
