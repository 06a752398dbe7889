#include "audit.hpp"
#include "board.hpp"
#include "errors.hpp"
#include "fairness.hpp"
#include "payout.hpp"
#include "rng.hpp"

#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "test_errors failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Error>
void expectThrows(const std::function<void()>& body, const std::string& what) {
    try {
        body();
    } catch (const Error&) {
        return;
    } catch (const std::exception& ex) {
        fail(what + ": wrong exception type (" + ex.what() + ")");
    }
    fail(what + ": did not throw");
}

const std::string kServerSeed = "b2a5f3f32a4d9c6ee7a8c1d33456677890abcdeffedcba0987654321ffeeddcc";

} // namespace

int main() {
    using namespace fd;

    expectThrows<InvalidInput>([] { deriveCommitment("", "42"); }, "empty server seed");
    expectThrows<InvalidInput>([] { deriveCommitment(kServerSeed, ""); }, "empty nonce");
    expectThrows<InvalidInput>([] { deriveCombinedSeed(kServerSeed, "", "42"); }, "empty client seed");
    expectThrows<InvalidInput>([] { deriveCombinedSeed("", "player", "42"); }, "empty seed for combine");
    expectThrows<std::invalid_argument>([] { deriveCombinedSeed(kServerSeed, "player", ""); },
                                        "empty nonce for combine");

    expectThrows<InvalidSeedMaterial>([] { initGenerator(""); }, "empty combined seed");
    expectThrows<InvalidSeedMaterial>([] { initGenerator("abcdef"); }, "three-byte combined seed");
    expectThrows<InvalidSeedMaterial>([] { initGenerator("abcdef1"); }, "odd-length short seed");
    expectThrows<InvalidSeedMaterial>([] { initGenerator("zzzzzzzz00"); }, "non-hex seed bytes");
    expectThrows<InvalidSeedMaterial>([] { initGenerator("abc-ef12"); }, "separator inside seed bytes");

    // Exactly four bytes is enough.
    auto minimal = initGenerator("0000002a");
    if (minimal.getState() != 42u) {
        fail("four-byte seed decoded incorrectly");
    }
    if (initGenerator("E1DDDF77").getState() != 0xe1dddf77u) {
        fail("uppercase hex seed decoded incorrectly");
    }

    // Out-of-range drop columns are rejected before the generator is touched.
    for (int column : { -1, kMaxDropColumn + 1, 100 }) {
        auto rng = initGenerator(deriveCombinedSeed(kServerSeed, "player", "42"));
        expectThrows<OutOfRangeParameter>([&] { simulateDrop(rng, column); },
                                          "drop column " + std::to_string(column));
        if (rng.getCallCount() != 0) {
            fail("rejected drop column still consumed draws");
        }
    }
    expectThrows<std::out_of_range>([] { payoutMultiplier(kBoardRows + 1); }, "bin above range");
    expectThrows<OutOfRangeParameter>([] { payoutMultiplier(-1); }, "negative bin");
    expectThrows<OutOfRangeParameter>([] { resolveBet(Bet{ 100, 13 }, 6); }, "bet with bad column");
    expectThrows<std::overflow_error>([] { resolveBet(Bet{ ~0ULL, 6 }, 0); }, "oversized stake");

    expectThrows<OutOfRangeParameter>(
        [] { recomputeRound(RoundDisclosure{ kServerSeed, "player", "42", -3 }); }, "audit with bad column");
    expectThrows<InvalidInput>([] { recomputeRound(RoundDisclosure{ kServerSeed, "", "42", 6 }); },
                               "audit with empty client seed");

    expectThrows<std::invalid_argument>([] { pathFromString("LRX"); }, "bad path text");

    if (verifyCommitment("", "42", "00")) {
        fail("verifyCommitment accepted empty server seed");
    }
    if (verifyCommitment(kServerSeed, "43", deriveCommitment(kServerSeed, "42"))) {
        fail("verifyCommitment accepted a commitment for another nonce");
    }

    std::cout << "test_errors passed" << std::endl;
    return 0;
}
