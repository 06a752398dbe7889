#include "payout.hpp"

#include "errors.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace fd {

namespace {

std::int64_t checkedStakeToInt64(std::uint64_t stake) {
    constexpr std::uint64_t maxStake =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (stake > maxStake) {
        throw std::overflow_error("stake too large for signed settlement");
    }
    return static_cast<std::int64_t>(stake);
}

constexpr std::array<Fixed64, kBoardRows + 1> kPayoutTable{
    Fixed64::fromRaw(10'000'000), // bin 0
    Fixed64::fromRaw(5'000'000),
    Fixed64::fromRaw(2'000'000),
    Fixed64::fromRaw(1'500'000),
    Fixed64::fromRaw(1'000'000),
    Fixed64::fromRaw(500'000),
    Fixed64::fromRaw(200'000), // bin 6, center
    Fixed64::fromRaw(500'000),
    Fixed64::fromRaw(1'000'000),
    Fixed64::fromRaw(1'500'000),
    Fixed64::fromRaw(2'000'000),
    Fixed64::fromRaw(5'000'000),
    Fixed64::fromRaw(10'000'000), // bin 12
};

} // namespace

const std::array<Fixed64, kBoardRows + 1>& payoutTable() {
    return kPayoutTable;
}

Fixed64 payoutMultiplier(int binIndex) {
    if (binIndex < 0 || binIndex > kBoardRows) {
        std::ostringstream oss;
        oss << "binIndex " << binIndex << " outside [0, " << kBoardRows << "]";
        throw OutOfRangeParameter(oss.str());
    }
    return kPayoutTable[static_cast<std::size_t>(binIndex)];
}

Fixed64 maxPayoutMultiplier() {
    Fixed64 best = kPayoutTable.front();
    for (auto multiplier : kPayoutTable) {
        if (multiplier.raw() > best.raw()) {
            best = multiplier;
        }
    }
    return best;
}

void validateStake(std::uint64_t stakeCents) {
    checkedStakeToInt64(stakeCents);
    maxPayoutMultiplier().scaleAmount(stakeCents);
}

PayoutResult resolveBet(const Bet& bet, int binIndex) {
    validateDropColumn(bet.dropColumn);
    validateStake(bet.stakeCents);
    Fixed64 multiplier = payoutMultiplier(binIndex);

    std::int64_t stake = checkedStakeToInt64(bet.stakeCents);
    std::int64_t gross = multiplier.scaleAmount(bet.stakeCents);
    return PayoutResult{ gross, gross - stake, multiplier };
}

} // namespace fd
