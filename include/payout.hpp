#pragma once

#include <array>
#include <cstdint>

#include "board.hpp"
#include "fixed_point.hpp"

namespace fd {

struct Bet {
    std::uint64_t stakeCents;
    int dropColumn;
};

struct PayoutResult {
    std::int64_t grossPayoutCents;
    std::int64_t netChangeCents;
    Fixed64 multiplier;
};

// Edges pay more, the center pays least.
const std::array<Fixed64, kBoardRows + 1>& payoutTable();
Fixed64 payoutMultiplier(int binIndex);
Fixed64 maxPayoutMultiplier();

// Rejects stakes whose payout would overflow for some bin. Independent of the outcome, so
// it can run before the round draws anything.
void validateStake(std::uint64_t stakeCents);

PayoutResult resolveBet(const Bet& bet, int binIndex);

} // namespace fd
