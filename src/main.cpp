#include "audit.hpp"
#include "board.hpp"
#include "payout.hpp"
#include "round.hpp"
#include "secure_random.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <thread>

using namespace fd;

namespace {

constexpr std::int64_t kDefaultBankrollCents = 100'000;
constexpr long kDefaultRowDelayMs = 120;

long envOrDefault(const char* name, long fallback) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    char* end = nullptr;
    long parsed = std::strtol(raw, &end, 10);
    if (end == nullptr || *end != '\0' || parsed < 0) {
        std::cerr << "Ignoring invalid " << name << "=\"" << raw << "\"; using " << fallback << "\n";
        return fallback;
    }
    return parsed;
}

std::string formatCents(std::int64_t cents) {
    std::ostringstream oss;
    if (cents < 0) {
        oss << '-';
        cents = -cents;
    }
    oss << cents / 100 << '.' << std::setw(2) << std::setfill('0') << cents % 100;
    return oss.str();
}

void printPayoutTable() {
    std::cout << "Bin payouts:";
    const auto& table = payoutTable();
    for (std::size_t bin = 0; bin < table.size(); ++bin) {
        std::cout << "  [" << bin << "] x" << table[bin].toDouble();
    }
    std::cout << "\n";
}

void printDropStep(std::size_t row, PathDecision decision, int position, long delayMs) {
    const std::size_t indent = static_cast<std::size_t>(kBoardRows) - row;
    std::cout << std::string(indent, ' ');
    for (std::size_t slot = 0; slot <= row + 1; ++slot) {
        std::cout << (static_cast<int>(slot) == position ? 'o' : '.') << ' ';
    }
    std::cout << "  row " << std::setw(2) << row << ": "
              << (decision == PathDecision::LEFT ? "left" : "right") << "\n";
    if (delayMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
}

bool readLine(std::string& out) {
    return static_cast<bool>(std::getline(std::cin, out));
}

} // namespace

int main() {
    try {
        std::int64_t bankroll = envOrDefault("FD_BANKROLL_CENTS", kDefaultBankrollCents);
        const long rowDelayMs = envOrDefault("FD_ROW_DELAY_MS", kDefaultRowDelayMs);

        std::cout << "Welcome to fairdrop: a provably fair " << kBoardRows << "-row peg drop.\n";
        std::cout << "(set FD_BANKROLL_CENTS/FD_ROW_DELAY_MS to override defaults)\n";
        printPayoutTable();

        while (true) {
            if (bankroll <= 0) {
                std::cout << "\nYou are out of funds. Session over.\n";
                break;
            }

            Round round = Round::create();
            std::cout << "\n----------------------------------------\n";
            std::cout << "Bankroll: " << formatCents(bankroll) << "\n";
            std::cout << "Round " << round.getId() << "\n";
            std::cout << "Server commitment: " << round.getCommitHex() << "\n";
            std::cout << "Nonce: " << round.getNonce() << "\n";

            std::cout << "\nStake in cents (max " << bankroll << ", -1 to quit): ";
            long long stakeInput = 0;
            if (!(std::cin >> stakeInput)) {
                break;
            }
            if (stakeInput < 0) {
                std::cout << "Exiting.\n";
                break;
            }
            if (stakeInput > bankroll) {
                std::cout << "Stake exceeds bankroll. Try again.\n";
                continue;
            }

            std::cout << "Drop column [" << kMinDropColumn << "-" << kMaxDropColumn << "]: ";
            int dropColumn = 0;
            if (!(std::cin >> dropColumn)) {
                break;
            }
            if (dropColumn < kMinDropColumn || dropColumn > kMaxDropColumn) {
                std::cout << "Invalid drop column. Try again.\n";
                continue;
            }

            std::cout << "Client seed (blank = random): ";
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::string clientSeed;
            if (!readLine(clientSeed)) {
                break;
            }
            if (clientSeed.empty()) {
                clientSeed = generateClientSeed();
                std::cout << "Generated client seed: " << clientSeed << "\n";
            }

            std::cout << "\n";
            const auto& result = round.start(
                clientSeed,
                static_cast<std::uint64_t>(stakeInput),
                dropColumn,
                [&](std::size_t row, PathDecision decision, int position) {
                    printDropStep(row, decision, position, rowDelayMs);
                });

            bankroll += result.payout.netChangeCents;
            std::cout << "\nLanded in bin " << result.binIndex << " (x" << result.payout.multiplier.toDouble()
                      << "). Payout " << formatCents(result.payout.grossPayoutCents) << ", net "
                      << formatCents(result.payout.netChangeCents) << ".\n";
            std::cout << "Board hash: " << result.pegBoardHash << "\n";
            std::cout << "Path: " << pathToString(result.path) << "\n";

            auto revealed = round.reveal();
            std::cout << "\n=== PROVABLY FAIR REVEAL ===\n";
            std::cout << "Server seed: " << revealed.serverSeed << "\n";
            std::cout << "Nonce: " << revealed.nonce << "\n";
            std::cout << "Client seed: " << result.clientSeed << "\n";
            std::cout << "Drop column: " << result.dropColumn << "\n";
            std::cout << "Combined seed: " << result.combinedSeed << "\n";

            auto report = auditRound(round.disclosure(), round.publishedRecord());
            std::cout << "Self-audit: " << (report.passed() ? "valid" : "INVALID") << "\n";
            std::cout << "Verify with: fd_audit_round " << revealed.serverSeed << " '" << result.clientSeed
                      << "' " << revealed.nonce << " " << result.dropColumn << " " << round.getCommitHex()
                      << " " << result.pegBoardHash << " " << result.binIndex << "\n";
        }

        std::cout << "\nFinal bankroll: " << formatCents(bankroll) << "\n";
        std::cout << "Thanks for playing.\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "fairdrop: " << ex.what() << "\n";
        return 1;
    }
}
