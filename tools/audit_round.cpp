#include "audit.hpp"
#include "board.hpp"
#include "payout.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

int parseInt(const char* text, const char* name) {
    std::size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (text[consumed] != '\0') {
        throw std::invalid_argument(std::string(name) + " must be an integer");
    }
    return value;
}

const char* verdict(bool ok) {
    return ok ? "match" : "MISMATCH";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: audit_round <serverSeed> <clientSeed> <nonce> <dropColumn> "
                     "[commitHex] [boardHash] [binIndex]\n";
        return 1;
    }

    fd::RoundDisclosure disclosure{ argv[1], argv[2], argv[3], 0 };
    try {
        disclosure.dropColumn = parseInt(argv[4], "dropColumn");

        auto recomputed = fd::recomputeRound(disclosure);
        std::cout << "Commitment:    " << recomputed.commitHex << '\n';
        std::cout << "Combined seed: " << recomputed.combinedSeed << '\n';
        std::cout << "Board hash:    " << recomputed.pegBoardHash << '\n';
        std::cout << "Bin:           " << recomputed.binIndex << " (x"
                  << fd::payoutMultiplier(recomputed.binIndex).toDouble() << ")\n";
        std::cout << "Path:          " << fd::pathToString(recomputed.path) << '\n';

        if (argc < 6) {
            return 0;
        }

        // Fields the caller did not supply are taken from the recomputation.
        fd::PublishedRound published{ argv[5], recomputed.pegBoardHash, recomputed.binIndex, std::nullopt };
        if (argc > 6) {
            published.pegBoardHash = argv[6];
        }
        if (argc > 7) {
            published.binIndex = parseInt(argv[7], "binIndex");
        }

        auto report = fd::auditRound(disclosure, published);
        std::cout << "\nCommitment: " << verdict(report.commitMatches) << '\n';
        if (argc > 6) {
            std::cout << "Board hash: " << verdict(report.boardHashMatches) << '\n';
        }
        if (argc > 7) {
            std::cout << "Bin:        " << verdict(report.binMatches) << '\n';
        }
        std::cout << "Audit: " << (report.passed() ? "valid" : "INVALID") << '\n';
        return report.passed() ? 0 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "audit_round: " << ex.what() << '\n';
        return 1;
    }
}
