#include "audit.hpp"

#include "digest.hpp"
#include "fairness.hpp"

namespace fd {

RecomputedRound recomputeRound(const RoundDisclosure& disclosure) {
    validateDropColumn(disclosure.dropColumn);

    std::string commitHex = deriveCommitment(disclosure.serverSeed, disclosure.nonce);
    std::string combinedSeed =
        deriveCombinedSeed(disclosure.serverSeed, disclosure.clientSeed, disclosure.nonce);

    auto rng = initGenerator(combinedSeed);
    auto outcome = simulateDrop(rng, disclosure.dropColumn);

    return RecomputedRound{ std::move(commitHex),
                            std::move(combinedSeed),
                            std::move(outcome.boardHash),
                            outcome.binIndex,
                            std::move(outcome.path) };
}

AuditReport auditRound(const RoundDisclosure& disclosure, const PublishedRound& published) {
    AuditReport report{ recomputeRound(disclosure), false, false, false, false };
    report.commitMatches = digestsEqual(report.recomputed.commitHex, published.commitHex);
    report.boardHashMatches = digestsEqual(report.recomputed.pegBoardHash, published.pegBoardHash);
    report.binMatches = report.recomputed.binIndex == published.binIndex;
    report.pathMatches = !published.path || *published.path == report.recomputed.path;
    return report;
}

} // namespace fd
