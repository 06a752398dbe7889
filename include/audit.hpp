#pragma once

#include "board.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fd {

// Everything a player holds once the server seed has been revealed.
struct RoundDisclosure {
    std::string serverSeed;
    std::string clientSeed;
    std::string nonce;
    int dropColumn;
};

struct RecomputedRound {
    std::string commitHex;
    std::string combinedSeed;
    std::string pegBoardHash;
    int binIndex;
    std::vector<PathDecision> path;
};

// Values the server published before the reveal.
struct PublishedRound {
    std::string commitHex;
    std::string pegBoardHash;
    int binIndex;
    std::optional<std::vector<PathDecision>> path;
};

struct AuditReport {
    RecomputedRound recomputed;
    bool commitMatches;
    bool boardHashMatches;
    bool binMatches;
    bool pathMatches;

    bool passed() const { return commitMatches && boardHashMatches && binMatches && pathMatches; }
};

RecomputedRound recomputeRound(const RoundDisclosure& disclosure);
AuditReport auditRound(const RoundDisclosure& disclosure, const PublishedRound& published);

} // namespace fd
