#pragma once

#include "audit.hpp"
#include "board.hpp"
#include "payout.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fd {

enum class RoundStatus {
    CREATED,
    STARTED,
    REVEALED
};

const char* toString(RoundStatus status);

struct RoundResult {
    std::string clientSeed;
    std::string combinedSeed;
    std::string pegBoardHash;
    PegBoard board;
    int rows;
    int dropColumn;
    int binIndex;
    std::vector<PathDecision> path;
    std::uint64_t betCents;
    PayoutResult payout;
};

struct RoundReveal {
    std::string serverSeed;
    std::string nonce;
};

// One commit -> start -> reveal cycle. The server seed stays inside the round until
// reveal() and is wiped when the round is destroyed.
class Round {
public:
    using Clock = std::chrono::system_clock;

    // Fresh CSPRNG seed, nonce and id; the commitment is available immediately.
    static Round create();
    Round(std::string roundId, std::string serverSeed, std::string nonce);
    ~Round();

    Round(const Round&) = delete;
    Round& operator=(const Round&) = delete;
    Round(Round&&) = default;
    Round& operator=(Round&&) = delete;

    const RoundResult& start(const std::string& clientSeed,
                             std::uint64_t betCents,
                             int dropColumn,
                             const DropStepCallback& onStep = nullptr);
    RoundReveal reveal();

    const std::string& getId() const { return id_; }
    RoundStatus getStatus() const { return status_; }
    const std::string& getCommitHex() const { return commitHex_; }
    const std::string& getNonce() const { return nonce_; }
    Clock::time_point getCreatedAt() const { return createdAt_; }
    std::optional<Clock::time_point> getRevealedAt() const { return revealedAt_; }

    const RoundResult& getResult() const;
    const std::string& getServerSeed() const;

    PublishedRound publishedRecord() const;
    RoundDisclosure disclosure() const;

private:
    std::string id_;
    std::string serverSeed_;
    std::string nonce_;
    std::string commitHex_;
    RoundStatus status_;
    Clock::time_point createdAt_;
    std::optional<Clock::time_point> revealedAt_;
    std::optional<RoundResult> result_;
};

} // namespace fd
