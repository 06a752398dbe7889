#include "round.hpp"

#include "errors.hpp"
#include "fairness.hpp"
#include "secure_memory.hpp"
#include "secure_random.hpp"

#include <sstream>

namespace fd {

namespace {

void requireStatus(RoundStatus actual, RoundStatus expected, const char* operation) {
    if (actual != expected) {
        std::ostringstream oss;
        oss << operation << " requires round status " << toString(expected) << ", round is "
            << toString(actual);
        throw InvalidRoundState(oss.str());
    }
}

} // namespace

const char* toString(RoundStatus status) {
    switch (status) {
    case RoundStatus::CREATED:
        return "CREATED";
    case RoundStatus::STARTED:
        return "STARTED";
    case RoundStatus::REVEALED:
        return "REVEALED";
    }
    return "UNKNOWN";
}

Round Round::create() {
    return Round(generateRoundId(), generateServerSeed(), generateRoundNonce());
}

Round::Round(std::string roundId, std::string serverSeed, std::string nonce)
    : id_(std::move(roundId))
    , serverSeed_(std::move(serverSeed))
    , nonce_(std::move(nonce))
    , commitHex_(deriveCommitment(serverSeed_, nonce_))
    , status_(RoundStatus::CREATED)
    , createdAt_(Clock::now())
    , revealedAt_()
    , result_() {
    if (id_.empty()) {
        throw InvalidInput("roundId must not be empty");
    }
}

Round::~Round() {
    secureWipe(serverSeed_);
    if (result_) {
        secureWipe(result_->combinedSeed);
    }
}

const RoundResult& Round::start(const std::string& clientSeed,
                                std::uint64_t betCents,
                                int dropColumn,
                                const DropStepCallback& onStep) {
    requireStatus(status_, RoundStatus::CREATED, "start");
    validateDropColumn(dropColumn);
    validateStake(betCents);

    std::string combinedSeed = deriveCombinedSeed(serverSeed_, clientSeed, nonce_);
    auto rng = initGenerator(combinedSeed);
    auto outcome = simulateDrop(rng, dropColumn, onStep);
    auto payout = resolveBet(Bet{ betCents, dropColumn }, outcome.binIndex);

    result_ = RoundResult{ clientSeed,
                           std::move(combinedSeed),
                           std::move(outcome.boardHash),
                           std::move(outcome.board),
                           kBoardRows,
                           dropColumn,
                           outcome.binIndex,
                           std::move(outcome.path),
                           betCents,
                           payout };
    status_ = RoundStatus::STARTED;
    return *result_;
}

RoundReveal Round::reveal() {
    requireStatus(status_, RoundStatus::STARTED, "reveal");
    status_ = RoundStatus::REVEALED;
    revealedAt_ = Clock::now();
    return RoundReveal{ serverSeed_, nonce_ };
}

const RoundResult& Round::getResult() const {
    if (!result_) {
        throw InvalidRoundState("round " + id_ + " has not been started");
    }
    return *result_;
}

const std::string& Round::getServerSeed() const {
    requireStatus(status_, RoundStatus::REVEALED, "getServerSeed");
    return serverSeed_;
}

PublishedRound Round::publishedRecord() const {
    const auto& result = getResult();
    return PublishedRound{ commitHex_, result.pegBoardHash, result.binIndex, result.path };
}

RoundDisclosure Round::disclosure() const {
    requireStatus(status_, RoundStatus::REVEALED, "disclosure");
    const auto& result = getResult();
    return RoundDisclosure{ serverSeed_, result.clientSeed, nonce_, result.dropColumn };
}

} // namespace fd
