#include "board.hpp"

#include "deterministic_math.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "rng.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace fd {

namespace {

constexpr double kBiasCenter = 0.5;
constexpr double kBiasSpread = 0.2;
constexpr double kDropAdjustmentStep = 0.01;

double biasFromDraw(double draw) {
    double leftBias = kBiasCenter + (draw - kBiasCenter) * kBiasSpread;
    return DeterministicMath::roundTo6(leftBias);
}

} // namespace

PegBoard generatePegBoard(RandomSource& rng) {
    PegBoard board;
    board.reserve(kBoardRows);

    for (std::size_t r = 0; r < static_cast<std::size_t>(kBoardRows); ++r) {
        PegRow row{ r, {} };
        row.pegs.reserve(r + 1);
        for (std::size_t p = 0; p <= r; ++p) {
            row.pegs.push_back(Peg{ biasFromDraw(rng.uniform01()) });
        }
        board.push_back(std::move(row));
    }
    return board;
}

std::string serializePegBoard(const PegBoard& board) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t r = 0; r < board.size(); ++r) {
        if (r > 0) {
            oss << ',';
        }
        oss << '[';
        const auto& pegs = board[r].pegs;
        for (std::size_t p = 0; p < pegs.size(); ++p) {
            if (p > 0) {
                oss << ',';
            }
            oss << "{\"leftBias\":"
                << DeterministicMath::formatMicros(DeterministicMath::roundToMicros(pegs[p].leftBias))
                << '}';
        }
        oss << ']';
    }
    oss << ']';
    return oss.str();
}

std::string hashPegBoard(const PegBoard& board) {
    return sha256Hex(serializePegBoard(board));
}

double dropColumnAdjustment(int dropColumn) {
    return static_cast<double>(dropColumn - kBoardRows / 2) * kDropAdjustmentStep;
}

void validateDropColumn(int dropColumn) {
    if (dropColumn < kMinDropColumn || dropColumn > kMaxDropColumn) {
        std::ostringstream oss;
        oss << "dropColumn " << dropColumn << " outside [" << kMinDropColumn << ", "
            << kMaxDropColumn << "]";
        throw OutOfRangeParameter(oss.str());
    }
}

DropOutcome resolveDropPath(RandomSource& rng,
                            PegBoard board,
                            std::string boardHash,
                            int dropColumn,
                            const DropStepCallback& onStep) {
    validateDropColumn(dropColumn);
    if (board.size() != static_cast<std::size_t>(kBoardRows)) {
        throw std::invalid_argument("peg board must have exactly kBoardRows rows");
    }

    const double adjustment = dropColumnAdjustment(dropColumn);
    int pos = 0;
    std::vector<PathDecision> path;
    path.reserve(kBoardRows);

    for (std::size_t r = 0; r < board.size(); ++r) {
        const auto& pegs = board[r].pegs;
        if (pegs.size() != r + 1) {
            throw std::invalid_argument("peg row has the wrong number of pegs");
        }
        // The ball can have drifted right at most once per row already passed.
        std::size_t pegIndex = std::min(static_cast<std::size_t>(pos), r);
        double effectiveBias = DeterministicMath::clampUnit(pegs[pegIndex].leftBias + adjustment);

        PathDecision decision = PathDecision::LEFT;
        if (rng.uniform01() >= effectiveBias) {
            decision = PathDecision::RIGHT;
            ++pos;
        }
        path.push_back(decision);

        if (onStep) {
            onStep(r, decision, pos);
        }
    }

    return DropOutcome{ std::move(board), std::move(boardHash), pos, std::move(path) };
}

DropOutcome simulateDrop(RandomSource& rng, int dropColumn, const DropStepCallback& onStep) {
    validateDropColumn(dropColumn);

    PegBoard board = generatePegBoard(rng);
    // Hash before phase B draws anything further from the stream.
    std::string boardHash = hashPegBoard(board);
    return resolveDropPath(rng, std::move(board), std::move(boardHash), dropColumn, onStep);
}

std::string pathToString(const std::vector<PathDecision>& path) {
    std::string out;
    out.reserve(path.size());
    for (auto decision : path) {
        out.push_back(static_cast<char>(decision));
    }
    return out;
}

std::vector<PathDecision> pathFromString(const std::string& text) {
    std::vector<PathDecision> path;
    path.reserve(text.size());
    for (char ch : text) {
        if (ch == 'L') {
            path.push_back(PathDecision::LEFT);
        } else if (ch == 'R') {
            path.push_back(PathDecision::RIGHT);
        } else {
            throw std::invalid_argument(std::string("path contains invalid decision '") + ch + "'");
        }
    }
    return path;
}

int countRightMoves(const std::vector<PathDecision>& path) {
    return static_cast<int>(std::count(path.begin(), path.end(), PathDecision::RIGHT));
}

} // namespace fd
