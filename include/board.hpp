#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace fd {

class RandomSource;

constexpr int kBoardRows = 12;
constexpr int kMinDropColumn = 0;
constexpr int kMaxDropColumn = kBoardRows;

struct Peg {
    double leftBias;
};

struct PegRow {
    std::size_t index;
    std::vector<Peg> pegs;
};

using PegBoard = std::vector<PegRow>;

enum class PathDecision : char {
    LEFT = 'L',
    RIGHT = 'R'
};

struct DropOutcome {
    PegBoard board;
    std::string boardHash;
    int binIndex;
    std::vector<PathDecision> path;
};

// Invoked once per row during path resolution, after the decision for that row is made.
// `position` is the number of RIGHT moves so far, including this row's.
using DropStepCallback =
    std::function<void(std::size_t row, PathDecision decision, int position)>;

// Phase A: draws one value per peg, row by row (78 draws for 12 rows).
PegBoard generatePegBoard(RandomSource& rng);
std::string serializePegBoard(const PegBoard& board);
std::string hashPegBoard(const PegBoard& board);

double dropColumnAdjustment(int dropColumn);
void validateDropColumn(int dropColumn);

// Phase B: draws one value per row against the board built in phase A.
DropOutcome resolveDropPath(RandomSource& rng,
                            PegBoard board,
                            std::string boardHash,
                            int dropColumn,
                            const DropStepCallback& onStep = nullptr);

// Both phases on one stream. The drop column is validated before the first draw.
DropOutcome simulateDrop(RandomSource& rng, int dropColumn, const DropStepCallback& onStep = nullptr);

std::string pathToString(const std::vector<PathDecision>& path);
std::vector<PathDecision> pathFromString(const std::string& text);
int countRightMoves(const std::vector<PathDecision>& path);

} // namespace fd
