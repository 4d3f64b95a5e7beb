#pragma once

#include <array>
#include <vector>

#include "CubeTypes.h"

namespace PocketCube {

constexpr int kCycleLength = 4;
constexpr int kCyclesPerMove = 3;   // one self-rotation + two side cycles
constexpr int kWorkingSetSize = kCycleLength * kCyclesPerMove;

// The color at addresses[i] moves to addresses[(i + 1) % kCycleLength]
struct PermutationCycle {
    std::array<FaceletAddress, kCycleLength> addresses;
};

struct MoveTable {
    Move move;
    std::array<PermutationCycle, kCyclesPerMove> cycles;

    std::vector<FaceletAddress> workingSet() const;
    bool touches(const FaceletAddress& address) const;
};

using MoveTableSet = std::array<MoveTable, kMoveCount>;

// Border strip of a neighbouring face that touches the turned face.
// Strips are listed clockwise around the turned face, aligned so that on a
// clockwise turn facelets[k] moves to facelets[k] of the next strip.
struct NeighbourStrip {
    Face face;
    std::array<std::array<int, 2>, 2> facelets;  // {row, col} pairs
};

using FaceAdjacency = std::array<NeighbourStrip, 4>;

// Indexed by Face
extern const std::array<FaceAdjacency, kFaceCount> kFaceAdjacency;

// Derives all 12 tables from kFaceAdjacency
MoveTableSet buildMoveTables();

// Throws std::runtime_error describing the first broken invariant
void validateMoveTables(const MoveTableSet& tables);

// Process-wide, read-only registry of the 12 move tables.
// Built and validated on first use; a table that fails validation
// makes instance() throw, so no move ever runs against it.
class MoveTableRegistry {
public:
    static const MoveTableRegistry& instance();

    const MoveTable& table(const Move& move) const { return tables[move.index()]; }
    const MoveTableSet& allTables() const { return tables; }

    MoveTableRegistry(const MoveTableRegistry&) = delete;
    MoveTableRegistry& operator=(const MoveTableRegistry&) = delete;

private:
    MoveTableRegistry();

    MoveTableSet tables;
};

} // namespace PocketCube
