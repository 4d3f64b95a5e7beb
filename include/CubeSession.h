#pragma once

#include <atomic>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "Config.h"
#include "CubeState.h"
#include "FaceletStore.h"

namespace PocketCube {

// One puzzle owned by one consumer (renderer, scrambler, test harness).
// Moves go through the executor and land in the store as a single swap.
class CubeSession {
public:
    CubeSession();
    explicit CubeSession(const CubeState& initial);

    CubeSession(const CubeSession&) = delete;
    CubeSession& operator=(const CubeSession&) = delete;

    CubeState apply(const Move& move);
    CubeState apply(Face face, Direction direction);
    CubeState applySequence(const std::vector<Move>& sequence);

    // Throws UnknownMoveToken before touching the state if any token is bad
    CubeState applyNotation(const std::string& text);

    // Applies `length` random quarter turns and returns them
    std::vector<Move> scramble(std::mt19937& rng, int length = Config::DEFAULT_SCRAMBLE_LENGTH);
    void reset();

    CubeState snapshot() const { return store.snapshot(); }
    Color faceletColor(Face face, int row, int col) const;
    bool isSolved() const { return store.isSolved(); }
    std::size_t moveCount() const { return moves.load(); }

    void setDebugLogging(bool enabled) { debugLogging = enabled; }
    bool isDebugLogging() const { return debugLogging; }
    void printState() const;

private:
    void logMoves(const std::vector<Move>& applied, std::size_t total, const CubeState& after) const;

    FaceletStore store;
    std::atomic<std::size_t> moves{0};
    std::atomic<bool> debugLogging{false};
};

} // namespace PocketCube
