#pragma once

#include <vector>

#include "CubeState.h"
#include "CubeTypes.h"

namespace PocketCube {

// Pure transitions: the input state is never modified, a new value is returned.
CubeState apply(const CubeState& state, const Move& move);
CubeState apply(const CubeState& state, Face face, Direction direction);
CubeState applySequence(const CubeState& state, const std::vector<Move>& moves);

Move inverse(const Move& move);
std::vector<Move> inverseSequence(const std::vector<Move>& moves);

} // namespace PocketCube
