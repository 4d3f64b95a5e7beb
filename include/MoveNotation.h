#pragma once

#include <string>
#include <vector>

#include "CubeTypes.h"

namespace PocketCube {

// Face letters U D F B L R. "F'", "Fp", "FP" and lowercase "f" are
// counterclockwise; "F2" is a half turn and expands to two clockwise moves.
namespace MoveNotation {

// A single quarter turn; half turns are rejected here
Move parseMove(const std::string& token);

// Whitespace separated tokens. Every token is decoded before anything is
// returned, so a bad token never yields a partial sequence.
std::vector<Move> parseMoveSequence(const std::string& text);

std::string moveToString(const Move& move);
std::string sequenceToString(const std::vector<Move>& moves);

} // namespace MoveNotation
} // namespace PocketCube
