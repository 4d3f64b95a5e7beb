#include "Scrambler.h"

namespace PocketCube {

std::vector<Move> generateScramble(std::mt19937& rng, int length) {
    if (length < 0) {
        throw std::invalid_argument("Scramble length must be non-negative, got " + std::to_string(length));
    }
    std::uniform_int_distribution<int> pick(0, kMoveCount - 1);
    std::vector<Move> moves;
    moves.reserve(static_cast<std::size_t>(length));
    for (int i = 0; i < length; ++i) {
        moves.push_back(Move::fromIndex(pick(rng)));
    }
    return moves;
}

} // namespace PocketCube
