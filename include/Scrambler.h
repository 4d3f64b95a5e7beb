#pragma once

#include <random>
#include <vector>

#include "Config.h"
#include "CubeTypes.h"

namespace PocketCube {

// Uniformly random quarter turns
std::vector<Move> generateScramble(std::mt19937& rng, int length = Config::DEFAULT_SCRAMBLE_LENGTH);

} // namespace PocketCube
