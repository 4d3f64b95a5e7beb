#pragma once

#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "CubeTypes.h"

namespace PocketCube {
namespace Config {

// Random quarter turns applied by a scramble when no length is given
constexpr int DEFAULT_SCRAMBLE_LENGTH = 10;

// Seed for reproducible scrambles (tests, replays)
constexpr std::uint32_t DEFAULT_SCRAMBLE_SEED = 24680;

// Solved color of each face, indexed by Face
constexpr std::array<Color, kFaceCount> SOLVED_FACE_COLORS = {
    Color::White,   // Up
    Color::Yellow,  // Down
    Color::Red,     // Front
    Color::Orange,  // Back
    Color::Green,   // Left
    Color::Blue,    // Right
};

// Sticker colors in RGB (0-1), indexed by Color
const std::array<glm::vec3, kFaceCount> COLOR_RGB = {
    glm::vec3(1.0f, 1.0f, 1.0f),   // White
    glm::vec3(1.0f, 1.0f, 0.0f),   // Yellow
    glm::vec3(1.0f, 0.0f, 0.0f),   // Red
    glm::vec3(1.0f, 0.5f, 0.0f),   // Orange
    glm::vec3(0.0f, 0.8f, 0.0f),   // Green
    glm::vec3(0.0f, 0.0f, 1.0f),   // Blue
};

// Color of the cubie body between stickers
const glm::vec3 INSIDE_RGB = glm::vec3(0.1f, 0.1f, 0.1f);

inline Color solvedColor(Face face) { return SOLVED_FACE_COLORS[static_cast<int>(face)]; }
inline const glm::vec3& colorToRgb(Color color) { return COLOR_RGB[static_cast<int>(color)]; }

} // namespace Config
} // namespace PocketCube
