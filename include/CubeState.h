#pragma once

#include <array>
#include <ostream>

#include "CubeTypes.h"

namespace PocketCube {

using FaceletColors = std::array<Color, kFaceletCount>;

// Immutable value holding the color of all 24 facelets.
class CubeState {
public:
    // Solved cube: every face shows its Config::SOLVED_FACE_COLORS entry
    CubeState();
    explicit CubeState(const FaceletColors& colors) : colors(colors) {}

    static CubeState solved() { return CubeState(); }

    // Throws InvalidFaceletQuery for an address outside the cube
    Color get(const FaceletAddress& address) const;
    const FaceletColors& getColors() const { return colors; }
    constexpr static int size() { return kFaceletCount; }

    // Uniform color per face, and six distinct face colors
    bool isSolved() const;

    bool operator==(const CubeState& other) const { return colors == other.colors; }
    bool operator!=(const CubeState& other) const { return colors != other.colors; }

private:
    FaceletColors colors;
};

CubeState newSession();
bool isSolved(const CubeState& state);

// Range-checked read for renderers; throws InvalidFaceletQuery
Color faceletColor(const CubeState& state, Face face, int row, int col);

void printState(std::ostream& out, const CubeState& state);

} // namespace PocketCube
