#include "CubeState.h"
#include "Config.h"

namespace PocketCube {

CubeState::CubeState() {
    for (int i = 0; i < kFaceletCount; ++i) {
        colors[i] = Config::solvedColor(FaceletAddress::fromIndex(i).face);
    }
}

Color CubeState::get(const FaceletAddress& address) const {
    checkAddress(address);
    return colors[address.index()];
}

bool CubeState::isSolved() const {
    std::array<bool, kFaceCount> seen{};
    for (int face = 0; face < kFaceCount; ++face) {
        Color faceColor = colors[face * kFaceletsPerFace];
        for (int i = 1; i < kFaceletsPerFace; ++i) {
            if (colors[face * kFaceletsPerFace + i] != faceColor) {
                return false;
            }
        }
        int colorIdx = static_cast<int>(faceColor);
        if (seen[colorIdx]) {
            return false;
        }
        seen[colorIdx] = true;
    }
    return true;
}

CubeState newSession() {
    return CubeState::solved();
}

bool isSolved(const CubeState& state) {
    return state.isSolved();
}

Color faceletColor(const CubeState& state, Face face, int row, int col) {
    return state.get(makeAddress(face, row, col));
}

void printState(std::ostream& out, const CubeState& state) {
    out << "\n=== Pocket Cube State ===" << std::endl;
    for (Face face : kAllFaces) {
        out << faceName(face) << ":" << std::endl;
        for (int row = 0; row < kFaceSize; ++row) {
            out << "  ";
            for (int col = 0; col < kFaceSize; ++col) {
                out << colorLetter(state.get(FaceletAddress{face, row, col})) << " ";
            }
            out << std::endl;
        }
    }
    out << "Solved: " << (state.isSolved() ? "YES" : "NO") << std::endl;
    out << "=========================\n" << std::endl;
}

} // namespace PocketCube
