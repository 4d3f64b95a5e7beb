#include "CubeTypes.h"

namespace PocketCube {

void checkAddress(const FaceletAddress& address) {
    int face = static_cast<int>(address.face);
    if (face < 0 || face >= kFaceCount) {
        throw InvalidFaceletQuery("Face index " + std::to_string(face) + " is not a cube face");
    }
    if (address.row < 0 || address.row >= kFaceSize || address.col < 0 || address.col >= kFaceSize) {
        throw InvalidFaceletQuery("Facelet (" + std::to_string(address.row) + ", " +
                                  std::to_string(address.col) + ") is outside the " +
                                  faceName(address.face) + " face");
    }
}

FaceletAddress makeAddress(Face face, int row, int col) {
    FaceletAddress address{face, row, col};
    checkAddress(address);
    return address;
}

const char* faceName(Face face) {
    switch (face) {
        case Face::Up:    return "Up";
        case Face::Down:  return "Down";
        case Face::Front: return "Front";
        case Face::Back:  return "Back";
        case Face::Left:  return "Left";
        case Face::Right: return "Right";
    }
    return "?";
}

char faceLetter(Face face) {
    switch (face) {
        case Face::Up:    return 'U';
        case Face::Down:  return 'D';
        case Face::Front: return 'F';
        case Face::Back:  return 'B';
        case Face::Left:  return 'L';
        case Face::Right: return 'R';
    }
    return '?';
}

const char* colorName(Color color) {
    switch (color) {
        case Color::White:  return "White";
        case Color::Yellow: return "Yellow";
        case Color::Red:    return "Red";
        case Color::Orange: return "Orange";
        case Color::Green:  return "Green";
        case Color::Blue:   return "Blue";
    }
    return "?";
}

char colorLetter(Color color) {
    switch (color) {
        case Color::White:  return 'W';
        case Color::Yellow: return 'Y';
        case Color::Red:    return 'R';
        case Color::Orange: return 'O';
        case Color::Green:  return 'G';
        case Color::Blue:   return 'B';
    }
    return '?';
}

} // namespace PocketCube
