#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace PocketCube {

enum class Face : int { Up = 0, Down, Front, Back, Left, Right };
enum class Direction : int { Clockwise = 0, CounterClockwise };
enum class Color : int { White = 0, Yellow, Red, Orange, Green, Blue };

constexpr int kFaceCount = 6;
constexpr int kFaceSize = 2;
constexpr int kFaceletsPerFace = kFaceSize * kFaceSize;
constexpr int kFaceletCount = kFaceCount * kFaceletsPerFace;
constexpr int kMoveCount = kFaceCount * 2;

constexpr std::array<Face, kFaceCount> kAllFaces = {
    Face::Up, Face::Down, Face::Front, Face::Back, Face::Left, Face::Right
};

struct FaceletAddress {
    Face face;
    int row;
    int col;

    // Slot in a CubeState: face-major, then row, then column.
    constexpr int index() const {
        return static_cast<int>(face) * kFaceletsPerFace + row * kFaceSize + col;
    }

    static constexpr FaceletAddress fromIndex(int index) {
        return FaceletAddress{static_cast<Face>(index / kFaceletsPerFace),
                              (index % kFaceletsPerFace) / kFaceSize,
                              index % kFaceSize};
    }

    constexpr bool operator==(const FaceletAddress& other) const {
        return face == other.face && row == other.row && col == other.col;
    }
    constexpr bool operator!=(const FaceletAddress& other) const { return !(*this == other); }
};

struct Move {
    Face face;
    Direction direction;

    constexpr int index() const {
        return static_cast<int>(face) * 2 + static_cast<int>(direction);
    }

    static constexpr Move fromIndex(int index) {
        return Move{static_cast<Face>(index / 2), static_cast<Direction>(index % 2)};
    }

    constexpr bool operator==(const Move& other) const {
        return face == other.face && direction == other.direction;
    }
    constexpr bool operator!=(const Move& other) const { return !(*this == other); }
};

// Raised by facelet queries whose row or column lies outside the 2x2 grid.
class InvalidFaceletQuery : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Raised when text does not decode to one of the 12 quarter turns.
class UnknownMoveToken : public std::invalid_argument {
public:
    UnknownMoveToken(const std::string& token)
        : std::invalid_argument("Unknown move token: '" + token + "'"), token(token) {}

    const std::string& getToken() const { return token; }

private:
    std::string token;
};

// Throws InvalidFaceletQuery unless the face is one of the six and row/col lie in the 2x2 grid.
void checkAddress(const FaceletAddress& address);

// Checked constructor for addresses that come from outside the engine.
FaceletAddress makeAddress(Face face, int row, int col);

const char* faceName(Face face);
char faceLetter(Face face);
const char* colorName(Color color);
char colorLetter(Color color);

} // namespace PocketCube
