#include "MoveNotation.h"

#include <cctype>
#include <optional>
#include <sstream>

namespace PocketCube {
namespace MoveNotation {
namespace {
std::optional<Face> faceFromLetter(char letter) {
    switch (std::toupper(static_cast<unsigned char>(letter))) {
        case 'U': return Face::Up;
        case 'D': return Face::Down;
        case 'F': return Face::Front;
        case 'B': return Face::Back;
        case 'L': return Face::Left;
        case 'R': return Face::Right;
        default:  return std::nullopt;
    }
}

bool isPrimeSuffix(char c) {
    return c == '\'' || c == 'p' || c == 'P';
}

// Decodes one token into the quarter turns it stands for
std::vector<Move> decodeToken(const std::string& token) {
    if (token.empty() || token.size() > 2) {
        throw UnknownMoveToken(token);
    }
    std::optional<Face> face = faceFromLetter(token[0]);
    if (!face) {
        throw UnknownMoveToken(token);
    }
    bool lowercase = std::islower(static_cast<unsigned char>(token[0])) != 0;

    if (token.size() == 1) {
        return {Move{*face, lowercase ? Direction::CounterClockwise : Direction::Clockwise}};
    }

    char suffix = token[1];
    if (isPrimeSuffix(suffix) && !lowercase) {
        return {Move{*face, Direction::CounterClockwise}};
    }
    if (suffix == '2' && !lowercase) {
        return {Move{*face, Direction::Clockwise}, Move{*face, Direction::Clockwise}};
    }
    throw UnknownMoveToken(token);
}
} // namespace

Move parseMove(const std::string& token) {
    std::vector<Move> moves = decodeToken(token);
    if (moves.size() != 1) {
        throw UnknownMoveToken(token);
    }
    return moves.front();
}

std::vector<Move> parseMoveSequence(const std::string& text) {
    std::vector<Move> result;
    std::istringstream iss(text);
    std::string tok;
    while (iss >> tok) {
        std::vector<Move> decoded = decodeToken(tok);
        result.insert(result.end(), decoded.begin(), decoded.end());
    }
    return result;
}

std::string moveToString(const Move& move) {
    std::string s(1, faceLetter(move.face));
    if (move.direction == Direction::CounterClockwise) {
        s += '\'';
    }
    return s;
}

std::string sequenceToString(const std::vector<Move>& moves) {
    std::string s;
    for (const Move& m : moves) {
        if (!s.empty()) s += ' ';
        s += moveToString(m);
    }
    return s;
}

} // namespace MoveNotation
} // namespace PocketCube
