// Move notation: decoding, rejection of unknown tokens, and printing.

#include <iostream>
#include <string>
#include <vector>

#include "MoveNotation.h"

using namespace PocketCube;
using std::cout;

static int passed = 0;
static int failed = 0;

static void expect(bool condition, const std::string& label) {
    if (condition) {
        ++passed;
    } else {
        ++failed;
        cout << "  FAIL: " << label << "\n";
    }
}

static bool rejects(const std::string& text, std::string* badToken = nullptr) {
    try {
        MoveNotation::parseMoveSequence(text);
    } catch (const UnknownMoveToken& e) {
        if (badToken) *badToken = e.getToken();
        return true;
    }
    return false;
}

static void testSingleTokens() {
    cout << "\n=== Test: Single Tokens ===\n";
    const char letters[6] = {'U', 'D', 'F', 'B', 'L', 'R'};
    for (int i = 0; i < 6; ++i) {
        Face face = kAllFaces[i];
        std::string cw(1, letters[i]);
        expect(MoveNotation::parseMove(cw) == (Move{face, Direction::Clockwise}), cw + " is clockwise");
        expect(MoveNotation::parseMove(cw + "'") == (Move{face, Direction::CounterClockwise}), cw + "' is counterclockwise");
        expect(MoveNotation::parseMove(cw + "p") == (Move{face, Direction::CounterClockwise}), cw + "p is counterclockwise");
        expect(MoveNotation::parseMove(cw + "P") == (Move{face, Direction::CounterClockwise}), cw + "P is counterclockwise");
        std::string lower(1, static_cast<char>(letters[i] - 'A' + 'a'));
        expect(MoveNotation::parseMove(lower) == (Move{face, Direction::CounterClockwise}), lower + " is counterclockwise");
    }

    bool halfRejected = false;
    try {
        MoveNotation::parseMove("F2");
    } catch (const UnknownMoveToken&) {
        halfRejected = true;
    }
    expect(halfRejected, "parseMove refuses a half turn");
}

static void testSequences() {
    cout << "\n=== Test: Sequences ===\n";
    std::vector<Move> ok = MoveNotation::parseMoveSequence(" R  U2\tf\nB' ");
    std::vector<Move> expected = {
        {Face::Right, Direction::Clockwise},
        {Face::Up, Direction::Clockwise},
        {Face::Up, Direction::Clockwise},
        {Face::Front, Direction::CounterClockwise},
        {Face::Back, Direction::CounterClockwise},
    };
    expect(ok == expected, "whitespace, half turns and lowercase decode");
    expect(MoveNotation::parseMoveSequence("").empty(), "empty text is an empty sequence");
    expect(MoveNotation::parseMoveSequence("   \t ").empty(), "blank text is an empty sequence");
}

static void testRejections() {
    cout << "\n=== Test: Unknown Tokens ===\n";
    std::string bad;
    expect(rejects("R U X", &bad) && bad == "X", "unknown face letter");
    expect(rejects("R3", &bad) && bad == "R3", "unknown suffix");
    expect(rejects("R'' U", &bad) && bad == "R''", "doubled prime");
    expect(rejects("f'", &bad) && bad == "f'", "lowercase with prime");
    expect(rejects("u2", &bad) && bad == "u2", "lowercase half turn");
    expect(rejects("M", &bad) && bad == "M", "slice moves are not part of the puzzle");
    expect(!rejects("U D F B L R"), "all six faces accepted");

    bool what = false;
    try {
        MoveNotation::parseMove("Q");
    } catch (const std::invalid_argument& e) {
        what = std::string(e.what()).find("'Q'") != std::string::npos;
    }
    expect(what, "error message names the token");
}

static void testPrinting() {
    cout << "\n=== Test: Printing ===\n";
    expect(MoveNotation::moveToString({Face::Front, Direction::Clockwise}) == "F", "F");
    expect(MoveNotation::moveToString({Face::Front, Direction::CounterClockwise}) == "F'", "F'");
    expect(MoveNotation::sequenceToString({}) == "", "empty sequence prints empty");

    const std::string text = "U D' F B' L R'";
    expect(MoveNotation::sequenceToString(MoveNotation::parseMoveSequence(text)) == text, "print what was parsed");
    expect(MoveNotation::sequenceToString(MoveNotation::parseMoveSequence("l Bp")) == "L' B'", "normalized spelling");
}

int main() {
    cout << "Move notation tests\n";
    testSingleTokens();
    testSequences();
    testRejections();
    testPrinting();

    cout << "\nSummary: " << passed << " passed, " << failed << " failed\n";
    return failed == 0 ? 0 : 1;
}
