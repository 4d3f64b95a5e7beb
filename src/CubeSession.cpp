#include "CubeSession.h"
#include "MoveExecutor.h"
#include "MoveNotation.h"
#include "Scrambler.h"

#include <iostream>

namespace PocketCube {

CubeSession::CubeSession() : store(newSession()) {}

CubeSession::CubeSession(const CubeState& initial) : store(initial) {}

CubeState CubeSession::apply(const Move& move) {
    return applySequence({move});
}

CubeState CubeSession::apply(Face face, Direction direction) {
    return apply(Move{face, direction});
}

CubeState CubeSession::applySequence(const std::vector<Move>& sequence) {
    // Count under the writer lock so the counter always matches the installed state
    std::size_t total = 0;
    CubeState after = store.update([this, &sequence, &total](const CubeState& before) {
        CubeState next = PocketCube::applySequence(before, sequence);
        total = moves += sequence.size();
        return next;
    });
    logMoves(sequence, total, after);
    return after;
}

CubeState CubeSession::applyNotation(const std::string& text) {
    std::vector<Move> sequence;
    try {
        sequence = MoveNotation::parseMoveSequence(text);
    } catch (const UnknownMoveToken& e) {
        std::cerr << "[CubeSession] Rejected \"" << text << "\": " << e.what() << std::endl;
        throw;
    }
    return applySequence(sequence);
}

std::vector<Move> CubeSession::scramble(std::mt19937& rng, int length) {
    std::vector<Move> sequence = generateScramble(rng, length);
    if (debugLogging) {
        std::cout << "[CubeSession] Scrambling with " << sequence.size() << " moves" << std::endl;
    }
    applySequence(sequence);
    return sequence;
}

void CubeSession::reset() {
    store.update([this](const CubeState&) {
        moves = 0;
        return CubeState::solved();
    });
    if (debugLogging) {
        std::cout << "[CubeSession] Cube reset to solved state" << std::endl;
    }
}

Color CubeSession::faceletColor(Face face, int row, int col) const {
    return store.get(makeAddress(face, row, col));
}

void CubeSession::printState() const {
    PocketCube::printState(std::cout, snapshot());
}

void CubeSession::logMoves(const std::vector<Move>& applied, std::size_t total,
                           const CubeState& after) const {
    if (!debugLogging || applied.empty()) {
        return;
    }
    std::cout << "[CubeSession] Applied " << MoveNotation::sequenceToString(applied)
              << " (total " << total << ", solved: " << (after.isSolved() ? "yes" : "no") << ")"
              << std::endl;
}

} // namespace PocketCube
