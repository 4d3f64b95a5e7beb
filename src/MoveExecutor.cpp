#include "MoveExecutor.h"
#include "MoveTables.h"

namespace PocketCube {

CubeState apply(const CubeState& state, const Move& move) {
    const MoveTable& table = MoveTableRegistry::instance().table(move);

    // Every read comes from `before`; writes only touch `after`
    const FaceletColors& before = state.getColors();
    FaceletColors after = before;
    for (const auto& cycle : table.cycles) {
        for (int i = 0; i < kCycleLength; ++i) {
            const FaceletAddress& from = cycle.addresses[i];
            const FaceletAddress& to = cycle.addresses[(i + 1) % kCycleLength];
            after[to.index()] = before[from.index()];
        }
    }
    return CubeState(after);
}

CubeState apply(const CubeState& state, Face face, Direction direction) {
    return apply(state, Move{face, direction});
}

CubeState applySequence(const CubeState& state, const std::vector<Move>& moves) {
    CubeState current = state;
    for (const Move& move : moves) {
        current = apply(current, move);
    }
    return current;
}

Move inverse(const Move& move) {
    return Move{move.face, move.direction == Direction::Clockwise ? Direction::CounterClockwise
                                                                  : Direction::Clockwise};
}

std::vector<Move> inverseSequence(const std::vector<Move>& moves) {
    std::vector<Move> out;
    out.reserve(moves.size());
    for (auto it = moves.rbegin(); it != moves.rend(); ++it) {
        out.push_back(inverse(*it));
    }
    return out;
}

} // namespace PocketCube
