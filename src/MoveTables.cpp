#include "MoveTables.h"
#include "CubeGeometry.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace PocketCube {

// Neighbour strips in clockwise order around each face (viewed from outside).
// Up:    F[0,0 0,1]  L[0,0 0,1]  B[0,0 0,1]  R[0,0 0,1]
// Down:  F[1,0 1,1]  R[1,0 1,1]  B[1,0 1,1]  L[1,0 1,1]
// Front: U[1,0 1,1]  R[0,0 1,0]  D[0,0 1,0]  L[1,1 0,1]
// Back:  U[0,0 0,1]  L[1,0 0,0]  D[0,1 1,1]  R[0,1 1,1]
// Left:  U[0,0 1,0]  F[0,0 1,0]  D[1,0 1,1]  B[1,1 0,1]
// Right: U[0,1 1,1]  B[1,0 0,0]  D[0,0 0,1]  F[0,1 1,1]
const std::array<FaceAdjacency, kFaceCount> kFaceAdjacency = {{
    // Up
    FaceAdjacency{{
        NeighbourStrip{Face::Front, {{{0, 0}, {0, 1}}}},
        NeighbourStrip{Face::Left,  {{{0, 0}, {0, 1}}}},
        NeighbourStrip{Face::Back,  {{{0, 0}, {0, 1}}}},
        NeighbourStrip{Face::Right, {{{0, 0}, {0, 1}}}},
    }},
    // Down
    FaceAdjacency{{
        NeighbourStrip{Face::Front, {{{1, 0}, {1, 1}}}},
        NeighbourStrip{Face::Right, {{{1, 0}, {1, 1}}}},
        NeighbourStrip{Face::Back,  {{{1, 0}, {1, 1}}}},
        NeighbourStrip{Face::Left,  {{{1, 0}, {1, 1}}}},
    }},
    // Front
    FaceAdjacency{{
        NeighbourStrip{Face::Up,    {{{1, 0}, {1, 1}}}},
        NeighbourStrip{Face::Right, {{{0, 0}, {1, 0}}}},
        NeighbourStrip{Face::Down,  {{{0, 0}, {1, 0}}}},
        NeighbourStrip{Face::Left,  {{{1, 1}, {0, 1}}}},
    }},
    // Back
    FaceAdjacency{{
        NeighbourStrip{Face::Up,    {{{0, 0}, {0, 1}}}},
        NeighbourStrip{Face::Left,  {{{1, 0}, {0, 0}}}},
        NeighbourStrip{Face::Down,  {{{0, 1}, {1, 1}}}},
        NeighbourStrip{Face::Right, {{{0, 1}, {1, 1}}}},
    }},
    // Left
    FaceAdjacency{{
        NeighbourStrip{Face::Up,    {{{0, 0}, {1, 0}}}},
        NeighbourStrip{Face::Front, {{{0, 0}, {1, 0}}}},
        NeighbourStrip{Face::Down,  {{{1, 0}, {1, 1}}}},
        NeighbourStrip{Face::Back,  {{{1, 1}, {0, 1}}}},
    }},
    // Right
    FaceAdjacency{{
        NeighbourStrip{Face::Up,    {{{0, 1}, {1, 1}}}},
        NeighbourStrip{Face::Back,  {{{1, 0}, {0, 0}}}},
        NeighbourStrip{Face::Down,  {{{0, 0}, {0, 1}}}},
        NeighbourStrip{Face::Front, {{{0, 1}, {1, 1}}}},
    }},
}};

namespace {
// Clockwise order of a face's own corners when viewed from outside
constexpr std::array<std::array<int, 2>, kCycleLength> kSelfCycle = {{
    {0, 0}, {0, 1}, {1, 1}, {1, 0}
}};

using Permutation = std::array<int, kFaceletCount>;  // slot -> destination slot

Permutation identityPermutation() {
    Permutation p{};
    for (int i = 0; i < kFaceletCount; ++i) p[i] = i;
    return p;
}

Permutation toPermutation(const MoveTable& table) {
    Permutation p = identityPermutation();
    for (const auto& cycle : table.cycles) {
        for (int i = 0; i < kCycleLength; ++i) {
            p[cycle.addresses[i].index()] = cycle.addresses[(i + 1) % kCycleLength].index();
        }
    }
    return p;
}

// first, then second
Permutation compose(const Permutation& first, const Permutation& second) {
    Permutation p{};
    for (int i = 0; i < kFaceletCount; ++i) p[i] = second[first[i]];
    return p;
}

std::string describe(const FaceletAddress& a) {
    std::ostringstream out;
    out << faceName(a.face) << "(" << a.row << "," << a.col << ")";
    return out.str();
}

std::string describe(const Move& m) {
    return std::string(faceName(m.face)) +
           (m.direction == Direction::Clockwise ? " clockwise" : " counterclockwise");
}

PermutationCycle reversed(const PermutationCycle& cycle) {
    PermutationCycle out = cycle;
    std::reverse(out.addresses.begin(), out.addresses.end());
    return out;
}

void fail(const Move& move, const std::string& reason) {
    throw std::runtime_error("Move table for " + describe(move) + " is invalid: " + reason);
}
} // namespace

std::vector<FaceletAddress> MoveTable::workingSet() const {
    std::vector<FaceletAddress> out;
    out.reserve(kWorkingSetSize);
    for (const auto& cycle : cycles) {
        out.insert(out.end(), cycle.addresses.begin(), cycle.addresses.end());
    }
    return out;
}

bool MoveTable::touches(const FaceletAddress& address) const {
    for (const auto& cycle : cycles) {
        for (const auto& a : cycle.addresses) {
            if (a == address) return true;
        }
    }
    return false;
}

MoveTableSet buildMoveTables() {
    MoveTableSet tables{};
    for (Face face : kAllFaces) {
        const FaceAdjacency& strips = kFaceAdjacency[static_cast<int>(face)];

        MoveTable cw;
        cw.move = Move{face, Direction::Clockwise};
        for (int i = 0; i < kCycleLength; ++i) {
            cw.cycles[0].addresses[i] = FaceletAddress{face, kSelfCycle[i][0], kSelfCycle[i][1]};
        }
        for (int k = 0; k < 2; ++k) {
            for (int i = 0; i < kCycleLength; ++i) {
                const NeighbourStrip& strip = strips[i];
                cw.cycles[1 + k].addresses[i] =
                    FaceletAddress{strip.face, strip.facelets[k][0], strip.facelets[k][1]};
            }
        }

        MoveTable ccw;
        ccw.move = Move{face, Direction::CounterClockwise};
        for (int c = 0; c < kCyclesPerMove; ++c) {
            ccw.cycles[c] = reversed(cw.cycles[c]);
        }

        tables[cw.move.index()] = cw;
        tables[ccw.move.index()] = ccw;
    }
    return tables;
}

void validateMoveTables(const MoveTableSet& tables) {
    std::array<bool, kFaceletCount> referenced{};
    const Permutation identity = identityPermutation();

    for (int m = 0; m < kMoveCount; ++m) {
        const MoveTable& table = tables[m];
        const Move move = table.move;
        if (move.index() != m) {
            fail(Move::fromIndex(m), "stored under the slot of " + describe(move));
        }

        // Working set: 12 distinct in-range addresses, 4 on the turned face
        std::array<bool, kFaceletCount> inSet{};
        int selfCount = 0;
        std::array<int, kFaceCount> perFace{};
        for (const auto& a : table.workingSet()) {
            if (a.row < 0 || a.row >= kFaceSize || a.col < 0 || a.col >= kFaceSize) {
                fail(move, "address out of range on " + std::string(faceName(a.face)));
            }
            if (inSet[a.index()]) {
                fail(move, describe(a) + " appears more than once");
            }
            inSet[a.index()] = true;
            referenced[a.index()] = true;
            perFace[static_cast<int>(a.face)]++;
            if (a.face == move.face) selfCount++;
        }
        if (selfCount != kFaceletsPerFace) {
            fail(move, "turned face contributes " + std::to_string(selfCount) + " facelets");
        }
        int neighbourFaces = 0;
        for (Face face : kAllFaces) {
            int count = perFace[static_cast<int>(face)];
            if (face == move.face || count == 0) continue;
            if (count != 2) {
                fail(move, std::string(faceName(face)) + " contributes " + std::to_string(count) +
                           " side facelets instead of 2");
            }
            neighbourFaces++;
        }
        if (neighbourFaces != 4) {
            fail(move, "touches " + std::to_string(neighbourFaces) + " neighbouring faces");
        }

        // Order 4
        const Permutation p = toPermutation(table);
        Permutation power = identity;
        for (int i = 0; i < 4; ++i) {
            power = compose(power, p);
            if (i < 3 && power == identity) {
                fail(move, "has order " + std::to_string(i + 1) + " instead of 4");
            }
        }
        if (power != identity) {
            fail(move, "four applications do not restore the cube");
        }

        // Opposite direction is the exact inverse
        Move opposite{move.face, move.direction == Direction::Clockwise ? Direction::CounterClockwise
                                                                        : Direction::Clockwise};
        if (compose(p, toPermutation(tables[opposite.index()])) != identity) {
            fail(move, "is not undone by " + describe(opposite));
        }

        // Agrees with the physical quarter turn
        for (int i = 0; i < kFaceletCount; ++i) {
            FaceletAddress from = FaceletAddress::fromIndex(i);
            FaceletAddress expected = rotateFacelet(from, move);
            if (expected.index() != p[i]) {
                fail(move, describe(from) + " goes to " + describe(FaceletAddress::fromIndex(p[i])) +
                           " but the turn carries it to " + describe(expected));
            }
        }
    }

    for (int i = 0; i < kFaceletCount; ++i) {
        if (!referenced[i]) {
            throw std::runtime_error("No move table references " + describe(FaceletAddress::fromIndex(i)));
        }
    }
}

MoveTableRegistry::MoveTableRegistry() : tables(buildMoveTables()) {
    try {
        validateMoveTables(tables);
    } catch (const std::runtime_error& e) {
        std::cerr << "[MoveTableRegistry] Refusing to start: " << e.what() << std::endl;
        throw;
    }
}

const MoveTableRegistry& MoveTableRegistry::instance() {
    static const MoveTableRegistry registry;
    return registry;
}

} // namespace PocketCube
