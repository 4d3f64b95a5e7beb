#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include "CubeState.h"

namespace PocketCube {

// Holds the live CubeState as an immutable value that is swapped wholesale.
// Readers copy the current pointer and never see a half-applied move;
// writers are serialized.
class FaceletStore {
public:
    FaceletStore();
    explicit FaceletStore(const CubeState& initial);

    FaceletStore(const FaceletStore&) = delete;
    FaceletStore& operator=(const FaceletStore&) = delete;

    Color get(const FaceletAddress& address) const;
    CubeState snapshot() const;
    std::shared_ptr<const CubeState> current() const;
    bool isSolved() const;

    // Replaces all 24 facelets in one swap
    void setAll(const CubeState& next);
    void setAll(const FaceletColors& colors);

    // Computes the successor from the current value and installs it,
    // holding out other writers for the duration.
    CubeState update(const std::function<CubeState(const CubeState&)>& transition);

private:
    void install(const CubeState& next);

    mutable std::mutex stateMutex;
    std::mutex writerMutex;
    std::shared_ptr<const CubeState> state;
};

} // namespace PocketCube
