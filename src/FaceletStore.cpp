#include "FaceletStore.h"

namespace PocketCube {

FaceletStore::FaceletStore() : state(std::make_shared<CubeState>()) {}

FaceletStore::FaceletStore(const CubeState& initial) : state(std::make_shared<CubeState>(initial)) {}

std::shared_ptr<const CubeState> FaceletStore::current() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return state;
}

Color FaceletStore::get(const FaceletAddress& address) const {
    return current()->get(address);
}

CubeState FaceletStore::snapshot() const {
    return *current();
}

bool FaceletStore::isSolved() const {
    return current()->isSolved();
}

void FaceletStore::install(const CubeState& next) {
    auto replacement = std::make_shared<CubeState>(next);
    std::lock_guard<std::mutex> lock(stateMutex);
    state = std::move(replacement);
}

void FaceletStore::setAll(const CubeState& next) {
    std::lock_guard<std::mutex> writer(writerMutex);
    install(next);
}

void FaceletStore::setAll(const FaceletColors& colors) {
    setAll(CubeState(colors));
}

CubeState FaceletStore::update(const std::function<CubeState(const CubeState&)>& transition) {
    std::lock_guard<std::mutex> writer(writerMutex);
    std::shared_ptr<const CubeState> before = current();
    CubeState after = transition(*before);
    install(after);
    return after;
}

} // namespace PocketCube
