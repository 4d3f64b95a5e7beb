#include "CubeGeometry.h"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

namespace PocketCube {

const std::array<FaceFrame, kFaceCount> kFaceFrames = {
    FaceFrame{{0, 1, 0},  {1, 0, 0},  {0, 0, 1}},   // Up
    FaceFrame{{0, -1, 0}, {0, 0, -1}, {-1, 0, 0}},  // Down
    FaceFrame{{0, 0, 1},  {1, 0, 0},  {0, -1, 0}},  // Front
    FaceFrame{{0, 0, -1}, {-1, 0, 0}, {0, -1, 0}},  // Back
    FaceFrame{{-1, 0, 0}, {0, 0, 1},  {0, -1, 0}},  // Left
    FaceFrame{{1, 0, 0},  {0, 0, -1}, {0, -1, 0}},  // Right
};

namespace {
// Facelet centres sit half a cubie from the face centre
constexpr float kHalfFacelet = 0.5f;
constexpr float kEpsilon = 0.01f;

glm::vec3 snap(const glm::vec3& v) {
    return glm::vec3(std::round(v.x * 2.0f) / 2.0f,
                     std::round(v.y * 2.0f) / 2.0f,
                     std::round(v.z * 2.0f) / 2.0f);
}
} // namespace

const glm::vec3& faceNormal(Face face) {
    return kFaceFrames[static_cast<int>(face)].normal;
}

glm::vec3 faceletCenter(const FaceletAddress& address) {
    const FaceFrame& frame = kFaceFrames[static_cast<int>(address.face)];
    float colOffset = address.col == 0 ? -kHalfFacelet : kHalfFacelet;
    float rowOffset = address.row == 0 ? -kHalfFacelet : kHalfFacelet;
    return frame.normal + frame.colAxis * colOffset + frame.rowAxis * rowOffset;
}

std::optional<FaceletAddress> faceletAt(const glm::vec3& center, const glm::vec3& normal) {
    for (int i = 0; i < kFaceletCount; ++i) {
        FaceletAddress address = FaceletAddress::fromIndex(i);
        if (glm::length(faceNormal(address.face) - normal) < kEpsilon &&
            glm::length(faceletCenter(address) - center) < kEpsilon) {
            return address;
        }
    }
    return std::nullopt;
}

glm::mat3 moveRotation(const Move& move) {
    float angle = move.direction == Direction::Clockwise ? -90.0f : 90.0f;
    glm::mat4 rotation4 = glm::rotate(glm::mat4(1.0f), glm::radians(angle), faceNormal(move.face));
    return glm::mat3(rotation4);
}

bool inTurnedLayer(const FaceletAddress& address, Face face) {
    return glm::dot(faceletCenter(address), faceNormal(face)) > 0.0f;
}

FaceletAddress rotateFacelet(const FaceletAddress& address, const Move& move) {
    if (!inTurnedLayer(address, move.face)) {
        return address;
    }

    glm::mat3 rotation = moveRotation(move);
    glm::vec3 center = snap(rotation * faceletCenter(address));
    glm::vec3 normal = snap(rotation * faceNormal(address.face));

    std::optional<FaceletAddress> target = faceletAt(center, normal);
    if (!target) {
        throw std::logic_error(std::string("Rotated facelet left the cube surface on face ") +
                               faceName(address.face));
    }
    return *target;
}

} // namespace PocketCube
