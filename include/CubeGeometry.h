#pragma once

#include <array>
#include <optional>

#include <glm/glm.hpp>

#include "CubeTypes.h"

namespace PocketCube {

// Orientation of one face's facelet grid in cube space
struct FaceFrame {
    glm::vec3 normal;     // Outward, unit length
    glm::vec3 colAxis;    // Direction of increasing column
    glm::vec3 rowAxis;    // Direction of increasing row
};

// Indexed by Face. The cube spans [-1, 1]; x right, y up, z toward the viewer.
extern const std::array<FaceFrame, kFaceCount> kFaceFrames;

const glm::vec3& faceNormal(Face face);
glm::vec3 faceletCenter(const FaceletAddress& address);

// Inverse of faceletCenter/faceNormal; empty when nothing sits there
std::optional<FaceletAddress> faceletAt(const glm::vec3& center, const glm::vec3& normal);

// Rotation applied by a quarter turn: clockwise is -90 degrees about the outward normal
glm::mat3 moveRotation(const Move& move);

// Whether the facelet sits in the layer that the move turns
bool inTurnedLayer(const FaceletAddress& address, Face face);

// Where the sticker at `address` ends up after the move; unchanged outside the layer
FaceletAddress rotateFacelet(const FaceletAddress& address, const Move& move);

} // namespace PocketCube
