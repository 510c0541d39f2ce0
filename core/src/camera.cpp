#include <diorama/camera.h>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace diorama {

// ============================================================================
// Camera3D Implementation
// ============================================================================

void Camera3D::lookAt(glm::vec3 pos, glm::vec3 target, glm::vec3 up) {
    m_position = pos;
    m_target = target;
    m_up = up;
}

glm::mat4 Camera3D::viewMatrix() const {
    return glm::lookAt(m_position, m_target, m_up);
}

glm::mat4 Camera3D::projectionMatrix() const {
    return glm::perspective(glm::radians(m_fov), m_aspect, m_near, m_far);
}

glm::mat4 Camera3D::viewProjectionMatrix() const {
    return projectionMatrix() * viewMatrix();
}

// ============================================================================
// OrbitCameraController Implementation
// ============================================================================

OrbitCameraController& OrbitCameraController::distanceLimits(float minDist, float maxDist) {
    m_minDistance = std::min(minDist, maxDist);
    m_maxDistance = std::max(minDist, maxDist);
    return *this;
}

void OrbitCameraController::update(Camera3D& camera, float dt) {
    glm::vec3 target = camera.getTarget();
    glm::vec3 offset = camera.getPosition() - target;

    float radius = glm::length(offset);
    if (radius < 1e-6f) {
        offset = glm::vec3(0, 0, m_minDistance);
        radius = m_minDistance;
    }

    // Spherical coordinates around +Y
    float theta = std::atan2(offset.x, offset.z);
    float phi = std::acos(std::clamp(offset.y / radius, -1.0f, 1.0f));

    if (m_autoRotate) {
        m_azimuthDelta += glm::two_pi<float>() / 60.0f * m_autoRotateSpeed * dt;
    }

    if (m_damping > 0.0f) {
        theta += m_azimuthDelta * m_damping;
        m_azimuthDelta *= (1.0f - m_damping);
    } else {
        theta += m_azimuthDelta;
        m_azimuthDelta = 0.0f;
    }

    const float eps = 1e-6f;
    phi = std::clamp(phi, eps, std::max(eps, m_maxPolar - eps));
    radius = std::clamp(radius, m_minDistance, m_maxDistance);

    float sinPhi = std::sin(phi);
    offset = radius * glm::vec3(sinPhi * std::sin(theta), std::cos(phi), sinPhi * std::cos(theta));
    camera.position(target + offset);
}

} // namespace diorama
