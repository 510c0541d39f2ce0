#pragma once

#include <glm/glm.hpp>

namespace diorama {

/// Perspective camera looking at a target point
class Camera3D {
public:
    Camera3D() = default;

    // -------------------------------------------------------------------------
    /// @name Position and Orientation
    /// @{

    void position(glm::vec3 pos) { m_position = pos; }
    void target(glm::vec3 t) { m_target = t; }
    void up(glm::vec3 u) { m_up = u; }

    /// Set position, target, and up in one call
    void lookAt(glm::vec3 pos, glm::vec3 target, glm::vec3 up = glm::vec3(0, 1, 0));

    /// @}
    // -------------------------------------------------------------------------
    /// @name Projection
    /// @{

    /// Set vertical field of view in degrees
    void fov(float degrees) { m_fov = degrees; }
    void nearPlane(float n) { m_near = n; }
    void farPlane(float f) { m_far = f; }

    /// Set aspect ratio (width / height)
    void aspect(float a) { m_aspect = a; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Computed Matrices
    /// @{

    glm::mat4 viewMatrix() const;
    glm::mat4 projectionMatrix() const;
    glm::mat4 viewProjectionMatrix() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Accessors
    /// @{

    glm::vec3 getPosition() const { return m_position; }
    glm::vec3 getTarget() const { return m_target; }
    glm::vec3 getUp() const { return m_up; }
    float getFov() const { return m_fov; }
    float getNear() const { return m_near; }
    float getFar() const { return m_far; }
    float getAspect() const { return m_aspect; }

    /// @}

private:
    glm::vec3 m_position = glm::vec3(0, 5, 10);
    glm::vec3 m_target = glm::vec3(0, 1, 0);
    glm::vec3 m_up = glm::vec3(0, 1, 0);
    float m_fov = 45.0f;
    float m_near = 0.1f;
    float m_far = 100.0f;
    float m_aspect = 16.0f / 9.0f;
};

/// Per-frame camera driver
class CameraController {
public:
    virtual ~CameraController() = default;

    /// Advance the camera by dt seconds
    virtual void update(Camera3D& camera, float dt) = 0;
};

/**
 * @brief Auto-rotating orbit around a target point
 *
 * The non-interactive half of orbit controls: the camera circles the target
 * at a fixed rate, with damped motion and clamped distance. Pointer input is
 * left to the host.
 *
 * Speed 1.0 is one full revolution per minute.
 */
class OrbitCameraController : public CameraController {
public:
    OrbitCameraController() = default;

    void update(Camera3D& camera, float dt) override;

    OrbitCameraController& autoRotate(bool enabled) { m_autoRotate = enabled; return *this; }
    OrbitCameraController& autoRotateSpeed(float speed) { m_autoRotateSpeed = speed; return *this; }
    OrbitCameraController& dampingFactor(float f) { m_damping = f; return *this; }
    OrbitCameraController& distanceLimits(float minDist, float maxDist);
    OrbitCameraController& maxPolarAngle(float radians) { m_maxPolar = radians; return *this; }

    /// Queue an extra rotation (radians), applied through damping
    void rotateLeft(float angle) { m_azimuthDelta += angle; }

    bool getAutoRotate() const { return m_autoRotate; }
    float getAutoRotateSpeed() const { return m_autoRotateSpeed; }
    float getDampingFactor() const { return m_damping; }
    float getMinDistance() const { return m_minDistance; }
    float getMaxDistance() const { return m_maxDistance; }

private:
    bool m_autoRotate = true;
    float m_autoRotateSpeed = 1.0f;
    float m_damping = 0.05f;
    float m_minDistance = 3.0f;
    float m_maxDistance = 20.0f;
    float m_maxPolar = 3.14159265f;

    float m_azimuthDelta = 0.0f;  ///< Pending rotation, decays with damping
};

} // namespace diorama
