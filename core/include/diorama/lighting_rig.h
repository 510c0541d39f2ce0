#pragma once

/**
 * @file lighting_rig.h
 * @brief Scene lighting with a key light that follows the current model
 *
 * The rig is a fixed three-light setup:
 * - Ambient fill
 * - Key directional light from above, casting shadows, aimed at the
 *   current model
 * - Back light from behind the camera side, no shadows, aimed at the origin
 *
 * The key light's shadow camera is an orthographic frustum looking from the
 * light position at its target. retarget() recomputes it immediately so the
 * shadow map drawn on the next frame already matches the new model.
 */

#include <diorama/scene_node.h>
#include <glm/glm.hpp>
#include <cstdint>

namespace diorama {

struct AmbientLight {
    glm::vec3 color = glm::vec3(0x40 / 255.0f);  ///< 0x404040
    float intensity = 0.5f;
};

struct DirectionalLightData {
    glm::vec3 position = glm::vec3(0, 10, 0);
    glm::vec3 color = glm::vec3(1, 1, 1);
    float intensity = 1.0f;

    // Shadow parameters
    bool castShadow = false;
    int shadowMapSize = 512;
    float shadowNear = 0.5f;
    float shadowFar = 500.0f;
    float shadowFrustumSize = 5.0f;  ///< Half extent of the orthographic shadow camera
};

class LightingRig {
public:
    LightingRig();

    /**
     * @brief Aim the key light at a node
     * @param node Node to follow, or nullptr to aim at the origin
     *
     * The rig does not own the node. Registered models live for the whole
     * session, so the pointer stays valid.
     */
    void retarget(SceneNode* node);

    /// Node the key light is aimed at (nullptr = origin)
    SceneNode* target() const { return m_target; }

    /// World-space aim point as of the last retarget()
    const glm::vec3& targetPosition() const { return m_targetPosition; }

    /// Normalized direction the key light travels
    glm::vec3 keyLightDirection() const;

    const AmbientLight& ambient() const { return m_ambient; }
    const DirectionalLightData& keyLight() const { return m_keyLight; }
    const DirectionalLightData& backLight() const { return m_backLight; }

    const glm::mat4& shadowView() const { return m_shadowView; }
    const glm::mat4& shadowProjection() const { return m_shadowProjection; }
    glm::mat4 shadowViewProjection() const { return m_shadowProjection * m_shadowView; }

    /// Incremented on every retarget(), lets renderers detect changes
    uint64_t revision() const { return m_revision; }

private:
    void updateShadowCamera();

    AmbientLight m_ambient;
    DirectionalLightData m_keyLight;
    DirectionalLightData m_backLight;

    SceneNode* m_target = nullptr;
    glm::vec3 m_targetPosition = glm::vec3(0.0f);

    glm::mat4 m_shadowView = glm::mat4(1.0f);
    glm::mat4 m_shadowProjection = glm::mat4(1.0f);
    uint64_t m_revision = 0;
};

} // namespace diorama
