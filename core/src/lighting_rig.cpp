#include <diorama/lighting_rig.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace diorama {

LightingRig::LightingRig() {
    m_keyLight.position = glm::vec3(0, 10, 0);
    m_keyLight.intensity = 1.2f;
    m_keyLight.castShadow = true;
    m_keyLight.shadowMapSize = 2048;
    m_keyLight.shadowNear = 0.5f;
    m_keyLight.shadowFar = 20.0f;

    m_backLight.position = glm::vec3(0, 5, 5);
    m_backLight.intensity = 0.6f;
    m_backLight.castShadow = false;

    updateShadowCamera();
}

void LightingRig::retarget(SceneNode* node) {
    m_target = node;

    if (m_target) {
        // Synchronous: the shadow pass of the very next frame uses this
        m_target->updateWorldMatrix();
        m_targetPosition = m_target->worldPosition();
    } else {
        m_targetPosition = glm::vec3(0.0f);
    }

    updateShadowCamera();
    m_revision++;
}

glm::vec3 LightingRig::keyLightDirection() const {
    glm::vec3 dir = m_targetPosition - m_keyLight.position;
    float len = glm::length(dir);
    return len > 0.0f ? dir / len : glm::vec3(0, -1, 0);
}

void LightingRig::updateShadowCamera() {
    glm::vec3 lightDir = keyLightDirection();

    // Find a suitable up vector
    glm::vec3 up = glm::vec3(0, 1, 0);
    if (std::abs(glm::dot(lightDir, up)) > 0.99f) {
        up = glm::vec3(0, 0, 1);
    }

    m_shadowView = glm::lookAt(m_keyLight.position, m_targetPosition, up);

    float s = m_keyLight.shadowFrustumSize;
    m_shadowProjection = glm::orthoRH_ZO(-s, s, -s, s, m_keyLight.shadowNear, m_keyLight.shadowFar);
}

} // namespace diorama
