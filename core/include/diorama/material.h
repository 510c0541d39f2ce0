#pragma once

/**
 * @file material.h
 * @brief Tagged material variant for loaded models
 *
 * glTF materials come in three shading models. Only the metallic-roughness
 * model exposes roughness and metalness channels, so the capability is part
 * of the type rather than something probed at runtime.
 */

#include <glm/glm.hpp>
#include <string>
#include <variant>

namespace diorama {

/// Metallic-roughness PBR material (glTF core)
struct PbrMaterial {
    std::string name;
    glm::vec4 baseColor = glm::vec4(1.0f);
    float roughness = 1.0f;   ///< 0 = mirror, 1 = fully diffuse
    float metalness = 1.0f;   ///< 0 = dielectric, 1 = metal
    bool needsUpdate = false; ///< Renderer must re-upload uniforms
};

/// Specular-glossiness material (KHR_materials_pbrSpecularGlossiness)
struct SpecularGlossinessMaterial {
    std::string name;
    glm::vec4 diffuseColor = glm::vec4(1.0f);
    glm::vec3 specularColor = glm::vec3(1.0f);
    float glossiness = 1.0f;
    bool needsUpdate = false;
};

/// Unlit material (KHR_materials_unlit)
struct UnlitMaterial {
    std::string name;
    glm::vec4 color = glm::vec4(1.0f);
    bool needsUpdate = false;
};

using Material = std::variant<PbrMaterial, SpecularGlossinessMaterial, UnlitMaterial>;

/// True if the material has roughness/metalness channels
inline bool supportsPbrParameters(const Material& material) {
    return std::holds_alternative<PbrMaterial>(material);
}

/// Flag any material kind for re-upload
inline void markNeedsUpdate(Material& material) {
    std::visit([](auto& m) { m.needsUpdate = true; }, material);
}

/// Material display name
inline const std::string& materialName(const Material& material) {
    return std::visit([](const auto& m) -> const std::string& { return m.name; }, material);
}

} // namespace diorama
