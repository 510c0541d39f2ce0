#pragma once

/**
 * @file model_preparer.h
 * @brief Normalizes freshly loaded models before they join the scene
 *
 * Models arrive in whatever units and placement the artist exported. The
 * preparer gives every model the same footprint: uniform scale by role,
 * bounding box centered on the origin, shadows on, and a common surface
 * finish for materials that support roughness/metalness.
 */

#include <diorama/scene_node.h>
#include <cstddef>

namespace diorama {

/// Fixed normalization constants
struct PrepareSettings {
    static constexpr float kPrimaryScale = 1.2f;
    static constexpr float kSecondaryScale = 0.8f;
    static constexpr float kRoughness = 0.6f;
    static constexpr float kMetalness = 0.1f;
};

/// What the last prepare() touched
struct PrepareStats {
    size_t meshCount = 0;
    size_t pbrMaterials = 0;      ///< Roughness/metalness overridden
    size_t skippedMaterials = 0;  ///< No PBR channels, left as-is
};

class ModelPreparer {
public:
    /**
     * @brief Normalize a model root in place
     * @param node Root of the loaded model (no parent)
     * @param isPrimary Primary models get the larger scale
     * @return The same node
     */
    SceneNode& prepare(SceneNode& node, bool isPrimary);

    /// Uniform scale applied for a role
    static float scaleFor(bool isPrimary) {
        return isPrimary ? PrepareSettings::kPrimaryScale : PrepareSettings::kSecondaryScale;
    }

    const PrepareStats& lastStats() const { return m_stats; }

private:
    void center(SceneNode& node);
    void applyShading(SceneNode& node);

    PrepareStats m_stats;
};

} // namespace diorama
