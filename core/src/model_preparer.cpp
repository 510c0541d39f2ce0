#include <diorama/model_preparer.h>

namespace diorama {

SceneNode& ModelPreparer::prepare(SceneNode& node, bool isPrimary) {
    m_stats = PrepareStats{};

    // Scale first so the centering offset is measured in final units
    node.scale = glm::vec3(scaleFor(isPrimary));
    center(node);
    applyShading(node);

    return node;
}

void ModelPreparer::center(SceneNode& node) {
    Bounds3D bounds = node.computeWorldBounds();
    if (!bounds.valid()) return;  // No geometry, nothing to center

    node.position -= bounds.center();
    node.updateWorldMatrix();
}

void ModelPreparer::applyShading(SceneNode& node) {
    node.traverse([this](SceneNode& child) {
        if (!child.isMesh()) return;

        m_stats.meshCount++;
        child.castShadow = true;
        child.receiveShadow = true;

        if (!child.material) return;

        Material& material = *child.material;
        markNeedsUpdate(material);

        if (auto* pbr = std::get_if<PbrMaterial>(&material)) {
            pbr->roughness = PrepareSettings::kRoughness;
            pbr->metalness = PrepareSettings::kMetalness;
            m_stats.pbrMaterials++;
        } else {
            m_stats.skippedMaterials++;
        }
    });
}

} // namespace diorama
