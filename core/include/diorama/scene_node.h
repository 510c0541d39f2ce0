#pragma once

/**
 * @file scene_node.h
 * @brief Scene-graph node produced by mesh sources
 *
 * A loaded model is a tree of SceneNodes. Each node carries a local TRS
 * transform; mesh nodes additionally carry CPU-side geometry and a material.
 * The renderer reads the cached world matrices, so anything that moves a
 * node must call updateWorldMatrix() before the next draw.
 */

#include <diorama/material.h>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace diorama {

/// Axis-aligned bounding box
struct Bounds3D {
    glm::vec3 min{std::numeric_limits<float>::max()};
    glm::vec3 max{std::numeric_limits<float>::lowest()};

    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 size() const { return max - min; }
    float radius() const { return glm::length(size()) * 0.5f; }

    /// False until at least one point has been added
    bool valid() const { return min.x <= max.x && min.y <= max.y && min.z <= max.z; }

    void expand(const glm::vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    void expand(const Bounds3D& other) {
        if (!other.valid()) return;
        expand(other.min);
        expand(other.max);
    }

    /// Bounds of this box after transformation (all 8 corners)
    Bounds3D transformed(const glm::mat4& m) const;
};

/// CPU-side triangle geometry
struct MeshData {
    std::vector<glm::vec3> positions;
    std::vector<uint32_t> indices;
    Bounds3D localBounds;

    /// Recompute localBounds from positions
    void computeBounds();
};

class SceneNode {
public:
    explicit SceneNode(std::string name = {});
    ~SceneNode();

    SceneNode(const SceneNode&) = delete;
    SceneNode& operator=(const SceneNode&) = delete;

    // -------------------------------------------------------------------------
    /// @name Transform
    /// @{

    glm::vec3 position = glm::vec3(0.0f);
    glm::quat rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::vec3 scale = glm::vec3(1.0f);

    /// Local TRS matrix
    glm::mat4 localMatrix() const;

    /// World matrix as of the last updateWorldMatrix()
    const glm::mat4& worldMatrix() const { return m_worldMatrix; }

    /// World-space origin of this node
    glm::vec3 worldPosition() const { return glm::vec3(m_worldMatrix[3]); }

    /// Recompute world matrices for this node and its whole subtree
    void updateWorldMatrix();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Mesh and Shading
    /// @{

    bool visible = true;
    bool castShadow = false;
    bool receiveShadow = false;

    std::unique_ptr<MeshData> mesh;
    std::optional<Material> material;

    bool isMesh() const { return mesh != nullptr; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Hierarchy
    /// @{

    const std::string& name() const { return m_name; }

    SceneNode* parent() const { return m_parent; }

    /// Take ownership of a child node, returns a reference to it
    SceneNode& addChild(std::unique_ptr<SceneNode> child);

    const std::vector<std::unique_ptr<SceneNode>>& children() const { return m_children; }

    /// Depth-first visit of this node and all descendants
    void traverse(const std::function<void(SceneNode&)>& fn);
    void traverse(const std::function<void(const SceneNode&)>& fn) const;

    /// Number of nodes in the subtree (including this one)
    size_t subtreeSize() const;

    /// @}

    /// World-space bounds of every mesh in the subtree.
    /// Updates world matrices first.
    Bounds3D computeWorldBounds();

private:
    void updateWorldMatrix(const glm::mat4& parentWorld);

    std::string m_name;
    SceneNode* m_parent = nullptr;
    std::vector<std::unique_ptr<SceneNode>> m_children;
    glm::mat4 m_worldMatrix = glm::mat4(1.0f);
};

} // namespace diorama
