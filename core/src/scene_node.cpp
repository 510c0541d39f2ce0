#include <diorama/scene_node.h>
#include <glm/gtc/matrix_transform.hpp>

namespace diorama {

// ============================================================================
// Bounds3D / MeshData
// ============================================================================

Bounds3D Bounds3D::transformed(const glm::mat4& m) const {
    Bounds3D result;
    if (!valid()) return result;

    for (int i = 0; i < 8; i++) {
        glm::vec3 corner(
            (i & 1) ? max.x : min.x,
            (i & 2) ? max.y : min.y,
            (i & 4) ? max.z : min.z
        );
        result.expand(glm::vec3(m * glm::vec4(corner, 1.0f)));
    }
    return result;
}

void MeshData::computeBounds() {
    localBounds = Bounds3D();
    for (const auto& p : positions) {
        localBounds.expand(p);
    }
}

// ============================================================================
// SceneNode
// ============================================================================

SceneNode::SceneNode(std::string name) : m_name(std::move(name)) {}

SceneNode::~SceneNode() = default;

glm::mat4 SceneNode::localMatrix() const {
    glm::mat4 T = glm::translate(glm::mat4(1.0f), position);
    glm::mat4 R = glm::mat4_cast(rotation);
    glm::mat4 S = glm::scale(glm::mat4(1.0f), scale);
    return T * R * S;
}

void SceneNode::updateWorldMatrix() {
    glm::mat4 parentWorld = m_parent ? m_parent->worldMatrix() : glm::mat4(1.0f);
    updateWorldMatrix(parentWorld);
}

void SceneNode::updateWorldMatrix(const glm::mat4& parentWorld) {
    m_worldMatrix = parentWorld * localMatrix();
    for (auto& child : m_children) {
        child->updateWorldMatrix(m_worldMatrix);
    }
}

SceneNode& SceneNode::addChild(std::unique_ptr<SceneNode> child) {
    child->m_parent = this;
    m_children.push_back(std::move(child));
    return *m_children.back();
}

void SceneNode::traverse(const std::function<void(SceneNode&)>& fn) {
    fn(*this);
    for (auto& child : m_children) {
        child->traverse(fn);
    }
}

void SceneNode::traverse(const std::function<void(const SceneNode&)>& fn) const {
    fn(*this);
    for (const auto& child : m_children) {
        static_cast<const SceneNode&>(*child).traverse(fn);
    }
}

size_t SceneNode::subtreeSize() const {
    size_t count = 1;
    for (const auto& child : m_children) {
        count += child->subtreeSize();
    }
    return count;
}

Bounds3D SceneNode::computeWorldBounds() {
    updateWorldMatrix();

    Bounds3D bounds;
    traverse([&bounds](const SceneNode& node) {
        if (node.isMesh()) {
            bounds.expand(node.mesh->localBounds.transformed(node.worldMatrix()));
        }
    });
    return bounds;
}

} // namespace diorama
