#include <diorama/scene_registry.h>
#include <diorama/lighting_rig.h>
#include <algorithm>
#include <iostream>

namespace diorama {

SceneRegistry::SceneRegistry(LightingRig& lighting) : m_lighting(lighting) {}

bool SceneRegistry::registerModel(const std::string& key, const std::string& sourcePath,
                                  std::unique_ptr<SceneNode> node, bool isPrimary,
                                  bool makeCurrent) {
    if (!node) {
        std::cerr << "[SceneRegistry] Refusing to register '" << key << "' without a node" << std::endl;
        return false;
    }
    if (contains(key)) {
        std::cerr << "[SceneRegistry] Model '" << key << "' is already registered" << std::endl;
        return false;
    }

    ModelAsset asset;
    asset.key = key;
    asset.sourcePath = sourcePath;
    asset.node = std::move(node);
    asset.isPrimary = isPrimary;

    auto it = m_assets.emplace(key, std::move(asset)).first;
    setVisible(it->second, false);

    if (makeCurrent) {
        switchTo(key);
    }
    return true;
}

SwitchResult SceneRegistry::switchTo(const std::string& key) {
    auto it = m_assets.find(key);
    if (it == m_assets.end()) {
        return SwitchResult::NotLoaded;
    }
    if (m_currentKey && *m_currentKey == key) {
        return SwitchResult::AlreadyCurrent;
    }

    if (m_currentKey) {
        auto prev = m_assets.find(*m_currentKey);
        if (prev != m_assets.end()) {
            setVisible(prev->second, false);
        }
    }

    ModelAsset& target = it->second;
    setVisible(target, true);
    m_currentKey = key;
    m_lighting.retarget(target.node.get());

    std::cout << "[SceneRegistry] Showing " << key << std::endl;
    return SwitchResult::Switched;
}

void SceneRegistry::clearCurrent() {
    if (!m_currentKey) return;

    auto it = m_assets.find(*m_currentKey);
    if (it != m_assets.end()) {
        setVisible(it->second, false);
    }
    m_currentKey.reset();
    m_lighting.retarget(nullptr);
}

const ModelAsset* SceneRegistry::current() const {
    return m_currentKey ? find(*m_currentKey) : nullptr;
}

const ModelAsset* SceneRegistry::find(const std::string& key) const {
    auto it = m_assets.find(key);
    return it != m_assets.end() ? &it->second : nullptr;
}

std::vector<std::string> SceneRegistry::keys() const {
    std::vector<std::string> result;
    result.reserve(m_assets.size());
    for (const auto& [key, _] : m_assets) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t SceneRegistry::visibleCount() const {
    size_t count = 0;
    for (const auto& [_, asset] : m_assets) {
        if (asset.visible) count++;
    }
    return count;
}

void SceneRegistry::forEachVisible(const std::function<void(const ModelAsset&)>& fn) const {
    for (const auto& [_, asset] : m_assets) {
        if (asset.visible) fn(asset);
    }
}

void SceneRegistry::setVisible(ModelAsset& asset, bool visible) {
    asset.visible = visible;
    asset.node->visible = visible;
}

} // namespace diorama
