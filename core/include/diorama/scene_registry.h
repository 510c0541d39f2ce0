#pragma once

/**
 * @file scene_registry.h
 * @brief Loaded models and which one is on screen
 *
 * The registry owns every successfully loaded model for the lifetime of the
 * session. Exactly one model is visible once a current model has been
 * chosen, and none before that. Switching hides the previous model (it is
 * kept for instant re-show) and points the key light at the new one.
 *
 * Switching to a key that is unknown or not yet loaded is not an error:
 * the request is dropped and nothing changes. It is not retried when the
 * model arrives later.
 */

#include <diorama/model_asset.h>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace diorama {

class LightingRig;

enum class SwitchResult {
    Switched,        ///< Target is now the current model
    AlreadyCurrent,  ///< Target was already current, nothing changed
    NotLoaded        ///< Key not registered (still loading, failed or unknown), request dropped
};

class SceneRegistry {
public:
    explicit SceneRegistry(LightingRig& lighting);

    SceneRegistry(const SceneRegistry&) = delete;
    SceneRegistry& operator=(const SceneRegistry&) = delete;

    // -------------------------------------------------------------------------
    /// @name Registration
    /// @{

    /**
     * @brief Add a loaded model
     * @param key Unique model key
     * @param sourcePath File the model came from
     * @param node Prepared scene root (ownership transferred)
     * @param isPrimary Fixed role of the model
     * @param makeCurrent Show it immediately (switchTo semantics)
     * @return False if the key is already registered or node is null
     *
     * New models are hidden unless makeCurrent is set.
     */
    bool registerModel(const std::string& key, const std::string& sourcePath,
                       std::unique_ptr<SceneNode> node, bool isPrimary,
                       bool makeCurrent = false);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Switching
    /// @{

    /// Make key the visible model and retarget the key light
    SwitchResult switchTo(const std::string& key);

    /// Hide the current model and forget it (session teardown)
    void clearCurrent();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Queries
    /// @{

    const std::optional<std::string>& currentKey() const { return m_currentKey; }

    /// Current model, or nullptr
    const ModelAsset* current() const;

    /// Registered model by key, or nullptr
    const ModelAsset* find(const std::string& key) const;

    bool contains(const std::string& key) const { return m_assets.count(key) > 0; }

    /// Registered keys, sorted
    std::vector<std::string> keys() const;

    size_t size() const { return m_assets.size(); }

    size_t visibleCount() const;

    /// Visit every visible model (at most one)
    void forEachVisible(const std::function<void(const ModelAsset&)>& fn) const;

    /// @}

private:
    void setVisible(ModelAsset& asset, bool visible);

    LightingRig& m_lighting;
    std::unordered_map<std::string, ModelAsset> m_assets;
    std::optional<std::string> m_currentKey;
};

} // namespace diorama
