#pragma once

/**
 * @file asset_loader.h
 * @brief Primary-then-background model loading
 *
 * The primary model loads first with progress shown in the ProgressDisplay.
 * When it finishes, successfully or not, the configured background models
 * start loading concurrently. Every model that loads is prepared and added
 * to the SceneRegistry; the primary one becomes current.
 *
 * Loads never block. Each key is loaded at most once per session: asking
 * again for a key that is loading, loaded or failed does nothing. A failure
 * only affects its own key and is never retried.
 *
 * @par Usage
 * @code
 * AssetLoader loader(meshSource, preparer, registry, progress);
 * loader.setBackgroundModels({{"livingroom", "models/room.gltf"},
 *                             {"bedroom", "models/bed.gltf"}});
 * loader.loadPrimary("car", "models/car.gltf", "CONCEPT CAR");
 * @endcode
 */

#include <diorama/mesh_source.h>
#include <diorama/model_asset.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace diorama {

class ModelPreparer;
class ProgressDisplay;
class SceneRegistry;

class AssetLoader {
public:
    using LoadedCallback = std::function<void(const std::string& key)>;
    using FailedCallback = std::function<void(const std::string& key, const LoadError& error)>;

    AssetLoader(MeshSource& source, ModelPreparer& preparer, SceneRegistry& registry,
                ProgressDisplay& progress);

    AssetLoader(const AssetLoader&) = delete;
    AssetLoader& operator=(const AssetLoader&) = delete;

    // -------------------------------------------------------------------------
    /// @name Loading
    /// @{

    /// Models to load once the primary model settles (key -> path)
    void setBackgroundModels(std::map<std::string, std::string> pathsByKey);
    const std::map<std::string, std::string>& backgroundModels() const { return m_background; }

    /**
     * @brief Start loading the primary model
     * @param key Model key
     * @param path Model file
     * @param label Name shown in the progress text (defaults to the key)
     * @return False if the key was already initiated (no-op)
     */
    bool loadPrimary(const std::string& key, const std::string& path, const std::string& label = {});

    /**
     * @brief Start one concurrent load per entry
     * @return Number of loads actually started
     */
    size_t loadBackground(const std::map<std::string, std::string>& pathsByKey);

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    /// Load status of a key, or nullopt if never initiated
    std::optional<LoadStatus> status(const std::string& key) const;

    /// Loads started but not yet finished
    size_t inFlightCount() const;

    /// True once the primary load has succeeded or failed
    bool primarySettled() const { return m_primarySettled; }

    /// Last reported primary progress in [0, 1]
    float primaryProgress() const { return m_primaryProgress; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Notifications
    /// @{

    /// Called on the main thread after a model is registered
    void onModelLoaded(LoadedCallback callback) { m_onLoaded = std::move(callback); }

    /// Called on the main thread after a load fails
    void onModelFailed(FailedCallback callback) { m_onFailed = std::move(callback); }

    /// @}

private:
    struct LoadRecord {
        std::string path;
        LoadStatus status = LoadStatus::Loading;
        bool isPrimary = false;
    };

    bool begin(const std::string& key, const std::string& path, bool isPrimary);
    void complete(const std::string& key, LoadOutcome outcome);
    void reportProgress(uint64_t loadedBytes, uint64_t totalBytes);

    MeshSource& m_source;
    ModelPreparer& m_preparer;
    SceneRegistry& m_registry;
    ProgressDisplay& m_progress;

    std::unordered_map<std::string, LoadRecord> m_records;
    std::map<std::string, std::string> m_background;

    std::string m_primaryLabel;
    float m_primaryProgress = 0.0f;
    bool m_primarySettled = false;

    LoadedCallback m_onLoaded;
    FailedCallback m_onFailed;
};

} // namespace diorama
