#pragma once

#include <diorama/scene_node.h>
#include <memory>
#include <string>

namespace diorama {

/// Load lifecycle of a key, tracked by AssetLoader. Transitions only move
/// forward: Loading -> Loaded | Failed. A key never requested has no status.
enum class LoadStatus {
    Loading,
    Loaded,
    Failed
};

inline const char* loadStatusName(LoadStatus status) {
    switch (status) {
        case LoadStatus::Loading: return "loading";
        case LoadStatus::Loaded:  return "loaded";
        case LoadStatus::Failed:  return "failed";
    }
    return "unknown";
}

/// A loaded model known to the scene. Only successful loads are registered,
/// and once registered a model stays for the whole session; switching only
/// toggles visibility.
struct ModelAsset {
    std::string key;
    std::string sourcePath;
    std::unique_ptr<SceneNode> node;
    bool visible = false;
    bool isPrimary = false;
};

} // namespace diorama
