#pragma once

/**
 * @file mesh_source.h
 * @brief Boundary to the mesh-file loader
 *
 * The viewer only depends on the triple-callback shape below and on the
 * returned SceneNode hierarchy. A MeshSource never blocks inside load() and
 * never invokes callbacks from within load(); results arrive later on the
 * main thread.
 */

#include <diorama/scene_node.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace diorama {

enum class LoadErrorKind {
    NotFound,    ///< File does not exist
    Io,          ///< File exists but could not be read
    Parse,       ///< Malformed or unsupported file contents
    EmptyScene   ///< Parsed fine but contains no geometry
};

inline const char* loadErrorKindName(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::NotFound:   return "not found";
        case LoadErrorKind::Io:         return "I/O error";
        case LoadErrorKind::Parse:      return "parse error";
        case LoadErrorKind::EmptyScene: return "empty scene";
    }
    return "unknown";
}

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::Io;
    std::string path;
    std::string message;
};

/// Result of one load: the scene root, or the reason it failed
using LoadOutcome = std::variant<std::unique_ptr<SceneNode>, LoadError>;

struct LoadCallbacks {
    std::function<void(std::unique_ptr<SceneNode>)> onSuccess;
    std::function<void(uint64_t loadedBytes, uint64_t totalBytes)> onProgress;  ///< Optional
    std::function<void(const LoadError&)> onError;
};

class MeshSource {
public:
    virtual ~MeshSource() = default;

    /// Start loading a model file. Exactly one of onSuccess/onError will
    /// fire later, on the main thread.
    virtual void load(const std::string& path, LoadCallbacks callbacks) = 0;
};

} // namespace diorama
