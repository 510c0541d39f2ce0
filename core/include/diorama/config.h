#pragma once

/**
 * @file config.h
 * @brief Viewer configuration (models and page sections)
 *
 * Loaded from JSON:
 * @code
 * {
 *   "window":   { "width": 1280, "height": 720 },
 *   "primary":  { "key": "car", "path": "models/car/scene.gltf", "label": "CONCEPT CAR" },
 *   "models":   [ { "key": "livingroom", "path": "models/room/scene.gltf" } ],
 *   "sections": [ { "model": "car" }, { "model": "livingroom", "height": 1.5 },
 *                 { "model": "kitchen", "heightPx": 900 } ]
 * }
 * @endcode
 *
 * Section "height" is in viewport heights (default 1), "heightPx" in page
 * pixels. Relative model paths resolve against the config file's directory.
 * Scale factors and material overrides are fixed (see PrepareSettings).
 */

#include <diorama/section_layout.h>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace diorama {

struct ModelEntry {
    std::string key;
    std::string path;
    std::string label;  ///< Shown while loading; empty = key in upper case
};

struct ViewerConfig {
    ModelEntry primary;
    std::vector<ModelEntry> models;  ///< Background models
    std::vector<SectionSpec> sections;

    int windowWidth = 1280;
    int windowHeight = 720;

    /// Showroom page: car first, then three room sections
    static ViewerConfig defaults();

    /// Background models as key -> path
    std::map<std::string, std::string> backgroundPaths() const;
};

/**
 * @brief Parse a JSON configuration document
 * @param text JSON source
 * @param baseDir Directory relative model paths resolve against
 * @param out Filled on success
 * @param error Filled on failure
 * @return True on success
 */
bool parseConfig(const std::string& text, const std::filesystem::path& baseDir,
                 ViewerConfig& out, std::string& error);

/// Read and parse a configuration file
bool loadConfig(const std::filesystem::path& path, ViewerConfig& out, std::string& error);

} // namespace diorama
