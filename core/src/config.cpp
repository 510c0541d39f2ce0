#include <diorama/config.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace diorama {

ViewerConfig ViewerConfig::defaults() {
    ViewerConfig config;
    config.primary = {"car", "public/vehicle_-_subaru_brz_rocket_bunny/scene.gltf", "CONCEPT CAR"};
    config.models = {
        {"livingroom", "public/cozy_living_room_baked_gltf/scene.gltf", ""},
        {"bedroom", "public/millennium_falcon/scene.gltf", ""},
        {"kitchen", "public/city_gltf/scene.gltf", ""},
    };
    config.sections = {
        {"car", 1.0f, SectionUnit::Viewport},
        {"livingroom", 1.0f, SectionUnit::Viewport},
        {"bedroom", 1.0f, SectionUnit::Viewport},
        {"kitchen", 1.0f, SectionUnit::Viewport},
    };
    return config;
}

std::map<std::string, std::string> ViewerConfig::backgroundPaths() const {
    std::map<std::string, std::string> paths;
    for (const auto& model : models) {
        paths[model.key] = model.path;
    }
    return paths;
}

static std::string resolvePath(const std::string& path, const fs::path& baseDir) {
    fs::path p(path);
    if (p.is_absolute() || baseDir.empty()) {
        return path;
    }
    return (baseDir / p).lexically_normal().string();
}

static bool parseModel(const json& j, const fs::path& baseDir, ModelEntry& out, std::string& error) {
    if (!j.is_object()) {
        error = "model entry must be an object";
        return false;
    }
    out.key = j.value("key", "");
    out.path = j.value("path", "");
    out.label = j.value("label", "");

    if (out.key.empty()) {
        error = "model entry is missing \"key\"";
        return false;
    }
    if (out.path.empty()) {
        error = "model '" + out.key + "' is missing \"path\"";
        return false;
    }
    out.path = resolvePath(out.path, baseDir);
    return true;
}

bool parseConfig(const std::string& text, const fs::path& baseDir, ViewerConfig& out, std::string& error) {
    ViewerConfig config;

    try {
        json j = json::parse(text);

        if (j.contains("window")) {
            const json& window = j["window"];
            config.windowWidth = window.value("width", config.windowWidth);
            config.windowHeight = window.value("height", config.windowHeight);
        }

        if (!j.contains("primary")) {
            error = "missing \"primary\" model";
            return false;
        }
        if (!parseModel(j["primary"], baseDir, config.primary, error)) {
            return false;
        }

        std::set<std::string> keys = {config.primary.key};
        if (j.contains("models")) {
            for (const auto& entry : j["models"]) {
                ModelEntry model;
                if (!parseModel(entry, baseDir, model, error)) {
                    return false;
                }
                if (!keys.insert(model.key).second) {
                    error = "duplicate model key '" + model.key + "'";
                    return false;
                }
                config.models.push_back(model);
            }
        }

        if (j.contains("sections")) {
            for (const auto& entry : j["sections"]) {
                SectionSpec section;
                section.modelKey = entry.value("model", "");
                if (entry.contains("heightPx")) {
                    section.height = entry["heightPx"].get<float>();
                    section.unit = SectionUnit::Pixels;
                } else {
                    section.height = entry.value("height", 1.0f);
                    section.unit = SectionUnit::Viewport;
                }
                config.sections.push_back(section);
            }
        }
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }

    out = std::move(config);
    return true;
}

bool loadConfig(const fs::path& path, ViewerConfig& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path.string();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!parseConfig(buffer.str(), path.parent_path(), out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace diorama
