// Diorama - Asset Loader Implementation

#include <diorama/asset_loader.h>
#include <diorama/model_preparer.h>
#include <diorama/progress_display.h>
#include <diorama/scene_registry.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace diorama {

static std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

AssetLoader::AssetLoader(MeshSource& source, ModelPreparer& preparer, SceneRegistry& registry,
                         ProgressDisplay& progress)
    : m_source(source), m_preparer(preparer), m_registry(registry), m_progress(progress) {}

void AssetLoader::setBackgroundModels(std::map<std::string, std::string> pathsByKey) {
    m_background = std::move(pathsByKey);
}

bool AssetLoader::loadPrimary(const std::string& key, const std::string& path, const std::string& label) {
    // Leave the progress text of the first request alone
    if (m_records.count(key)) {
        return begin(key, path, true);
    }

    m_primaryLabel = label.empty() ? toUpper(key) : label;
    m_primaryProgress = 0.0f;
    m_progress.setVisible(true);
    m_progress.setText("LOADING " + m_primaryLabel + "... 0%");

    return begin(key, path, true);
}

size_t AssetLoader::loadBackground(const std::map<std::string, std::string>& pathsByKey) {
    size_t started = 0;
    for (const auto& [key, path] : pathsByKey) {
        if (begin(key, path, false)) {
            started++;
        }
    }
    return started;
}

bool AssetLoader::begin(const std::string& key, const std::string& path, bool isPrimary) {
    // One load per key per session, whatever its outcome
    auto existing = m_records.find(key);
    if (existing != m_records.end()) {
        std::cout << "[AssetLoader] " << key << " already " << loadStatusName(existing->second.status)
                  << ", not loading again" << std::endl;
        return false;
    }

    LoadRecord& record = m_records[key];
    record.path = path;
    record.isPrimary = isPrimary;
    record.status = LoadStatus::Loading;

    LoadCallbacks callbacks;
    callbacks.onSuccess = [this, key](std::unique_ptr<SceneNode> node) {
        complete(key, std::move(node));
    };
    callbacks.onError = [this, key](const LoadError& error) {
        complete(key, error);
    };
    if (isPrimary) {
        callbacks.onProgress = [this](uint64_t loadedBytes, uint64_t totalBytes) {
            reportProgress(loadedBytes, totalBytes);
        };
    }

    m_source.load(path, std::move(callbacks));
    return true;
}

void AssetLoader::reportProgress(uint64_t loadedBytes, uint64_t totalBytes) {
    if (m_primarySettled || totalBytes == 0) return;

    float fraction = static_cast<float>(static_cast<double>(loadedBytes) / static_cast<double>(totalBytes));
    m_primaryProgress = std::clamp(fraction, 0.0f, 1.0f);

    int percent = static_cast<int>(std::round(m_primaryProgress * 100.0f));
    m_progress.setText("LOADING " + m_primaryLabel + "... " + std::to_string(percent) + "%");
}

void AssetLoader::complete(const std::string& key, LoadOutcome outcome) {
    auto it = m_records.find(key);
    if (it == m_records.end() || it->second.status != LoadStatus::Loading) {
        // Duplicate completion from the source; the first one won
        return;
    }

    const bool isPrimary = it->second.isPrimary;
    const std::string path = it->second.path;

    std::optional<LoadError> error;
    if (auto* node = std::get_if<std::unique_ptr<SceneNode>>(&outcome)) {
        if (*node) {
            m_preparer.prepare(**node, isPrimary);
            if (!m_registry.registerModel(key, path, std::move(*node), isPrimary, isPrimary)) {
                error = LoadError{LoadErrorKind::Parse, path, "Model could not be registered"};
            }
        } else {
            error = LoadError{LoadErrorKind::EmptyScene, path, "Mesh source returned no scene"};
        }
    } else {
        error = std::get<LoadError>(std::move(outcome));
    }

    if (!error) {
        it->second.status = LoadStatus::Loaded;
        std::cout << "[AssetLoader] Loaded " << key << " model" << std::endl;
        if (isPrimary) {
            m_progress.setVisible(false);
        }
        if (m_onLoaded) m_onLoaded(key);
    } else {
        it->second.status = LoadStatus::Failed;
        std::cerr << "[AssetLoader] Error loading " << key << " model: "
                  << loadErrorKindName(error->kind) << ": " << error->message << std::endl;
        if (isPrimary) {
            m_progress.setText("ERROR LOADING " + m_primaryLabel + ". CHECK CONSOLE FOR DETAILS.");
        }
        if (m_onFailed) m_onFailed(key, *error);
    }

    // The rest of the page loads whether or not the primary model made it
    if (isPrimary) {
        m_primarySettled = true;
        loadBackground(m_background);
    }
}

std::optional<LoadStatus> AssetLoader::status(const std::string& key) const {
    auto it = m_records.find(key);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

size_t AssetLoader::inFlightCount() const {
    size_t count = 0;
    for (const auto& [_, record] : m_records) {
        if (record.status == LoadStatus::Loading) count++;
    }
    return count;
}

} // namespace diorama
