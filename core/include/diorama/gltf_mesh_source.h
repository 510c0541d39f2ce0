#pragma once

/**
 * @file gltf_mesh_source.h
 * @brief Asynchronous GLTF/GLB loading
 *
 * Each load runs on its own worker thread: the file is read in chunks
 * (reporting progress), parsed with cgltf, and converted into a SceneNode
 * tree. Progress and completion are posted to an EventQueue, so callbacks
 * run wherever that queue is drained.
 *
 * @par Usage
 * @code
 * EventQueue events;
 * GltfMeshSource source(events);
 * source.load("assets/car/scene.gltf", {
 *     [](std::unique_ptr<SceneNode> root) { ... },
 *     [](uint64_t loaded, uint64_t total) { ... },
 *     [](const LoadError& err) { ... }
 * });
 *
 * // each frame
 * events.drain();
 * @endcode
 */

#include <diorama/mesh_source.h>
#include <diorama/event_queue.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace diorama {

class GltfMeshSource : public MeshSource {
public:
    explicit GltfMeshSource(EventQueue& events);
    ~GltfMeshSource() override;

    GltfMeshSource(const GltfMeshSource&) = delete;
    GltfMeshSource& operator=(const GltfMeshSource&) = delete;

    void load(const std::string& path, LoadCallbacks callbacks) override;

    /// Read buffer size used for progress reporting (default 64 KiB)
    void chunkSize(size_t bytes) { m_chunkSize = bytes > 0 ? bytes : 1; }

    /// Stop accepting work and join all workers. Loads still running are
    /// abandoned without invoking their callbacks.
    void shutdown();

    /// Join workers that have finished. Called by load(); exposed so
    /// callers can release threads between loads.
    /// @return Workers still running
    size_t reapFinished();

    /// Parse an in-memory GLTF/GLB document synchronously.
    /// @param data File contents
    /// @param path Original file path (for external buffers and error text)
    /// @param outError Filled on failure
    /// @return Scene root, or nullptr on failure
    static std::unique_ptr<SceneNode> parse(const std::vector<uint8_t>& data,
                                            const std::string& path,
                                            LoadError& outError);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void worker(const std::string& path, const LoadCallbacks& callbacks);
    void readAndParse(const std::string& path, const LoadCallbacks& callbacks);
    void fail(const LoadCallbacks& callbacks, LoadError error);

    EventQueue& m_events;
    size_t m_chunkSize = 64 * 1024;
    std::atomic<bool> m_shutdown{false};
    std::mutex m_threadsMutex;
    std::vector<Worker> m_workers;
};

} // namespace diorama
