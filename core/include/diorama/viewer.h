#pragma once

/**
 * @file viewer.h
 * @brief Page controller tying loading, scrolling and rendering together
 *
 * The Viewer holds all per-session scene state (registry, lights, camera,
 * load records) and hands explicit references to each component. The host
 * owns the Viewer and supplies the outside collaborators: where meshes come
 * from, where progress text goes, how sections are laid out and how frames
 * are drawn.
 *
 * @par Host loop
 * @code
 * Viewer viewer(config, meshSource, progress, layout, renderer);
 * viewer.start();
 * while (running) {
 *     events.drain();                      // load callbacks
 *     if (scrolled) viewer.onScroll(y, h);
 *     viewer.tick(dt);
 * }
 * viewer.shutdown();
 * @endcode
 */

#include <diorama/asset_loader.h>
#include <diorama/camera.h>
#include <diorama/config.h>
#include <diorama/lighting_rig.h>
#include <diorama/model_preparer.h>
#include <diorama/render_loop.h>
#include <diorama/scene_registry.h>
#include <diorama/scroll_state_machine.h>

namespace diorama {

class MeshSource;
class ProgressDisplay;
class SectionLayout;
class Renderer;

class Viewer {
public:
    Viewer(const ViewerConfig& config, MeshSource& meshSource, ProgressDisplay& progress,
           const SectionLayout& layout, Renderer& renderer);

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    /// Begin loading the primary model (background models follow)
    void start();

    /// Page scrolled
    void onScroll(float scrollOffset, float viewportHeight);

    /// Window resized; the layout must already reflect the new size
    void onResize(int width, int height);

    /// Advance one frame
    void tick(double dt) { m_renderLoop.tick(dt); }

    /// End of session: no model is current afterwards
    void shutdown();

    // -------------------------------------------------------------------------
    /// @name Components
    /// @{

    const ViewerConfig& config() const { return m_config; }
    SceneRegistry& registry() { return m_registry; }
    const SceneRegistry& registry() const { return m_registry; }
    LightingRig& lighting() { return m_lighting; }
    AssetLoader& loader() { return m_loader; }
    ScrollStateMachine& scroll() { return m_scroll; }
    Camera3D& camera() { return m_camera; }
    OrbitCameraController& orbit() { return m_orbit; }
    RenderLoop& renderLoop() { return m_renderLoop; }

    /// @}

private:
    ViewerConfig m_config;

    LightingRig m_lighting;
    SceneRegistry m_registry;
    ModelPreparer m_preparer;
    AssetLoader m_loader;
    ScrollStateMachine m_scroll;

    Camera3D m_camera;
    OrbitCameraController m_orbit;
    RenderLoop m_renderLoop;

    bool m_started = false;
};

} // namespace diorama
