#pragma once

/**
 * @file render_loop.h
 * @brief Per-frame camera update and draw
 *
 * The loop owns no timing of its own: the host calls tick() from its frame
 * callback. A tick reads whatever the registry marks visible at that moment,
 * so loads and scroll events that completed earlier in the frame are
 * reflected immediately.
 */

#include <diorama/camera.h>
#include <cstdint>

namespace diorama {

class LightingRig;
class SceneRegistry;

/// Everything a renderer needs for one frame
struct RenderFrame {
    const SceneRegistry& registry;
    const LightingRig& lighting;
    const Camera3D& camera;
    uint64_t frameIndex;
    double time;
};

/// Draws a frame. Implemented by the host's graphics backend.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual void resize(int width, int height) { (void)width; (void)height; }
    virtual void render(const RenderFrame& frame) = 0;
};

class RenderLoop {
public:
    RenderLoop(const SceneRegistry& registry, const LightingRig& lighting, Camera3D& camera,
               Renderer& renderer);

    /// Optional camera driver, not owned
    void cameraController(CameraController* controller) { m_controller = controller; }

    /// Advance one frame
    void tick(double dt);

    /// Viewport changed: update camera aspect and renderer
    void resize(int width, int height);

    uint64_t frameCount() const { return m_frameCount; }
    double time() const { return m_time; }

private:
    const SceneRegistry& m_registry;
    const LightingRig& m_lighting;
    Camera3D& m_camera;
    Renderer& m_renderer;
    CameraController* m_controller = nullptr;

    uint64_t m_frameCount = 0;
    double m_time = 0.0;
};

} // namespace diorama
