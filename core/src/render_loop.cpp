#include <diorama/render_loop.h>
#include <diorama/lighting_rig.h>
#include <diorama/scene_registry.h>

namespace diorama {

RenderLoop::RenderLoop(const SceneRegistry& registry, const LightingRig& lighting, Camera3D& camera,
                       Renderer& renderer)
    : m_registry(registry), m_lighting(lighting), m_camera(camera), m_renderer(renderer) {}

void RenderLoop::tick(double dt) {
    m_time += dt;

    if (m_controller) {
        m_controller->update(m_camera, static_cast<float>(dt));
    }

    RenderFrame frame{m_registry, m_lighting, m_camera, m_frameCount, m_time};
    m_renderer.render(frame);
    m_frameCount++;
}

void RenderLoop::resize(int width, int height) {
    if (width <= 0 || height <= 0) return;  // Minimized

    m_camera.aspect(static_cast<float>(width) / static_cast<float>(height));
    m_renderer.resize(width, height);
}

} // namespace diorama
