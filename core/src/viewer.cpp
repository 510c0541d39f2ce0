#include <diorama/viewer.h>
#include <iostream>

namespace diorama {

Viewer::Viewer(const ViewerConfig& config, MeshSource& meshSource, ProgressDisplay& progress,
               const SectionLayout& layout, Renderer& renderer)
    : m_config(config)
    , m_registry(m_lighting)
    , m_loader(meshSource, m_preparer, m_registry, progress)
    , m_scroll(layout, m_registry, config.primary.key)
    , m_renderLoop(m_registry, m_lighting, m_camera, renderer) {
    m_camera.lookAt(glm::vec3(0, 5, 10), glm::vec3(0, 1, 0));
    m_camera.fov(45.0f);
    m_camera.nearPlane(0.1f);
    m_camera.farPlane(100.0f);
    if (config.windowWidth > 0 && config.windowHeight > 0) {
        m_camera.aspect(static_cast<float>(config.windowWidth) / static_cast<float>(config.windowHeight));
    }

    m_orbit.autoRotate(true)
        .autoRotateSpeed(1.0f)
        .dampingFactor(0.05f)
        .distanceLimits(3.0f, 20.0f)
        .maxPolarAngle(3.14159265f);
    m_renderLoop.cameraController(&m_orbit);

    m_loader.setBackgroundModels(config.backgroundPaths());
}

void Viewer::start() {
    if (m_started) return;
    m_started = true;

    std::cout << "[Diorama] Loading " << m_config.primary.key << " from "
              << m_config.primary.path << std::endl;
    m_loader.loadPrimary(m_config.primary.key, m_config.primary.path, m_config.primary.label);
}

void Viewer::onScroll(float scrollOffset, float viewportHeight) {
    m_scroll.onScroll(scrollOffset, viewportHeight);
}

void Viewer::onResize(int width, int height) {
    m_renderLoop.resize(width, height);
    if (height > 0) {
        m_scroll.onResize(static_cast<float>(height));
    }
}

void Viewer::shutdown() {
    m_registry.clearCurrent();
}

} // namespace diorama
