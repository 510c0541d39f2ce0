// Diorama Application Implementation
// Window setup, scroll input, main loop, and cleanup

#include "app.h"

#include <diorama/diorama.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace diorama {

// -----------------------------------------------------------------------------
// Window-title collaborators
// -----------------------------------------------------------------------------

// Progress text goes to the window title while the primary model loads
class WindowTitleProgress : public ProgressDisplay {
public:
    explicit WindowTitleProgress(GLFWwindow* window) : m_window(window) {}

    void setText(const std::string& text) override {
        if (text == m_text) return;
        m_text = text;
        if (m_visible) apply();
    }

    void setVisible(bool visible) override {
        if (visible == m_visible) return;
        m_visible = visible;
        if (m_visible) apply();
    }

    bool visible() const { return m_visible; }

private:
    void apply() {
        glfwSetWindowTitle(m_window, ("Diorama - " + m_text).c_str());
        std::cout << "[Progress] " << m_text << std::endl;
    }

    GLFWwindow* m_window;
    std::string m_text;
    bool m_visible = false;
};

// Stand-in renderer: reports what a GPU backend would draw.
// The title shows the visible model once loading has finished.
class StatusRenderer : public Renderer {
public:
    StatusRenderer(GLFWwindow* window, const WindowTitleProgress& progress)
        : m_window(window), m_progress(progress) {}

    void resize(int width, int height) override {
        std::cout << "[Renderer] Viewport " << width << "x" << height << std::endl;
    }

    void render(const RenderFrame& frame) override {
        if (frame.lighting.revision() == m_lightRevision && m_progress.visible() == m_progressShown) {
            return;
        }
        m_lightRevision = frame.lighting.revision();
        m_progressShown = m_progress.visible();

        const ModelAsset* current = frame.registry.current();
        std::string name = current ? current->key : "(nothing)";

        if (current) {
            size_t nodes = current->node->subtreeSize();
            float radius = current->node->computeWorldBounds().radius();
            std::cout << "[Renderer] Frame " << frame.frameIndex << ": drawing " << name
                      << " (" << nodes << " nodes, radius " << radius << ")" << std::endl;
        }
        if (!m_progressShown) {
            glfwSetWindowTitle(m_window, ("Diorama - " + name).c_str());
        }
    }

private:
    GLFWwindow* m_window;
    const WindowTitleProgress& m_progress;
    uint64_t m_lightRevision = ~0ull;
    bool m_progressShown = true;
};

// -----------------------------------------------------------------------------
// Application Implementation
// -----------------------------------------------------------------------------

struct Application::Impl {
    // Collaborators (declared before the viewer, destroyed after it)
    EventQueue events;
    std::unique_ptr<GltfMeshSource> meshSource;
    std::unique_ptr<WindowTitleProgress> progress;
    std::unique_ptr<StackedSectionLayout> layout;
    std::unique_ptr<StatusRenderer> renderer;
    std::unique_ptr<Viewer> viewer;

    // Window
    GLFWwindow* window = nullptr;
    int width = 0;
    int height = 0;

    // Page scroll state, in page pixels
    float scrollOffset = 0.0f;
    bool scrollDirty = false;
    bool resized = false;

    ViewerConfig viewerConfig;
    AppConfig appConfig;

    void scrollBy(float delta) {
        float maxScroll = layout->maxScroll(static_cast<float>(height));
        float next = std::clamp(scrollOffset + delta, 0.0f, maxScroll);
        if (next != scrollOffset) {
            scrollOffset = next;
            scrollDirty = true;
        }
    }
};

Application::~Application() {
    shutdown();
}

int Application::init(const AppConfig& config) {
    if (m_initialized) {
        return 0;  // Already initialized
    }

    m_impl = new Impl();
    m_impl->appConfig = config;

    // Page configuration
    if (config.configPath.empty()) {
        m_impl->viewerConfig = ViewerConfig::defaults();
    } else {
        std::string error;
        if (!loadConfig(config.configPath, m_impl->viewerConfig, error)) {
            std::cerr << "Failed to load config: " << error << std::endl;
            return 1;
        }
    }
    ViewerConfig& vc = m_impl->viewerConfig;
    if (config.windowWidth > 0 && config.windowHeight > 0) {
        vc.windowWidth = config.windowWidth;
        vc.windowHeight = config.windowHeight;
    }
    if (vc.windowWidth <= 0 || vc.windowHeight <= 0) {
        std::cerr << "Invalid window size " << vc.windowWidth << "x" << vc.windowHeight << std::endl;
        return 1;
    }

    // Initialize GLFW
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return 1;
    }

    // The renderer backend creates its own surface
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    // Headless mode: create invisible window
    if (config.headless) {
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    }

    m_impl->window = glfwCreateWindow(vc.windowWidth, vc.windowHeight, "Diorama", nullptr, nullptr);
    if (!m_impl->window) {
        std::cerr << "Failed to create window" << std::endl;
        glfwTerminate();
        return 1;
    }
    glfwGetFramebufferSize(m_impl->window, &m_impl->width, &m_impl->height);

    // Collaborators
    m_impl->meshSource = std::make_unique<GltfMeshSource>(m_impl->events);
    m_impl->progress = std::make_unique<WindowTitleProgress>(m_impl->window);
    m_impl->layout = std::make_unique<StackedSectionLayout>(vc.sections);
    m_impl->layout->relayout(static_cast<float>(m_impl->height));
    m_impl->renderer = std::make_unique<StatusRenderer>(m_impl->window, *m_impl->progress);

    if (vc.sections.size() < 2) {
        std::cerr << "Warning: page has " << vc.sections.size()
                  << " section(s); scrolling will only ever show the primary model" << std::endl;
    }

    m_impl->viewer = std::make_unique<Viewer>(vc, *m_impl->meshSource, *m_impl->progress,
                                              *m_impl->layout, *m_impl->renderer);
    m_impl->viewer->onResize(m_impl->width, m_impl->height);

    // Input
    glfwSetWindowUserPointer(m_impl->window, m_impl);
    glfwSetScrollCallback(m_impl->window, [](GLFWwindow* w, double xoffset, double yoffset) {
        (void)xoffset;
        auto* impl = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (impl) impl->scrollBy(static_cast<float>(-yoffset) * impl->appConfig.scrollStep);
    });
    glfwSetFramebufferSizeCallback(m_impl->window, [](GLFWwindow* w, int width, int height) {
        auto* impl = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (!impl) return;
        impl->width = width;
        impl->height = height;
        impl->resized = true;
    });
    glfwSetKeyCallback(m_impl->window, [](GLFWwindow* w, int key, int scancode, int action, int mods) {
        (void)scancode;
        (void)mods;
        auto* impl = static_cast<Impl*>(glfwGetWindowUserPointer(w));
        if (!impl || action == GLFW_RELEASE) return;

        float page = static_cast<float>(impl->height) * 0.9f;
        switch (key) {
            case GLFW_KEY_DOWN:      impl->scrollBy(40.0f); break;
            case GLFW_KEY_UP:        impl->scrollBy(-40.0f); break;
            case GLFW_KEY_PAGE_DOWN:
            case GLFW_KEY_SPACE:     impl->scrollBy(page); break;
            case GLFW_KEY_PAGE_UP:   impl->scrollBy(-page); break;
            case GLFW_KEY_HOME:      impl->scrollBy(-impl->scrollOffset); break;
            case GLFW_KEY_END:       impl->scrollBy(impl->layout->pageHeight()); break;
            case GLFW_KEY_ESCAPE:    glfwSetWindowShouldClose(w, GLFW_TRUE); break;
            default: break;
        }
    });

    std::cout << "[Diorama] " << vc.models.size() + 1 << " models, "
              << vc.sections.size() << " sections, page height "
              << m_impl->layout->pageHeight() << "px" << std::endl;

    m_impl->viewer->start();

    if (config.initialScroll > 0.0f) {
        m_impl->scrollBy(config.initialScroll);
    }

    m_initialized = true;
    return 0;
}

int Application::run() {
    if (!m_initialized || !m_impl) {
        return 1;
    }

    Impl& app = *m_impl;
    using clock = std::chrono::steady_clock;
    const auto frameBudget = std::chrono::microseconds(16667);  // ~60 fps
    auto lastFrame = clock::now();
    int frames = 0;

    // Main loop
    while (!glfwWindowShouldClose(app.window)) {
        auto frameStart = clock::now();

        glfwPollEvents();

        // Load progress and completions from the mesh source threads
        app.events.drain();

        if (app.resized && app.height > 0) {
            app.resized = false;
            app.layout->relayout(static_cast<float>(app.height));
            app.scrollOffset = std::min(app.scrollOffset, app.layout->maxScroll(static_cast<float>(app.height)));
            app.viewer->onResize(app.width, app.height);
            app.scrollDirty = true;  // Offset may have been clamped
        }

        if (app.scrollDirty) {
            app.scrollDirty = false;
            app.viewer->onScroll(app.scrollOffset, static_cast<float>(app.height));
        }

        double dt = std::chrono::duration<double>(frameStart - lastFrame).count();
        lastFrame = frameStart;
        app.viewer->tick(dt);

        frames++;
        if (app.appConfig.maxFrames > 0 && frames >= app.appConfig.maxFrames) {
            std::cout << "Rendered " << frames << " frames, exiting." << std::endl;
            glfwSetWindowShouldClose(app.window, GLFW_TRUE);
        }

        std::this_thread::sleep_until(frameStart + frameBudget);
    }

    return 0;
}

void Application::shutdown() {
    if (!m_impl) {
        return;
    }

    std::cout << "Shutting down..." << std::endl;

    if (m_impl->viewer) {
        m_impl->viewer->shutdown();
    }

    // Join loader threads before anything they post to goes away
    if (m_impl->meshSource) {
        m_impl->meshSource->shutdown();
    }

    m_impl->viewer.reset();

    if (m_impl->window) {
        glfwDestroyWindow(m_impl->window);
    }
    glfwTerminate();

    delete m_impl;
    m_impl = nullptr;
    m_initialized = false;
}

} // namespace diorama
