// Diorama Application
// Window, input-to-scroll mapping and the main loop

#pragma once

#include <string>
#include <filesystem>

namespace diorama {

// Configuration passed from command-line arguments
struct AppConfig {
    std::filesystem::path configPath;  // empty = built-in showroom page
    bool headless = false;
    int windowWidth = 0;   // 0 = use config file value
    int windowHeight = 0;

    float initialScroll = 0.0f;
    float scrollStep = 100.0f;  // Page pixels per mouse-wheel notch

    // Frame limit
    int maxFrames = 0;  // 0 = unlimited
};

// Main application class
// Owns the window, the loader threads and the viewer, and runs the main loop
class Application {
public:
    Application() = default;
    ~Application();

    // Initialize the application with given config
    // Returns 0 on success, non-zero on error
    int init(const AppConfig& config);

    // Run the main loop
    // Returns exit code (0 = success)
    int run();

    // Cleanup (called by destructor, can be called explicitly)
    void shutdown();

private:
    struct Impl;
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace diorama
