// Diorama - Entry Point
// Parses command-line arguments and runs the application

#include "app.h"
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

#ifndef DIORAMA_VERSION
#define DIORAMA_VERSION "0.1.0"
#endif

// Helper to parse WxH format
static bool parseSize(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos) return false;
    try {
        w = std::stoi(s.substr(0, x));
        h = std::stoi(s.substr(x + 1));
    } catch (const std::exception&) {
        return false;
    }
    return w > 0 && h > 0;
}

int main(int argc, char** argv) {
    diorama::AppConfig config;
    std::string configPath;
    std::string windowSize;

    CLI::App app{"Diorama - Scroll-driven 3D model viewer"};
    app.set_version_flag("-v,--version", std::string(DIORAMA_VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    app.add_option("config", configPath, "Page configuration (JSON); built-in showroom if omitted")
        ->check(CLI::ExistingFile);
    app.add_option("--window", windowSize, "Window size, e.g. 1280x720");
    app.add_flag("--headless", config.headless, "Run with an invisible window");
    app.add_option("--frames", config.maxFrames, "Exit after N frames (0 = run until closed)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--scroll-to", config.initialScroll, "Initial page scroll offset in pixels")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--scroll-step", config.scrollStep, "Page pixels per mouse-wheel notch")
        ->check(CLI::PositiveNumber);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    config.configPath = configPath;
    if (!windowSize.empty() && !parseSize(windowSize, config.windowWidth, config.windowHeight)) {
        std::cerr << "Invalid --window value '" << windowSize << "', expected WxH" << std::endl;
        return 1;
    }

    if (config.headless && config.maxFrames == 0) {
        std::cerr << "Warning: --headless without --frames will run indefinitely.\n";
        std::cerr << "         Use Ctrl+C to stop or add --frames N.\n";
    }

    std::cout << "Diorama - Starting..." << std::endl;

    // Create and run application
    diorama::Application application;

    int initResult = application.init(config);
    if (initResult != 0) {
        return initResult;
    }

    return application.run();
}
