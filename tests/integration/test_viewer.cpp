/**
 * @file test_viewer.cpp
 * @brief Integration tests for the Viewer page controller
 *
 * Drives a whole page session (load, scroll, resize, frames) through a
 * scripted mesh source. No window or GPU context is needed.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <diorama/diorama.h>
#include "fake_mesh_source.h"

using namespace diorama;
using diorama::testing::FakeMeshSource;
using diorama::testing::makeBoxModel;
using Catch::Matchers::WithinAbs;

namespace {

// Records what each frame would draw
class RecordingRenderer : public Renderer {
public:
    void resize(int width, int height) override {
        lastWidth = width;
        lastHeight = height;
    }

    void render(const RenderFrame& frame) override {
        const ModelAsset* current = frame.registry.current();
        drawn.push_back(current ? current->key : std::string());
        lastFrameIndex = frame.frameIndex;
        lastLightTarget = frame.lighting.target();
        lastCameraPosition = frame.camera.getPosition();
    }

    std::vector<std::string> drawn;
    uint64_t lastFrameIndex = 0;
    const SceneNode* lastLightTarget = nullptr;
    glm::vec3 lastCameraPosition{0.0f};
    int lastWidth = 0;
    int lastHeight = 0;
};

ViewerConfig showroomConfig() {
    ViewerConfig config;
    config.primary = {"car", "car.gltf", "CONCEPT CAR"};
    config.models = {{"livingroom", "room.gltf", ""}, {"bedroom", "bed.gltf", ""}};
    config.sections = {
        {"car", 1.0f, SectionUnit::Viewport},
        {"livingroom", 1.0f, SectionUnit::Viewport},
        {"bedroom", 1.0f, SectionUnit::Viewport},
    };
    config.windowWidth = 1000;
    config.windowHeight = 800;
    return config;
}

struct Session {
    ViewerConfig config = showroomConfig();
    FakeMeshSource source;
    ConsoleProgressDisplay progress;
    StackedSectionLayout layout{config.sections};
    RecordingRenderer renderer;
    Viewer viewer{config, source, progress, layout, renderer};

    Session() { layout.relayout(800.0f); }

    const std::optional<std::string>& current() const { return viewer.registry().currentKey(); }
};

} // namespace

TEST_CASE("Viewer startup", "[integration][viewer]") {
    Session s;

    SECTION("nothing loads before start") {
        REQUIRE(s.source.requests().empty());
    }

    SECTION("start loads the primary once") {
        s.viewer.start();
        s.viewer.start();
        REQUIRE(s.source.requests().size() == 1);
        REQUIRE(s.source.requested("car.gltf"));
        REQUIRE(s.progress.text() == "LOADING CONCEPT CAR... 0%");
    }

    SECTION("camera starts from the showroom framing") {
        REQUIRE(s.viewer.camera().getPosition() == glm::vec3(0, 5, 10));
        REQUIRE_THAT(s.viewer.camera().getAspect(), WithinAbs(1.25f, 1e-6));
        REQUIRE(s.viewer.orbit().getAutoRotate());
    }

    SECTION("frames render while loading") {
        s.viewer.start();
        s.viewer.tick(1.0 / 60.0);
        s.viewer.tick(1.0 / 60.0);
        REQUIRE(s.renderer.drawn == std::vector<std::string>{"", ""});
        REQUIRE(s.renderer.lastFrameIndex == 1);
        REQUIRE(s.viewer.renderLoop().frameCount() == 2);
    }
}

TEST_CASE("Viewer page session", "[integration][viewer]") {
    Session s;
    s.viewer.start();

    SECTION("primary load shows the car and starts the background") {
        s.source.progress("car.gltf", 1, 2);
        REQUIRE(s.progress.text() == "LOADING CONCEPT CAR... 50%");

        s.source.succeed("car.gltf", makeBoxModel("car"));
        REQUIRE(s.current() == std::optional<std::string>("car"));
        REQUIRE_FALSE(s.progress.visible());
        REQUIRE(s.source.requested("room.gltf"));
        REQUIRE(s.source.requested("bed.gltf"));

        s.viewer.tick(1.0 / 60.0);
        REQUIRE(s.renderer.drawn.back() == "car");
        REQUIRE(s.renderer.lastLightTarget == s.viewer.registry().find("car")->node.get());
    }

    SECTION("failed background model leaves the rest of the page working") {
        s.source.succeed("car.gltf", makeBoxModel("car"));
        s.source.fail("bed.gltf");
        s.source.succeed("room.gltf", makeBoxModel("livingroom"));

        REQUIRE(s.viewer.registry().keys() == std::vector<std::string>{"car", "livingroom"});

        s.viewer.onScroll(1000.0f, 800.0f);
        REQUIRE(*s.current() == "livingroom");

        s.viewer.onScroll(1800.0f, 800.0f);  // bedroom section
        REQUIRE(*s.current() == "livingroom");
        REQUIRE(s.viewer.registry().visibleCount() == 1);
    }

    SECTION("scrolling to a model still loading is dropped") {
        s.source.succeed("car.gltf", makeBoxModel("car"));
        s.viewer.onScroll(1000.0f, 800.0f);
        REQUIRE(*s.current() == "car");

        // Arrives later; the earlier scroll is not replayed
        s.source.succeed("room.gltf", makeBoxModel("livingroom"));
        REQUIRE(*s.current() == "car");

        s.viewer.onScroll(1010.0f, 800.0f);
        REQUIRE(*s.current() == "livingroom");
    }

    SECTION("scrolling onto a section boundary activates that section") {
        s.source.succeed("car.gltf", makeBoxModel("car"));
        s.source.succeed("room.gltf", makeBoxModel("livingroom"));
        s.source.succeed("bed.gltf", makeBoxModel("bedroom"));

        float boundary = s.layout.sections()[2].offsetTop - 800.0f / 2.0f;
        s.viewer.onScroll(boundary, 800.0f);
        REQUIRE(*s.current() == "bedroom");

        s.viewer.onScroll(boundary - 1.0f, 800.0f);
        REQUIRE(*s.current() == "livingroom");
    }

    SECTION("switching to an unknown key changes nothing") {
        s.source.succeed("car.gltf", makeBoxModel("car"));
        uint64_t revision = s.viewer.lighting().revision();

        REQUIRE(s.viewer.registry().switchTo("nonexistent") == SwitchResult::NotLoaded);
        REQUIRE(*s.current() == "car");
        REQUIRE(s.viewer.registry().find("car")->visible);
        REQUIRE(s.viewer.lighting().revision() == revision);
    }

    SECTION("primary failure still lets background models be scrolled to") {
        s.source.fail("car.gltf", LoadErrorKind::Parse);
        REQUIRE(s.progress.text() == "ERROR LOADING CONCEPT CAR. CHECK CONSOLE FOR DETAILS.");
        REQUIRE_FALSE(s.current().has_value());

        s.source.succeed("room.gltf", makeBoxModel("livingroom"));
        s.viewer.onScroll(1000.0f, 800.0f);
        REQUIRE(*s.current() == "livingroom");

        // Home zone asks for the car, which never loaded
        s.viewer.onScroll(0.0f, 800.0f);
        REQUIRE(*s.current() == "livingroom");
    }

    SECTION("resize moves the section boundaries") {
        s.source.succeed("car.gltf", makeBoxModel("car"));
        s.source.succeed("room.gltf", makeBoxModel("livingroom"));
        s.viewer.onScroll(500.0f, 800.0f);
        REQUIRE(*s.current() == "livingroom");

        s.layout.relayout(1200.0f);
        s.viewer.onResize(1500, 1200);
        REQUIRE(*s.current() == "car");
        REQUIRE(s.renderer.lastWidth == 1500);
        REQUIRE_THAT(s.viewer.camera().getAspect(), WithinAbs(1.25f, 1e-6));
    }

    SECTION("minimized window is ignored") {
        s.viewer.onResize(0, 0);
        REQUIRE(s.renderer.lastWidth == 0);
        REQUIRE_THAT(s.viewer.camera().getAspect(), WithinAbs(1.25f, 1e-6));
    }

    SECTION("camera orbits between frames") {
        s.viewer.tick(1.0);
        s.viewer.tick(1.0);
        REQUIRE(s.renderer.lastCameraPosition.x > 0.0f);
        REQUIRE(s.viewer.camera().getTarget() == glm::vec3(0, 1, 0));
    }

    SECTION("shutdown leaves no model current") {
        s.source.succeed("car.gltf", makeBoxModel("car"));
        s.viewer.shutdown();
        REQUIRE_FALSE(s.current().has_value());
        REQUIRE(s.viewer.registry().visibleCount() == 0);
        REQUIRE(s.viewer.lighting().target() == nullptr);
    }
}
