/**
 * @file test_scroll_state_machine.cpp
 * @brief Unit tests for section layout and scroll-to-model resolution
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <diorama/scroll_state_machine.h>
#include <diorama/lighting_rig.h>
#include "fake_mesh_source.h"

using namespace diorama;
using diorama::testing::makeBoxModel;
using Catch::Matchers::WithinAbs;

static std::vector<SectionSpec> showroomSpecs() {
    return {
        {"car", 1.0f, SectionUnit::Viewport},
        {"livingroom", 1.0f, SectionUnit::Viewport},
        {"bedroom", 1.0f, SectionUnit::Viewport},
        {"kitchen", 1.0f, SectionUnit::Viewport},
    };
}

// Resolve and return the key, "" when nothing is selected
static std::string resolved(const std::vector<ScrollSection>& sections, float scroll, float vh) {
    static const std::string primary = "car";
    const std::string* key = ScrollStateMachine::resolve(sections, scroll, vh, primary);
    return key ? *key : std::string();
}

TEST_CASE("StackedSectionLayout", "[scroll][layout]") {
    StackedSectionLayout layout(showroomSpecs());

    SECTION("viewport sections stack without gaps") {
        layout.relayout(800.0f);
        const auto& sections = layout.sections();
        REQUIRE(sections.size() == 4);
        for (size_t i = 0; i < sections.size(); ++i) {
            REQUIRE(sections[i].sectionIndex == i);
            REQUIRE_THAT(sections[i].offsetTop, WithinAbs(800.0f * i, 1e-3));
            REQUIRE_THAT(sections[i].height, WithinAbs(800.0f, 1e-3));
        }
        REQUIRE(sections[2].modelKey == "bedroom");
        REQUIRE_THAT(layout.pageHeight(), WithinAbs(3200.0f, 1e-3));
        REQUIRE_THAT(layout.maxScroll(800.0f), WithinAbs(2400.0f, 1e-3));
    }

    SECTION("relayout follows the viewport height") {
        layout.relayout(800.0f);
        layout.relayout(600.0f);
        REQUIRE_THAT(layout.sections()[3].offsetTop, WithinAbs(1800.0f, 1e-3));
    }

    SECTION("pixel sections keep their height") {
        StackedSectionLayout mixed({{"car", 1.0f, SectionUnit::Viewport},
                                    {"kitchen", 900.0f, SectionUnit::Pixels},
                                    {"bedroom", 1.5f, SectionUnit::Viewport}});
        mixed.relayout(400.0f);
        REQUIRE_THAT(mixed.sections()[1].offsetTop, WithinAbs(400.0f, 1e-3));
        REQUIRE_THAT(mixed.sections()[1].height, WithinAbs(900.0f, 1e-3));
        REQUIRE_THAT(mixed.sections()[2].offsetTop, WithinAbs(1300.0f, 1e-3));
        REQUIRE_THAT(mixed.sections()[2].height, WithinAbs(600.0f, 1e-3));
    }

    SECTION("specs are kept for the next relayout") {
        REQUIRE(layout.specs().size() == 4);
        REQUIRE(layout.specs()[3].modelKey == "kitchen");
        REQUIRE(layout.specs()[3].unit == SectionUnit::Viewport);
    }

    SECTION("short page cannot scroll") {
        StackedSectionLayout single({{"car", 0.5f, SectionUnit::Viewport}});
        single.relayout(800.0f);
        REQUIRE_THAT(single.maxScroll(800.0f), WithinAbs(0.0f, 1e-6));
    }
}

TEST_CASE("ScrollStateMachine resolve", "[scroll]") {
    StackedSectionLayout layout(showroomSpecs());
    layout.relayout(800.0f);
    const auto& sections = layout.sections();

    SECTION("top of the page is the home zone") {
        REQUIRE(resolved(sections, 0.0f, 800.0f) == "car");
        REQUIRE(resolved(sections, 399.0f, 800.0f) == "car");
    }

    SECTION("a section takes over when its top passes mid-viewport") {
        REQUIRE(resolved(sections, 400.0f, 800.0f) == "livingroom");
        REQUIRE(resolved(sections, 1199.0f, 800.0f) == "livingroom");
        REQUIRE(resolved(sections, 1200.0f, 800.0f) == "bedroom");
        REQUIRE(resolved(sections, 2000.0f, 800.0f) == "kitchen");
        REQUIRE(resolved(sections, 2799.0f, 800.0f) == "kitchen");
    }

    SECTION("exact lower boundary is inclusive") {
        float boundary = sections[2].offsetTop - 800.0f / 2.0f;
        REQUIRE(ScrollStateMachine::inRange(sections[2], boundary, 800.0f));
        REQUIRE_FALSE(ScrollStateMachine::inRange(sections[1], boundary, 800.0f));
        REQUIRE(resolved(sections, boundary, 800.0f) == "bedroom");
    }

    SECTION("past every section nothing is selected") {
        REQUIRE(resolved(sections, 2800.0f, 800.0f).empty());
        REQUIRE(resolved(sections, 10000.0f, 800.0f).empty());
    }

    SECTION("home zone shows the primary whatever the first section names") {
        StackedSectionLayout page({{"intro", 1.0f, SectionUnit::Viewport},
                                   {"kitchen", 1.0f, SectionUnit::Viewport}});
        page.relayout(800.0f);
        REQUIRE(resolved(page.sections(), 100.0f, 800.0f) == "car");
    }

    SECTION("pages with fewer than two sections always show the primary") {
        StackedSectionLayout single({{"kitchen", 3.0f, SectionUnit::Viewport}});
        single.relayout(800.0f);
        REQUIRE(resolved(single.sections(), 0.0f, 800.0f) == "car");
        REQUIRE(resolved(single.sections(), 1500.0f, 800.0f) == "car");

        std::vector<ScrollSection> none;
        REQUIRE(resolved(none, 0.0f, 800.0f) == "car");
    }

    SECTION("section without a model selects nothing") {
        StackedSectionLayout page({{"car", 1.0f, SectionUnit::Viewport},
                                   {"", 1.0f, SectionUnit::Viewport}});
        page.relayout(800.0f);
        REQUIRE(resolved(page.sections(), 500.0f, 800.0f).empty());
    }
}

TEST_CASE("ScrollStateMachine events", "[scroll][registry]") {
    LightingRig lighting;
    SceneRegistry registry(lighting);
    StackedSectionLayout layout(showroomSpecs());
    layout.relayout(800.0f);
    ScrollStateMachine scroll(layout, registry, "car");

    registry.registerModel("car", "car.gltf", makeBoxModel("car"), true, true);
    registry.registerModel("livingroom", "room.gltf", makeBoxModel("livingroom"), false);
    registry.registerModel("kitchen", "kitchen.gltf", makeBoxModel("kitchen"), false);

    SECTION("scrolling into a loaded section switches") {
        REQUIRE(scroll.onScroll(1000.0f, 800.0f));
        REQUIRE(*scroll.state() == "livingroom");
        REQUIRE(lighting.target() == registry.find("livingroom")->node.get());
    }

    SECTION("repeated events in the same section are no-ops") {
        scroll.onScroll(1000.0f, 800.0f);
        uint64_t revision = lighting.revision();
        REQUIRE_FALSE(scroll.onScroll(1100.0f, 800.0f));
        REQUIRE(lighting.revision() == revision);
    }

    SECTION("scrolling back to the top shows the primary") {
        scroll.onScroll(2000.0f, 800.0f);
        REQUIRE(*scroll.state() == "kitchen");
        REQUIRE(scroll.onScroll(0.0f, 800.0f));
        REQUIRE(*scroll.state() == "car");
    }

    SECTION("unloaded section keeps the previous model") {
        scroll.onScroll(1000.0f, 800.0f);
        REQUIRE_FALSE(scroll.onScroll(1500.0f, 800.0f));  // bedroom never loaded
        REQUIRE(*scroll.state() == "livingroom");
        REQUIRE(registry.visibleCount() == 1);
    }

    SECTION("scrolling past the end keeps the previous model") {
        scroll.onScroll(2000.0f, 800.0f);
        REQUIRE_FALSE(scroll.onScroll(5000.0f, 800.0f));
        REQUIRE(*scroll.state() == "kitchen");
    }

    SECTION("resize re-evaluates the stored offset") {
        REQUIRE(scroll.onScroll(500.0f, 800.0f));
        REQUIRE(*scroll.state() == "livingroom");

        layout.relayout(1200.0f);
        REQUIRE(scroll.onResize(1200.0f));
        REQUIRE(*scroll.state() == "car");
        REQUIRE_THAT(scroll.lastScrollOffset(), WithinAbs(500.0f, 1e-6));
        REQUIRE_THAT(scroll.lastViewportHeight(), WithinAbs(1200.0f, 1e-6));
    }
}
