/**
 * @file test_config.cpp
 * @brief Unit tests for ViewerConfig defaults and JSON parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <diorama/config.h>

using namespace diorama;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ViewerConfig defaults", "[config]") {
    ViewerConfig config = ViewerConfig::defaults();

    SECTION("showroom models") {
        REQUIRE(config.primary.key == "car");
        REQUIRE(config.primary.label == "CONCEPT CAR");
        REQUIRE(config.models.size() == 3);

        auto paths = config.backgroundPaths();
        REQUIRE(paths.size() == 3);
        REQUIRE(paths.count("livingroom") == 1);
        REQUIRE(paths.count("bedroom") == 1);
        REQUIRE(paths.count("kitchen") == 1);
        REQUIRE(paths.count("car") == 0);
    }

    SECTION("one full-viewport section per model") {
        REQUIRE(config.sections.size() == 4);
        REQUIRE(config.sections[0].modelKey == "car");
        REQUIRE(config.sections[3].modelKey == "kitchen");
        for (const auto& section : config.sections) {
            REQUIRE(section.unit == SectionUnit::Viewport);
            REQUIRE_THAT(section.height, WithinAbs(1.0f, 1e-6));
        }
    }

    SECTION("window size") {
        REQUIRE(config.windowWidth == 1280);
        REQUIRE(config.windowHeight == 720);
    }
}

TEST_CASE("parseConfig", "[config]") {
    ViewerConfig config;
    std::string error;

    SECTION("full document") {
        const std::string text = R"({
            "window": { "width": 1920, "height": 1080 },
            "primary": { "key": "car", "path": "models/car.gltf", "label": "CONCEPT CAR" },
            "models": [
                { "key": "livingroom", "path": "models/room.gltf" },
                { "key": "kitchen", "path": "/srv/models/kitchen.glb" }
            ],
            "sections": [
                { "model": "car" },
                { "model": "livingroom", "height": 1.5 },
                { "model": "kitchen", "heightPx": 900 }
            ]
        })";

        REQUIRE(parseConfig(text, "/data/site", config, error));
        REQUIRE(error.empty());

        REQUIRE(config.windowWidth == 1920);
        REQUIRE(config.windowHeight == 1080);
        REQUIRE(config.primary.label == "CONCEPT CAR");
        REQUIRE(config.primary.path == "/data/site/models/car.gltf");

        REQUIRE(config.models.size() == 2);
        REQUIRE(config.models[0].label.empty());
        REQUIRE(config.models[1].path == "/srv/models/kitchen.glb");

        REQUIRE(config.sections.size() == 3);
        REQUIRE(config.sections[0].unit == SectionUnit::Viewport);
        REQUIRE_THAT(config.sections[0].height, WithinAbs(1.0f, 1e-6));
        REQUIRE_THAT(config.sections[1].height, WithinAbs(1.5f, 1e-6));
        REQUIRE(config.sections[2].unit == SectionUnit::Pixels);
        REQUIRE_THAT(config.sections[2].height, WithinAbs(900.0f, 1e-6));
    }

    SECTION("empty base directory keeps relative paths") {
        REQUIRE(parseConfig(R"({"primary": {"key": "car", "path": "car.gltf"}})", "", config, error));
        REQUIRE(config.primary.path == "car.gltf");
        REQUIRE(config.models.empty());
        REQUIRE(config.sections.empty());
        REQUIRE(config.windowWidth == 1280);
    }

    SECTION("missing primary") {
        REQUIRE_FALSE(parseConfig(R"({"models": []})", "", config, error));
        REQUIRE_THAT(error, ContainsSubstring("primary"));
    }

    SECTION("model without path") {
        REQUIRE_FALSE(parseConfig(R"({"primary": {"key": "car"}})", "", config, error));
        REQUIRE_THAT(error, ContainsSubstring("path"));
    }

    SECTION("model without key") {
        REQUIRE_FALSE(parseConfig(R"({"primary": {"path": "car.gltf"}})", "", config, error));
        REQUIRE_THAT(error, ContainsSubstring("key"));
    }

    SECTION("duplicate keys") {
        const std::string text = R"({
            "primary": { "key": "car", "path": "car.gltf" },
            "models": [ { "key": "car", "path": "other.gltf" } ]
        })";
        REQUIRE_FALSE(parseConfig(text, "", config, error));
        REQUIRE_THAT(error, ContainsSubstring("duplicate"));
    }

    SECTION("malformed JSON") {
        REQUIRE_FALSE(parseConfig("{ \"primary\": ", "", config, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("wrong value types are reported, not thrown") {
        const std::string text = R"({
            "primary": { "key": "car", "path": "car.gltf" },
            "sections": [ { "model": "car", "height": "tall" } ]
        })";
        REQUIRE_FALSE(parseConfig(text, "", config, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("failure leaves the output untouched") {
        config.primary.key = "keep";
        parseConfig("not json", "", config, error);
        REQUIRE(config.primary.key == "keep");
    }
}

TEST_CASE("loadConfig", "[config]") {
    ViewerConfig config;
    std::string error;

    SECTION("missing file") {
        REQUIRE_FALSE(loadConfig("/nonexistent/diorama/viewer.json", config, error));
        REQUIRE_THAT(error, ContainsSubstring("cannot open"));
    }
}
