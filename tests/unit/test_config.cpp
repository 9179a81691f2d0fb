/**
 * @file test_config.cpp
 * @brief Unit tests for JSON configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flowmap/config.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace flowmap;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

TEST_CASE("parseOverlayConfig", "[unit][config]") {
    OverlayConfig config;
    std::string error;

    SECTION("empty object keeps defaults") {
        REQUIRE(parseOverlayConfig(json::object(), config, error));
        REQUIRE_THAT(config.overlay.readinessTimeoutMs, WithinAbs(2000.0, 1e-9));
        REQUIRE(config.batch.batchSize == 5);
        REQUIRE_THAT(config.performance.lowFps, WithinAbs(20.0, 1e-9));
        REQUIRE(config.lowPerformanceFrameStride == 2);
        REQUIRE(config.pulses.empty());
    }

    SECTION("profile seeds batch settings and explicit keys override") {
        json j = json::parse(R"({ "batch": { "profile": "standard", "lowMemory": true, "batchSize": 4 } })");
        REQUIRE(parseOverlayConfig(j, config, error));
        REQUIRE(config.batch.batchSize == 4);
        REQUIRE_THAT(config.batch.batchDelayMs, WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(config.batch.staggerDelayMs, WithinAbs(25.0, 1e-9));
    }

    SECTION("pulse and flow layers") {
        json j = json::parse(R"({
            "pulses": [ { "id": "p", "position": [-97.0, 36.0], "waveform": "saw",
                          "lineColor": [1, 2, 3] } ],
            "flows":  [ { "id": "f", "particlesPerRoute": 4, "tripDurationMs": 500 } ]
        })");
        REQUIRE(parseOverlayConfig(j, config, error));
        REQUIRE(config.pulses.size() == 1);
        REQUIRE(config.pulses[0].waveform == PulseWaveform::Saw);
        REQUIRE(config.pulses[0].lineColor == Color(1, 2, 3, 255));
        REQUIRE_THAT(config.pulses[0].position.y, WithinAbs(36.0, 1e-9));
        REQUIRE(config.flows.size() == 1);
        REQUIRE_THAT(config.flows[0].loopLength(), WithinAbs(2000.0, 1e-9));
    }

    SECTION("unknown profile is an error") {
        json j = json::parse(R"({ "batch": { "profile": "turbo" } })");
        REQUIRE_FALSE(parseOverlayConfig(j, config, error));
        REQUIRE(error.find("turbo") != std::string::npos);
    }

    SECTION("type errors are reported and leave the config untouched") {
        json j = json::parse(R"({ "overlay": { "readinessTimeoutMs": 10 },
                                 "performance": { "lowFps": "fast" } })");
        REQUIRE_FALSE(parseOverlayConfig(j, config, error));
        REQUIRE(error.find("Invalid config") != std::string::npos);
        REQUIRE_THAT(config.overlay.readinessTimeoutMs, WithinAbs(2000.0, 1e-9));
    }

    SECTION("layers without an id are rejected") {
        json j = json::parse(R"({ "pulses": [ { "position": [0, 0] } ] })");
        REQUIRE_FALSE(parseOverlayConfig(j, config, error));
    }

    SECTION("out-of-range color is rejected") {
        json j = json::parse(R"({ "flows": [ { "id": "f", "color": [300, 0, 0] } ] })");
        REQUIRE_FALSE(parseOverlayConfig(j, config, error));
        REQUIRE(error.find("out of range") != std::string::npos);
    }

    SECTION("unknown waveform is rejected") {
        json j = json::parse(R"({ "pulses": [ { "id": "p", "waveform": "wobble" } ] })");
        REQUIRE_FALSE(parseOverlayConfig(j, config, error));
    }

    SECTION("non-object root is rejected") {
        REQUIRE_FALSE(parseOverlayConfig(json::array(), config, error));
    }
}

TEST_CASE("loadOverlayConfig", "[unit][config]") {
    OverlayConfig config;
    std::string error;

    SECTION("loads a config file") {
        REQUIRE(loadOverlayConfig(std::string(FLOWMAP_TEST_DATA_DIR) + "/overlay.json", config, error));
        REQUIRE(config.overlay.failOnReadinessTimeout);
        REQUIRE_THAT(config.overlay.readinessTimeoutMs, WithinAbs(1500.0, 1e-9));
        REQUIRE(config.batch.batchSize == 2);
        REQUIRE_THAT(config.batch.staggerDelayMs, WithinAbs(20.0, 1e-9));
        REQUIRE(config.performance.confirmSamples == 2);
        REQUIRE(config.lowPerformanceFrameStride == 3);
        REQUIRE(config.pulses.size() == 1);
        REQUIRE(config.pulses[0].waveform == PulseWaveform::Triangle);
        REQUIRE(config.flows.size() == 1);
        REQUIRE(config.flows[0].trips.color == Color(239, 68, 68, 255));
    }

    SECTION("missing file") {
        REQUIRE_FALSE(loadOverlayConfig(std::string(FLOWMAP_TEST_DATA_DIR) + "/absent.json", config, error));
        REQUIRE(error.find("Failed to open") != std::string::npos);
    }

    SECTION("malformed file") {
        REQUIRE_FALSE(loadOverlayConfig(std::string(FLOWMAP_TEST_DATA_DIR) + "/malformed.json", config, error));
        REQUIRE(error.find("Parse error") != std::string::npos);
    }
}

TEST_CASE("parseHostProfile", "[unit][config]") {
    HostProfile profile = HostProfile::Standard;
    REQUIRE(parseHostProfile("constrained", profile));
    REQUIRE(profile == HostProfile::Constrained);
    REQUIRE_FALSE(parseHostProfile("other", profile));
}
