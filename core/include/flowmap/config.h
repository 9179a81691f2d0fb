#pragma once

/**
 * @file config.h
 * @brief JSON configuration for the animation overlay
 *
 * Every key is optional; missing keys keep their defaults.
 *
 * @code{.json}
 * {
 *   "overlay":     { "readinessTimeoutMs": 2000, "failOnReadinessTimeout": false },
 *   "batch":       { "profile": "constrained", "lowMemory": false, "staggerDelayMs": 20 },
 *   "performance": { "lowFps": 20, "recoverFps": 30, "confirmSamples": 2 },
 *   "lowPerformanceFrameStride": 2,
 *   "pulses": [
 *     { "id": "stillwater", "position": [-97.0584, 36.1156],
 *       "periodMs": 3000, "minRadius": 500, "maxRadius": 2000,
 *       "waveform": "sine", "fillColor": [76, 175, 80, 120] }
 *   ],
 *   "flows": [
 *     { "id": "transmission", "particlesPerRoute": 15, "tripDurationMs": 10000,
 *       "trailLengthMs": 6000, "color": [239, 68, 68, 200] }
 *   ]
 * }
 * @endcode
 *
 * When "profile" is given, batch settings start from batchSettingsFor() and
 * explicit keys override them.
 */

#include <flowmap/animation_batcher.h>
#include <flowmap/layer_registry.h>
#include <flowmap/overlay_manager.h>
#include <flowmap/performance_monitor.h>

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace flowmap {

/**
 * @brief Complete overlay configuration
 */
struct OverlayConfig {
    OverlaySettings overlay;
    BatchSettings batch;
    PerformanceSettings performance;
    std::vector<PulseLayerDef> pulses;
    std::vector<FlowLayerDef> flows;

    /// Under low performance, apply layer updates on every Nth frame only
    int lowPerformanceFrameStride = 2;
};

/**
 * @brief Fill a config from parsed JSON
 * @param j JSON object
 * @param out Config to update (keys absent from j are left untouched)
 * @param error Receives a message on failure
 * @return true on success
 */
bool parseOverlayConfig(const nlohmann::json& j, OverlayConfig& out, std::string& error);

/**
 * @brief Load a config file
 * @param path Path to a JSON file
 * @param out Config to update
 * @param error Receives a message on failure
 * @return true on success
 */
bool loadOverlayConfig(const std::string& path, OverlayConfig& out, std::string& error);

bool parseHostProfile(const std::string& name, HostProfile& out);

} // namespace flowmap
