// Flowmap - Configuration Loading

#include <flowmap/config.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace flowmap {

namespace {

// Missing keys keep the current value; wrong types throw json::type_error
template<typename T>
void read(const json& j, const char* key, T& value) {
    if (j.contains(key)) {
        value = j.at(key).get<T>();
    }
}

void readColor(const json& j, const char* key, Color& color) {
    if (!j.contains(key)) return;
    const json& c = j.at(key);
    if (!c.is_array() || c.size() < 3 || c.size() > 4) {
        throw std::runtime_error(std::string("'") + key + "' must be [r, g, b] or [r, g, b, a]");
    }
    for (size_t i = 0; i < c.size(); ++i) {
        int v = c.at(i).get<int>();
        if (v < 0 || v > 255) {
            throw std::runtime_error(std::string("'") + key + "' component out of range: " + std::to_string(v));
        }
        color[static_cast<glm::length_t>(i)] = static_cast<uint8_t>(v);
    }
    if (c.size() == 3) color.a = 255;
}

void readPosition(const json& j, const char* key, LngLat& pos) {
    if (!j.contains(key)) return;
    const json& p = j.at(key);
    if (!p.is_array() || p.size() != 2) {
        throw std::runtime_error(std::string("'") + key + "' must be [longitude, latitude]");
    }
    pos = LngLat(p.at(0).get<double>(), p.at(1).get<double>());
}

PulseLayerDef parsePulse(const json& j) {
    PulseLayerDef def;
    read(j, "id", def.id);
    readPosition(j, "position", def.position);
    read(j, "periodMs", def.periodMs);
    read(j, "minRadius", def.minRadius);
    read(j, "maxRadius", def.maxRadius);
    if (j.contains("waveform")) {
        std::string name = j.at("waveform").get<std::string>();
        if (!parsePulseWaveform(name, def.waveform)) {
            throw std::runtime_error("Unknown waveform: " + name);
        }
    }
    readColor(j, "fillColor", def.fillColor);
    readColor(j, "lineColor", def.lineColor);
    read(j, "radiusMinPixels", def.radiusMinPixels);
    read(j, "radiusMaxPixels", def.radiusMaxPixels);
    read(j, "lineWidthMinPixels", def.lineWidthMinPixels);
    read(j, "lineWidthMaxPixels", def.lineWidthMaxPixels);
    read(j, "stroked", def.stroked);
    if (def.id.empty()) {
        throw std::runtime_error("Pulse layer is missing 'id'");
    }
    return def;
}

FlowLayerDef parseFlow(const json& j) {
    FlowLayerDef def;
    read(j, "id", def.id);
    read(j, "particlesPerRoute", def.trips.particlesPerRoute);
    read(j, "tripDurationMs", def.trips.tripDurationMs);
    read(j, "trailLengthMs", def.trips.trailLengthMs);
    readColor(j, "color", def.trips.color);
    read(j, "width", def.width);
    read(j, "widthMinPixels", def.widthMinPixels);
    read(j, "widthMaxPixels", def.widthMaxPixels);
    read(j, "fadeTrail", def.fadeTrail);
    read(j, "roundedCaps", def.roundedCaps);
    if (def.id.empty()) {
        throw std::runtime_error("Flow layer is missing 'id'");
    }
    if (def.trips.particlesPerRoute < 1 || def.trips.tripDurationMs <= 0.0) {
        throw std::runtime_error("Flow layer '" + def.id + "' needs particlesPerRoute >= 1 and tripDurationMs > 0");
    }
    return def;
}

} // namespace

bool parseHostProfile(const std::string& name, HostProfile& out) {
    if (name == "constrained") { out = HostProfile::Constrained; return true; }
    if (name == "standard")    { out = HostProfile::Standard; return true; }
    return false;
}

bool parseOverlayConfig(const json& j, OverlayConfig& out, std::string& error) {
    if (!j.is_object()) {
        error = "Config root must be an object";
        return false;
    }

    // Parse into a copy so a failed parse leaves out untouched
    OverlayConfig config = out;

    try {
        if (j.contains("overlay")) {
            const json& o = j.at("overlay");
            read(o, "readinessTimeoutMs", config.overlay.readinessTimeoutMs);
            read(o, "failOnReadinessTimeout", config.overlay.failOnReadinessTimeout);
        }

        if (j.contains("batch")) {
            const json& b = j.at("batch");
            if (b.contains("profile")) {
                std::string name = b.at("profile").get<std::string>();
                HostProfile profile;
                if (!parseHostProfile(name, profile)) {
                    error = "Unknown host profile: " + name;
                    return false;
                }
                bool lowMemory = false;
                read(b, "lowMemory", lowMemory);
                config.batch = batchSettingsFor(profile, lowMemory);
            }
            read(b, "batchSize", config.batch.batchSize);
            read(b, "batchDelayMs", config.batch.batchDelayMs);
            read(b, "staggerDelayMs", config.batch.staggerDelayMs);
        }

        if (j.contains("performance")) {
            const json& p = j.at("performance");
            read(p, "lowFps", config.performance.lowFps);
            read(p, "recoverFps", config.performance.recoverFps);
            read(p, "confirmSamples", config.performance.confirmSamples);
            read(p, "sampleWindowMs", config.performance.sampleWindowMs);
            read(p, "targetFps", config.performance.targetFps);
            read(p, "historySize", config.performance.historySize);
        }

        read(j, "lowPerformanceFrameStride", config.lowPerformanceFrameStride);

        if (j.contains("pulses")) {
            config.pulses.clear();
            for (const auto& entry : j.at("pulses")) {
                config.pulses.push_back(parsePulse(entry));
            }
        }
        if (j.contains("flows")) {
            config.flows.clear();
            for (const auto& entry : j.at("flows")) {
                config.flows.push_back(parseFlow(entry));
            }
        }
    } catch (const json::exception& e) {
        error = std::string("Invalid config: ") + e.what();
        return false;
    } catch (const std::runtime_error& e) {
        error = std::string("Invalid config: ") + e.what();
        return false;
    }

    if (config.lowPerformanceFrameStride < 1) config.lowPerformanceFrameStride = 1;

    out = std::move(config);
    return true;
}

bool loadOverlayConfig(const std::string& path, OverlayConfig& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open config: " + path;
        std::cerr << "[Config] " << error << "\n";
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        error = "Parse error in " + path + ": " + e.what();
        std::cerr << "[Config] " << error << "\n";
        return false;
    }

    if (!parseOverlayConfig(j, out, error)) {
        std::cerr << "[Config] " << path << ": " << error << "\n";
        return false;
    }

    std::cout << "[Config] Loaded: " << path << " (" << out.pulses.size() << " pulse, "
              << out.flows.size() << " flow layer(s))\n";
    return true;
}

} // namespace flowmap
