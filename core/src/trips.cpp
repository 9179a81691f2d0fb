// Flowmap - Trip Particles Implementation

#include <flowmap/trips.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace flowmap {

TripBuildResult buildTrips(const std::vector<LineGeometry>& lines,
                           const TripSettings& settings,
                           const std::string& idPrefix) {
    TripBuildResult result;
    const int particles = std::max(settings.particlesPerRoute, 1);

    for (size_t lineIndex = 0; lineIndex < lines.size(); ++lineIndex) {
        const LineGeometry& line = lines[lineIndex];
        if (line.points.size() < 2) {
            ++result.skipped;
            continue;
        }

        auto path = std::make_shared<const std::vector<LngLat>>(line.points);
        const double segments = static_cast<double>(line.points.size() - 1);

        for (int p = 0; p < particles; ++p) {
            const double offset = p * settings.tripDurationMs;

            TripParticle trip;
            trip.id = idPrefix + "-" + std::to_string(result.routes) + "-particle-" + std::to_string(p);
            trip.path = path;
            trip.color = settings.color;
            trip.trailLength = settings.trailLengthMs;
            trip.timestamps.reserve(line.points.size());
            for (size_t i = 0; i < line.points.size(); ++i) {
                trip.timestamps.push_back(offset + (i / segments) * settings.tripDurationMs);
            }
            result.trips.push_back(std::move(trip));
        }
        ++result.routes;
    }

    if (result.skipped > 0) {
        std::cerr << "[Trips] Skipped " << result.skipped
                  << " route(s) with fewer than two points\n";
    }
    return result;
}

std::optional<LngLat> sampleTripPosition(const TripParticle& trip, double currentTime) {
    if (!trip.path || trip.path->size() < 2 || trip.timestamps.size() != trip.path->size()) {
        return std::nullopt;
    }
    const auto& ts = trip.timestamps;
    if (currentTime < ts.front() || currentTime > ts.back()) {
        return std::nullopt;
    }

    auto upper = std::upper_bound(ts.begin(), ts.end(), currentTime);
    if (upper == ts.end()) {
        return trip.path->back();
    }
    size_t i = static_cast<size_t>(upper - ts.begin());
    const double t0 = ts[i - 1];
    const double t1 = ts[i];
    const double f = t1 > t0 ? (currentTime - t0) / (t1 - t0) : 0.0;
    return glm::mix((*trip.path)[i - 1], (*trip.path)[i], f);
}

namespace {

bool readLine(const json& coords, LineGeometry& line) {
    if (!coords.is_array()) return false;
    for (const auto& c : coords) {
        if (!c.is_array() || c.size() < 2 || !c[0].is_number() || !c[1].is_number()) {
            return false;
        }
        line.points.emplace_back(c[0].get<double>(), c[1].get<double>());
    }
    return true;
}

} // namespace

std::vector<LineGeometry> parseRouteGeoJson(const json& collection, size_t* skipped) {
    std::vector<LineGeometry> lines;
    size_t bad = 0;

    if (!collection.is_object() || !collection.contains("features") ||
        !collection["features"].is_array()) {
        if (skipped) *skipped = 0;
        return lines;
    }

    for (const auto& feature : collection["features"]) {
        if (!feature.is_object() || !feature.contains("geometry") ||
            !feature["geometry"].is_object()) {
            ++bad;
            continue;
        }
        const json& geometry = feature["geometry"];
        if (!geometry.contains("type") || !geometry["type"].is_string() ||
            !geometry.contains("coordinates")) {
            ++bad;
            continue;
        }
        const std::string type = geometry["type"].get<std::string>();
        const json& coords = geometry["coordinates"];

        if (type == "LineString") {
            LineGeometry line;
            if (readLine(coords, line)) {
                lines.push_back(std::move(line));
            } else {
                ++bad;
            }
        } else if (type == "MultiLineString") {
            if (!coords.is_array()) {
                ++bad;
                continue;
            }
            for (const auto& member : coords) {
                LineGeometry line;
                if (readLine(member, line)) {
                    lines.push_back(std::move(line));
                } else {
                    ++bad;
                }
            }
        }
    }

    if (skipped) *skipped = bad;
    return lines;
}

bool loadRouteGeoJson(const std::string& path, std::vector<LineGeometry>& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open route file: " + path;
        std::cerr << "[Trips] " << error << "\n";
        return false;
    }

    try {
        json collection;
        file >> collection;
        size_t skipped = 0;
        std::vector<LineGeometry> lines = parseRouteGeoJson(collection, &skipped);
        std::cout << "[Trips] Loaded " << lines.size() << " line(s) from " << path;
        if (skipped > 0) std::cout << " (" << skipped << " malformed)";
        std::cout << "\n";
        out.insert(out.end(), lines.begin(), lines.end());
        return true;
    } catch (const json::parse_error& e) {
        error = "Parse error in " + path + ": " + e.what();
        std::cerr << "[Trips] " << error << "\n";
        return false;
    } catch (const json::exception& e) {
        error = "Invalid route data in " + path + ": " + e.what();
        std::cerr << "[Trips] " << error << "\n";
        return false;
    }
}

} // namespace flowmap
