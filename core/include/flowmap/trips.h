#pragma once

/**
 * @file trips.h
 * @brief Route geometry and trip particles for flow animations
 *
 * A route (a polyline) is turned into several trip particles. Each particle
 * travels the full route in tripDurationMs; particle k starts at
 * k * tripDurationMs, so a loop of particlesPerRoute * tripDurationMs keeps
 * the route continuously populated.
 */

#include <flowmap/types.h>
#include <nlohmann/json_fwd.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flowmap {

/**
 * @brief One pre-parsed line geometry record
 */
struct LineGeometry {
    std::vector<LngLat> points;
};

/**
 * @brief A particle following a path over time
 *
 * path and timestamps are parallel; timestamps are monotonic. Particles of
 * the same route share one path.
 */
struct TripParticle {
    std::string id;
    std::shared_ptr<const std::vector<LngLat>> path;
    std::vector<double> timestamps;
    Color color{239, 68, 68, 200};
    double trailLength = 6000.0;  ///< Trail duration in ms
};

/**
 * @brief Particle generation settings
 */
struct TripSettings {
    int particlesPerRoute = 15;
    double tripDurationMs = 10000.0;
    double trailLengthMs = 6000.0;
    Color color{239, 68, 68, 200};

    /// @brief Loop length covering every staggered particle once
    double loopLength() const {
        return static_cast<double>(std::max(particlesPerRoute, 1)) * tripDurationMs;
    }
};

/**
 * @brief Result of building trips from geometry
 */
struct TripBuildResult {
    std::vector<TripParticle> trips;
    size_t routes = 0;   ///< Lines that produced particles
    size_t skipped = 0;  ///< Lines with fewer than two points
};

/**
 * @brief Build trip particles from route lines
 * @param lines Route geometry
 * @param settings Particle settings
 * @param idPrefix Prefix for particle ids
 *
 * Lines with fewer than two points are skipped and counted; the rest of the
 * batch is still built.
 */
TripBuildResult buildTrips(const std::vector<LineGeometry>& lines,
                           const TripSettings& settings,
                           const std::string& idPrefix = "trip");

/**
 * @brief Interpolate a particle's head position at a given time
 * @return Position, or nullopt when the particle is not on its path at that time
 */
std::optional<LngLat> sampleTripPosition(const TripParticle& trip, double currentTime);

/**
 * @brief Extract line geometry from a GeoJSON FeatureCollection
 * @param collection Parsed GeoJSON
 * @param skipped Optional counter for features that are not usable lines
 *
 * LineString features produce one line, MultiLineString features one line
 * per member. Other geometry types are ignored.
 */
std::vector<LineGeometry> parseRouteGeoJson(const nlohmann::json& collection,
                                            size_t* skipped = nullptr);

/**
 * @brief Load and parse a GeoJSON route file
 * @param path File path
 * @param out Receives the lines (appended)
 * @param error Receives a message on failure
 * @return true on success
 */
bool loadRouteGeoJson(const std::string& path, std::vector<LineGeometry>& out, std::string& error);

} // namespace flowmap
