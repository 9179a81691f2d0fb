#pragma once

/**
 * @file types.h
 * @brief Value types shared between the overlay components
 */

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

#include <cstdint>
#include <string>

namespace flowmap {

/// Longitude (x) and latitude (y) in degrees
using LngLat = glm::dvec2;

/// 8-bit RGBA color
using Color = glm::u8vec4;

/**
 * @brief Camera parameters mirrored from the host map
 */
struct ViewState {
    double longitude = 0.0;
    double latitude = 0.0;
    double zoom = 0.0;
    double pitch = 0.0;   ///< Degrees
    double bearing = 0.0; ///< Degrees

    bool operator==(const ViewState& o) const {
        return longitude == o.longitude && latitude == o.latitude &&
               zoom == o.zoom && pitch == o.pitch && bearing == o.bearing;
    }
    bool operator!=(const ViewState& o) const { return !(*this == o); }
};

/**
 * @brief Opaque reference to an overlay attached to a host map
 *
 * A default-constructed handle is invalid.
 */
struct OverlayHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    explicit operator bool() const { return valid(); }

    bool operator==(const OverlayHandle& o) const { return id == o.id; }
    bool operator!=(const OverlayHandle& o) const { return id != o.id; }
};

/**
 * @brief How an overlay lifecycle ended
 */
enum class CleanupStatus {
    Stopped,
    Failed
};

inline const char* cleanupStatusName(CleanupStatus status) {
    switch (status) {
        case CleanupStatus::Stopped: return "stopped";
        case CleanupStatus::Failed:  return "failed";
    }
    return "unknown";
}

/**
 * @brief Payload of the single cleanup notification
 */
struct CleanupDetail {
    CleanupStatus status = CleanupStatus::Stopped;
    std::string reason;   ///< Machine-readable reason (e.g. "overlay_add_failed")
    std::string message;  ///< Diagnostic message from the failing call
};

} // namespace flowmap
