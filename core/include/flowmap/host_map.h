#pragma once

/**
 * @file host_map.h
 * @brief Interface of the externally owned map the overlay attaches to
 *
 * Flowmap never renders the base map. It consumes this interface to learn
 * when the map is ready, read its camera, subscribe to camera events, and
 * attach, update and detach a single overlay. Adapters for concrete map
 * engines implement it.
 */

#include <flowmap/layer_registry.h>
#include <flowmap/types.h>

#include <cstdint>
#include <functional>
#include <vector>

namespace flowmap {

/**
 * @brief Host map events the overlay subscribes to
 */
enum class MapEvent {
    Load,         ///< Map finished its initial load
    StyleLoad,    ///< Map style finished loading
    Render,       ///< A frame was rendered
    MoveStart,
    ZoomStart,
    PitchStart,
    RotateStart
};

inline const char* mapEventName(MapEvent event) {
    switch (event) {
        case MapEvent::Load:        return "load";
        case MapEvent::StyleLoad:   return "style.load";
        case MapEvent::Render:      return "render";
        case MapEvent::MoveStart:   return "movestart";
        case MapEvent::ZoomStart:   return "zoomstart";
        case MapEvent::PitchStart:  return "pitchstart";
        case MapEvent::RotateStart: return "rotatestart";
    }
    return "unknown";
}

using SubscriptionId = uint64_t;
using MapEventHandler = std::function<void()>;

/**
 * @brief Host map collaborator
 *
 * Camera state is read-only for flowmap except through jumpTo(). Overlay
 * primitives may throw std::exception subclasses; callers contain them.
 */
class HostMap {
public:
    virtual ~HostMap() = default;

    // -------------------------------------------------------------------------
    /// @name Readiness
    /// @{

    /// @brief True once the map style is loaded and overlays can be added
    virtual bool isStyleLoaded() const = 0;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Camera
    /// @{

    virtual LngLat center() const = 0;
    virtual double zoom() const = 0;
    virtual double pitch() const = 0;
    virtual double bearing() const = 0;

    /// @brief Move the camera without animation
    virtual void jumpTo(const ViewState& view) = 0;

    /// @brief Snapshot of the current camera
    ViewState viewState() const {
        LngLat c = center();
        return ViewState{c.x, c.y, zoom(), pitch(), bearing()};
    }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Events
    /// @{

    /// @brief Subscribe until off() is called
    virtual SubscriptionId on(MapEvent event, MapEventHandler handler) = 0;

    /// @brief Subscribe for a single delivery
    virtual SubscriptionId once(MapEvent event, MapEventHandler handler) = 0;

    /// @brief Remove a subscription (unknown ids are ignored)
    virtual void off(SubscriptionId id) = 0;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Overlay primitives
    /// @{

    /**
     * @brief Create an overlay and attach it to the map
     * @param layers Initial layers (may be empty)
     * @return Handle of the new overlay
     * @throw std::exception if the overlay cannot be created
     */
    virtual OverlayHandle addOverlay(const std::vector<AnimatedLayerSpec>& layers) = 0;

    /// @brief Replace the layers of an attached overlay
    virtual void setOverlayLayers(OverlayHandle handle, const std::vector<AnimatedLayerSpec>& layers) = 0;

    /// @brief Align an attached overlay with a camera
    virtual void setOverlayViewState(OverlayHandle handle, const ViewState& view) = 0;

    /// @brief Detach and destroy an overlay
    virtual void removeOverlay(OverlayHandle handle) = 0;

    /// @brief True while the handle refers to an overlay registered with this map
    virtual bool isAttached(OverlayHandle handle) const = 0;

    /// @brief Ask the map to render a new frame
    virtual void triggerRepaint() {}

    /// @}
};

} // namespace flowmap
