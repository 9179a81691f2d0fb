#pragma once

/**
 * @file animation_overlay.h
 * @brief Animated layers composed onto one overlay of a host map
 *
 * AnimationOverlay is the entry point for applications. It owns the layer
 * registry, one clock runner per layer, the overlay lifecycle and the camera
 * sync, and wires them together:
 *
 * - setVisible() starts or stops a layer's clock and attaches or detaches
 *   the overlay as the set of visible layers becomes non-empty or empty
 * - every frame in which a clock ticked, the layers are composed once and
 *   pushed to the overlay at frame end
 * - while the overlay is attached, camera events are mirrored into it
 *
 * @par Example
 * @code
 * OverlayConfig config;
 * config.pulses.push_back({"stillwater", {-97.0584, 36.1156}});
 * config.flows.push_back({"transmission"});
 *
 * AnimationOverlay overlay(map, loop, config);
 * overlay.onCleanup([](const CleanupDetail& d) { report(d); });
 * overlay.setRouteGeometry("transmission", lines);
 * overlay.setVisible("transmission", true);
 * @endcode
 */

#include <flowmap/animation_batcher.h>
#include <flowmap/animation_runner.h>
#include <flowmap/camera_sync.h>
#include <flowmap/config.h>
#include <flowmap/host_map.h>
#include <flowmap/layer_registry.h>
#include <flowmap/overlay_manager.h>
#include <flowmap/run_loop.h>
#include <flowmap/trips.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flowmap {

class PerformanceMonitor;

class AnimationOverlay {
public:
    /**
     * @brief Construct from a config
     * @param map Host map (must outlive this object)
     * @param loop Run loop (must outlive this object)
     * @param config Layer definitions and tuning
     * @param monitor Optional performance monitor consulted each frame
     * @throw std::runtime_error on duplicate layer ids
     */
    AnimationOverlay(HostMap& map, RunLoop& loop, const OverlayConfig& config,
                     const PerformanceMonitor* monitor = nullptr);
    ~AnimationOverlay();

    AnimationOverlay(const AnimationOverlay&) = delete;
    AnimationOverlay& operator=(const AnimationOverlay&) = delete;

    // -------------------------------------------------------------------------
    /// @name Visibility
    /// @{

    /**
     * @brief Show or hide an animated layer
     * @throw std::runtime_error if id is not a registered layer
     */
    void setVisible(const std::string& id, bool visible);

    bool isVisible(const std::string& id) const;
    bool anyVisible() const;
    size_t visibleCount() const;

    /// @brief Clocks with an outstanding frame request
    size_t activeClockCount() const;

    /**
     * @brief Apply many visibility changes through the batcher
     *
     * Hides are queued ahead of shows so load drops before it rises.
     */
    void applyScene(const VisibilityFlags& flags);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Data
    /// @{

    /**
     * @brief Replace the route data of a flow layer
     * @return Number of lines skipped for having fewer than two points
     * @throw std::runtime_error if flowId is not a flow layer
     */
    size_t setRouteGeometry(const std::string& flowId, const std::vector<LineGeometry>& lines);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Output
    /// @{

    /// @brief Compose the layers for the current visibility and clocks
    std::vector<AnimatedLayerSpec> composeLayers() const;

    /// @brief Clock outputs of visible layers
    ClockStates clockStates() const;

    VisibilityFlags visibility() const;

    /// @brief Layer pushes applied at frame end since construction
    uint64_t frameUpdates() const { return m_frameUpdates; }

    /// @brief Frames whose layer push was deferred under low performance
    uint64_t deferredFrames() const { return m_deferredFrames; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    void onCleanup(OverlayManager::CleanupCallback callback);

    /// @brief Hide everything, detach, and notify cleanup (Stopped) once
    void shutdown();

    /// @}
    // -------------------------------------------------------------------------
    /// @name Components
    /// @{

    OverlayManager& overlay() { return m_overlay; }
    const OverlayManager& overlay() const { return m_overlay; }
    CameraSyncBridge& cameraSync() { return m_cameraSync; }
    AnimationBatcher& batcher() { return m_batcher; }
    const LayerRegistry& registry() const { return m_registry; }
    const AnimationRunner& runner(const std::string& id) const;

    /// @}

private:
    AnimationRunner& runnerFor(const std::string& id);
    void refresh();
    void onFrameEnd();

    RunLoop& m_loop;
    const PerformanceMonitor* m_monitor;
    int m_lowPerformanceStride;

    LayerRegistry m_registry;
    std::vector<std::unique_ptr<AnimationRunner>> m_runners;  // Registration order
    OverlayManager m_overlay;
    CameraSyncBridge m_cameraSync;
    AnimationBatcher m_batcher;

    ObserverId m_frameEndObserver = 0;
    bool m_layersDirty = false;
    uint64_t m_lowPerformanceFrames = 0;
    uint64_t m_frameUpdates = 0;
    uint64_t m_deferredFrames = 0;
};

} // namespace flowmap
