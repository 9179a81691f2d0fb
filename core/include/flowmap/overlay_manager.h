#pragma once

/**
 * @file overlay_manager.h
 * @brief Lifecycle of the single overlay attached to a host map
 *
 * OverlayManager is the only component that creates, updates or destroys the
 * overlay. Its lifecycle is an explicit state machine:
 *
 * @code
 *            attach() [map ready]               addOverlay() ok
 *   Idle ──────────────────────────► Creating ─────────────────► Attached
 *    │  attach() [not ready]            ▲  │ addOverlay() throws     │
 *    ▼                                  │  ▼                         │
 *   WaitingForReady ── load/timeout ────┘ Failed ── attach() ─► ...  │
 *    │ detach() / nothing visible                                     │
 *    └──────────────► Idle ◄──────── detach() / stale handle ────────┘
 * @endcode
 *
 * Creation failures are surfaced once through the cleanup callback; all
 * other conditions are handled internally and logged.
 */

#include <flowmap/host_map.h>
#include <flowmap/layer_registry.h>
#include <flowmap/run_loop.h>
#include <flowmap/types.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace flowmap {

/**
 * @brief Overlay lifecycle states
 */
enum class OverlayState {
    Idle,             ///< No overlay, nothing pending
    WaitingForReady,  ///< Subscribed to readiness events, timeout armed
    Creating,         ///< Inside the host's addOverlay() call
    Attached,         ///< Overlay live on the map
    Failed            ///< Last creation failed; attach() retries
};

const char* overlayStateName(OverlayState state);

/**
 * @brief Overlay lifecycle tuning
 */
struct OverlaySettings {
    double readinessTimeoutMs = 2000.0;  ///< Bound on the readiness wait
    bool failOnReadinessTimeout = false; ///< Fail closed instead of proceeding
};

class OverlayManager {
public:
    using LayerSource = std::function<std::vector<AnimatedLayerSpec>()>;
    using VisibilityQuery = std::function<bool()>;
    using CleanupCallback = std::function<void(const CleanupDetail&)>;
    using HandleCallback = std::function<void(OverlayHandle)>;

    OverlayManager(HostMap& map, RunLoop& loop, OverlaySettings settings = {});
    ~OverlayManager();

    OverlayManager(const OverlayManager&) = delete;
    OverlayManager& operator=(const OverlayManager&) = delete;

    // -------------------------------------------------------------------------
    /// @name Wiring
    /// @{

    /// @brief Source of the layers used when the overlay is created
    void setLayerSource(LayerSource source) { m_layerSource = std::move(source); }

    /// @brief Whether anything is visible; a pending attach aborts when false
    void setVisibilityQuery(VisibilityQuery query) { m_visibilityQuery = std::move(query); }

    /// @brief Cleanup notification, fired at most once per manager
    void onCleanup(CleanupCallback callback) { m_onCleanup = std::move(callback); }

    /// @brief Called after an overlay is created
    void onAttached(HandleCallback callback) { m_onAttached = std::move(callback); }

    /// @brief Called after the overlay is removed or found stale
    void onDetached(HandleCallback callback) { m_onDetached = std::move(callback); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Ensure an overlay exists
     *
     * No-op while a verified overlay is attached or creation is in progress.
     * Otherwise creates the overlay immediately if the map is ready, or waits
     * for the map's load/style-load event bounded by readinessTimeoutMs.
     */
    void attach();

    /**
     * @brief Push new layers into the attached overlay
     *
     * Has no effect while nothing is attached.
     */
    void update(const std::vector<AnimatedLayerSpec>& layers);

    /// @brief Push a camera into the attached overlay
    void pushViewState(const ViewState& view);

    /// @brief Remove the overlay and abort any pending attach
    void detach();

    /**
     * @brief Check the stored handle against the host map
     * @return true if a live overlay is attached
     *
     * A handle the map no longer knows is discarded and the manager returns
     * to Idle.
     */
    bool verify();

    /**
     * @brief End the lifecycle
     *
     * Detaches and fires the cleanup callback with Stopped unless a cleanup
     * notification was already sent.
     */
    void shutdown();

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    OverlayState state() const { return m_state; }
    OverlayHandle handle() const { return m_handle; }
    bool isAttached() const { return m_state == OverlayState::Attached && m_handle.valid(); }

    /// @brief Successful addOverlay() calls since construction
    uint64_t creationCount() const { return m_creations; }

    /// @brief True if the current overlay was created after a readiness timeout
    bool degradedStart() const { return m_degradedStart; }

    bool cleanupNotified() const { return m_cleanupNotified; }

    bool hasError() const { return !m_error.empty(); }
    const std::string& errorMessage() const { return m_error; }

    const OverlaySettings& settings() const { return m_settings; }
    void configure(const OverlaySettings& settings) { m_settings = settings; }

    /// @}

private:
    void transition(OverlayState next);
    bool anyVisible() const;
    void waitForReady();
    void cancelReadinessWait();
    void onReady(const char* source);
    void onReadinessTimeout();
    void create();
    void fail(const std::string& reason, const std::string& message);
    void discardHandle();
    void notifyCleanup(const CleanupDetail& detail);

    HostMap& m_map;
    RunLoop& m_loop;
    OverlaySettings m_settings;

    LayerSource m_layerSource;
    VisibilityQuery m_visibilityQuery;
    CleanupCallback m_onCleanup;
    HandleCallback m_onAttached;
    HandleCallback m_onDetached;

    OverlayState m_state = OverlayState::Idle;
    OverlayHandle m_handle;

    SubscriptionId m_loadSub = 0;
    SubscriptionId m_styleLoadSub = 0;
    TimerId m_readinessTimer = 0;

    uint64_t m_creations = 0;
    bool m_degradedStart = false;
    bool m_cleanupNotified = false;
    std::string m_error;
};

} // namespace flowmap
