#pragma once

/**
 * @file camera_sync.h
 * @brief Keeps the overlay camera aligned with the host map camera
 *
 * While connected, every render / move-start / zoom-start / pitch-start /
 * rotate-start event schedules a sync on the next frame. A scheduled flag
 * coalesces bursts: no matter how many camera events fire within a frame,
 * at most one sync runs for it.
 */

#include <flowmap/host_map.h>
#include <flowmap/run_loop.h>
#include <flowmap/types.h>

#include <cstdint>
#include <functional>
#include <vector>

namespace flowmap {

class CameraSyncBridge {
public:
    /// Receives the camera to push into the overlay
    using ViewStateSink = std::function<void(const ViewState&)>;

    CameraSyncBridge(HostMap& map, RunLoop& loop, ViewStateSink sink);
    ~CameraSyncBridge();

    CameraSyncBridge(const CameraSyncBridge&) = delete;
    CameraSyncBridge& operator=(const CameraSyncBridge&) = delete;

    /// @brief Subscribe to camera events (no-op when already connected)
    void connect();

    /// @brief Unsubscribe and cancel any pending sync
    void disconnect();

    bool connected() const { return !m_subscriptions.empty(); }

    /// @brief Schedule a sync on the next frame unless one is pending
    void requestSync();

    /// @brief Read the camera and push it now
    void syncNow();

    bool syncPending() const { return m_frameId != 0; }

    /// @brief Syncs performed since construction
    uint64_t syncCount() const { return m_syncs; }

    /// @brief Camera events received since construction
    uint64_t eventCount() const { return m_events; }

    /// @brief Last camera pushed
    const ViewState& lastViewState() const { return m_last; }

private:
    HostMap& m_map;
    RunLoop& m_loop;
    ViewStateSink m_sink;

    std::vector<SubscriptionId> m_subscriptions;
    FrameId m_frameId = 0;
    uint64_t m_syncs = 0;
    uint64_t m_events = 0;
    ViewState m_last;
};

} // namespace flowmap
