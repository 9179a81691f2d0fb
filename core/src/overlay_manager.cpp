// Flowmap - Overlay Manager Implementation

#include <flowmap/overlay_manager.h>

#include <exception>
#include <iostream>

namespace flowmap {

const char* overlayStateName(OverlayState state) {
    switch (state) {
        case OverlayState::Idle:            return "idle";
        case OverlayState::WaitingForReady: return "waiting-for-ready";
        case OverlayState::Creating:        return "creating";
        case OverlayState::Attached:        return "attached";
        case OverlayState::Failed:          return "failed";
    }
    return "unknown";
}

OverlayManager::OverlayManager(HostMap& map, RunLoop& loop, OverlaySettings settings)
    : m_map(map), m_loop(loop), m_settings(settings) {}

OverlayManager::~OverlayManager() {
    cancelReadinessWait();
    if (m_handle) {
        try {
            m_map.removeOverlay(m_handle);
        } catch (const std::exception& e) {
            std::cerr << "[OverlayManager] Failed to remove overlay on destruction: " << e.what() << "\n";
        }
        m_handle = {};
    }
}

void OverlayManager::transition(OverlayState next) {
    if (next == m_state) return;
    std::cout << "[OverlayManager] " << overlayStateName(m_state) << " -> "
              << overlayStateName(next) << "\n";
    m_state = next;
}

bool OverlayManager::anyVisible() const {
    return m_visibilityQuery ? m_visibilityQuery() : true;
}

// -----------------------------------------------------------------------------
// Lifecycle

void OverlayManager::attach() {
    if (m_state == OverlayState::Attached && verify()) {
        return;
    }
    if (m_state == OverlayState::WaitingForReady || m_state == OverlayState::Creating) {
        return;
    }
    if (!anyVisible()) {
        return;
    }
    if (m_state == OverlayState::Failed) {
        transition(OverlayState::Idle);
    }

    m_degradedStart = false;

    bool ready = false;
    try {
        ready = m_map.isStyleLoaded();
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] Readiness check failed: " << e.what() << "\n";
    }

    if (ready) {
        create();
    } else {
        waitForReady();
    }
}

void OverlayManager::waitForReady() {
    std::cout << "[OverlayManager] Map not loaded yet, waiting for load event...\n";
    transition(OverlayState::WaitingForReady);

    m_readinessTimer = m_loop.setTimeout([this]() { onReadinessTimeout(); },
                                         m_settings.readinessTimeoutMs);
    m_loadSub = m_map.once(MapEvent::Load, [this]() { onReady("load"); });
    m_styleLoadSub = m_map.once(MapEvent::StyleLoad, [this]() { onReady("style.load"); });
}

void OverlayManager::cancelReadinessWait() {
    if (m_readinessTimer != 0) {
        m_loop.clearTimeout(m_readinessTimer);
        m_readinessTimer = 0;
    }
    if (m_loadSub != 0) {
        m_map.off(m_loadSub);
        m_loadSub = 0;
    }
    if (m_styleLoadSub != 0) {
        m_map.off(m_styleLoadSub);
        m_styleLoadSub = 0;
    }
}

void OverlayManager::onReady(const char* source) {
    if (m_state != OverlayState::WaitingForReady) return;
    std::cout << "[OverlayManager] Map " << source << " event fired\n";
    cancelReadinessWait();
    create();
}

void OverlayManager::onReadinessTimeout() {
    m_readinessTimer = 0;
    if (m_state != OverlayState::WaitingForReady) return;
    cancelReadinessWait();

    if (m_settings.failOnReadinessTimeout) {
        std::cerr << "[OverlayManager] Timeout waiting for map after "
                  << m_settings.readinessTimeoutMs << " ms\n";
        fail("readiness_timeout", "Host map not ready within timeout");
        return;
    }

    std::cerr << "[OverlayManager] Timeout waiting for map, proceeding anyway (degraded start)\n";
    m_degradedStart = true;
    create();
}

void OverlayManager::create() {
    if (!anyVisible()) {
        std::cout << "[OverlayManager] Animation no longer visible, aborting overlay creation\n";
        transition(OverlayState::Idle);
        return;
    }

    transition(OverlayState::Creating);

    std::vector<AnimatedLayerSpec> layers;
    if (m_layerSource) layers = m_layerSource();
    if (layers.empty()) {
        std::cout << "[OverlayManager] No layers to render yet, creating overlay anyway\n";
    }

    OverlayHandle handle;
    try {
        handle = m_map.addOverlay(layers);
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] Failed to add overlay: " << e.what() << "\n";
        fail("overlay_add_failed", e.what());
        return;
    }
    if (!handle) {
        std::cerr << "[OverlayManager] Failed to add overlay: invalid handle\n";
        fail("overlay_add_failed", "Host map returned an invalid overlay handle");
        return;
    }

    m_handle = handle;
    ++m_creations;
    m_error.clear();
    transition(OverlayState::Attached);
    std::cout << "[OverlayManager] Overlay added with " << layers.size() << " layer(s)\n";

    // Align with the camera right away; camera sync takes over from here
    try {
        m_map.setOverlayViewState(m_handle, m_map.viewState());
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] Initial view state sync failed: " << e.what() << "\n";
    }

    if (m_onAttached) m_onAttached(m_handle);
}

void OverlayManager::fail(const std::string& reason, const std::string& message) {
    m_handle = {};
    m_error = message;
    transition(OverlayState::Failed);
    notifyCleanup(CleanupDetail{CleanupStatus::Failed, reason, message});
}

void OverlayManager::update(const std::vector<AnimatedLayerSpec>& layers) {
    if (!isAttached()) return;
    try {
        m_map.setOverlayLayers(m_handle, layers);
        m_map.triggerRepaint();
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] Failed to update overlay: " << e.what() << "\n";
    }
}

void OverlayManager::pushViewState(const ViewState& view) {
    if (!isAttached()) return;
    try {
        m_map.setOverlayViewState(m_handle, view);
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] View state sync failed: " << e.what() << "\n";
    }
}

void OverlayManager::detach() {
    cancelReadinessWait();

    if (m_handle) {
        try {
            m_map.removeOverlay(m_handle);
            std::cout << "[OverlayManager] Overlay removed\n";
        } catch (const std::exception& e) {
            std::cerr << "[OverlayManager] Failed to remove overlay: " << e.what() << "\n";
        }
        discardHandle();
        return;
    }

    transition(OverlayState::Idle);
}

bool OverlayManager::verify() {
    if (!m_handle) return false;

    bool attached = false;
    try {
        attached = m_map.isAttached(m_handle);
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] Error checking overlay: " << e.what() << "\n";
    }
    if (attached) return true;

    std::cerr << "[OverlayManager] Overlay handle " << m_handle.id
              << " no longer attached, discarding\n";
    discardHandle();
    return false;
}

void OverlayManager::discardHandle() {
    OverlayHandle old = m_handle;
    m_handle = {};
    transition(OverlayState::Idle);
    if (m_onDetached) m_onDetached(old);
}

void OverlayManager::shutdown() {
    detach();
    notifyCleanup(CleanupDetail{CleanupStatus::Stopped, "", ""});
}

void OverlayManager::notifyCleanup(const CleanupDetail& detail) {
    if (m_cleanupNotified) return;
    m_cleanupNotified = true;
    if (!m_onCleanup) return;

    try {
        m_onCleanup(detail);
    } catch (const std::exception& e) {
        std::cerr << "[OverlayManager] onCleanup error: " << e.what() << "\n";
    }
}

} // namespace flowmap
