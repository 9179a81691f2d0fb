// Flowmap - Camera Sync Bridge Implementation

#include <flowmap/camera_sync.h>

#include <exception>
#include <initializer_list>
#include <iostream>

namespace flowmap {

CameraSyncBridge::CameraSyncBridge(HostMap& map, RunLoop& loop, ViewStateSink sink)
    : m_map(map), m_loop(loop), m_sink(std::move(sink)) {}

CameraSyncBridge::~CameraSyncBridge() {
    disconnect();
}

void CameraSyncBridge::connect() {
    if (connected()) return;

    for (MapEvent event : {MapEvent::Render, MapEvent::MoveStart, MapEvent::ZoomStart,
                           MapEvent::PitchStart, MapEvent::RotateStart}) {
        m_subscriptions.push_back(m_map.on(event, [this]() {
            ++m_events;
            requestSync();
        }));
    }
}

void CameraSyncBridge::disconnect() {
    for (SubscriptionId id : m_subscriptions) {
        m_map.off(id);
    }
    m_subscriptions.clear();

    if (m_frameId != 0) {
        m_loop.cancelFrame(m_frameId);
        m_frameId = 0;
    }
}

void CameraSyncBridge::requestSync() {
    if (m_frameId != 0) return;
    m_frameId = m_loop.requestFrame([this](double) {
        m_frameId = 0;
        syncNow();
    });
}

void CameraSyncBridge::syncNow() {
    try {
        m_last = m_map.viewState();
    } catch (const std::exception& e) {
        std::cerr << "[CameraSync] Reading host camera failed: " << e.what() << "\n";
        return;
    }
    ++m_syncs;
    if (m_sink) m_sink(m_last);
}

} // namespace flowmap
