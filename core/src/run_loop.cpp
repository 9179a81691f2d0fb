// Flowmap - Run Loop Implementation

#include <flowmap/run_loop.h>

#include <algorithm>
#include <vector>

namespace flowmap {

FrameId RunLoop::requestFrame(FrameCallback callback) {
    FrameId id = m_nextId++;
    m_frames.emplace(id, std::move(callback));
    return id;
}

void RunLoop::cancelFrame(FrameId id) {
    m_frames.erase(id);
    m_currentFrame.erase(id);
}

ObserverId RunLoop::addFrameEndObserver(FrameCallback observer) {
    ObserverId id = m_nextId++;
    m_frameEndObservers.emplace(id, std::move(observer));
    return id;
}

void RunLoop::removeFrameEndObserver(ObserverId id) {
    m_frameEndObservers.erase(id);
}

TimerId RunLoop::setTimeout(TimerCallback callback, double delayMs) {
    TimerId id = m_nextId++;
    m_timers.emplace(id, Timer{m_now + std::max(0.0, delayMs), std::move(callback)});
    return id;
}

void RunLoop::clearTimeout(TimerId id) {
    m_timers.erase(id);
}

bool RunLoop::isFramePending(FrameId id) const {
    return m_frames.count(id) > 0 || m_currentFrame.count(id) > 0;
}

bool RunLoop::isTimerPending(TimerId id) const {
    return m_timers.count(id) > 0;
}

void RunLoop::advance(double ms) {
    const double target = m_now + std::max(0.0, ms);

    while (true) {
        // Earliest due timer; ties resolve to the earliest scheduled (lowest id)
        auto next = m_timers.end();
        for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
            if (it->second.due > target) continue;
            if (next == m_timers.end() || it->second.due < next->second.due) {
                next = it;
            }
        }
        if (next == m_timers.end()) break;

        m_now = std::max(m_now, next->second.due);
        TimerCallback callback = std::move(next->second.callback);
        m_timers.erase(next);
        if (callback) callback();
    }

    m_now = target;
}

void RunLoop::frame() {
    m_inFrame = true;
    ++m_frameCount;
    const double timestamp = m_now;

    // Requests made from inside this frame land in m_frames for the next one
    m_currentFrame.swap(m_frames);
    while (!m_currentFrame.empty()) {
        auto it = m_currentFrame.begin();
        FrameCallback callback = std::move(it->second);
        m_currentFrame.erase(it);
        if (callback) callback(timestamp);
    }

    // Copy ids so observers may unregister themselves or others
    std::vector<ObserverId> observers;
    observers.reserve(m_frameEndObservers.size());
    for (const auto& entry : m_frameEndObservers) {
        observers.push_back(entry.first);
    }
    for (ObserverId id : observers) {
        auto it = m_frameEndObservers.find(id);
        if (it != m_frameEndObservers.end() && it->second) {
            FrameCallback observer = it->second;
            observer(timestamp);
        }
    }

    m_inFrame = false;
}

} // namespace flowmap
