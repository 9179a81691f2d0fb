// Flowmap - Performance Monitor Implementation

#include <flowmap/performance_monitor.h>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace flowmap {

namespace {

PerformanceSettings sanitize(PerformanceSettings s) {
    if (s.recoverFps < s.lowFps) s.recoverFps = s.lowFps;
    if (s.confirmSamples < 1) s.confirmSamples = 1;
    if (s.sampleWindowMs <= 0.0) s.sampleWindowMs = 1000.0;
    if (s.targetFps <= 0.0) s.targetFps = 60.0;
    if (s.historySize == 0) s.historySize = 1;
    return s;
}

} // namespace

PerformanceMonitor::PerformanceMonitor(PerformanceSettings settings)
    : m_settings(sanitize(settings)), m_currentFps(m_settings.targetFps) {}

PerformanceMonitor::~PerformanceMonitor() {
    stop();
}

void PerformanceMonitor::start(RunLoop& loop) {
    if (m_loop == &loop) return;
    stop();

    m_loop = &loop;
    m_windowStart = -1.0;
    m_windowFrames = 0;
    m_frameId = m_loop->requestFrame([this](double t) { onFrame(t); });
}

void PerformanceMonitor::stop() {
    if (m_loop && m_frameId != 0) {
        m_loop->cancelFrame(m_frameId);
    }
    m_frameId = 0;
    m_loop = nullptr;
}

void PerformanceMonitor::configure(const PerformanceSettings& settings) {
    m_settings = sanitize(settings);
    m_crossingRun = 0;
    while (m_history.size() > m_settings.historySize) {
        m_history.pop_front();
    }
}

double PerformanceMonitor::performanceRatio() const {
    return m_currentFps / m_settings.targetFps;
}

void PerformanceMonitor::onFrame(double timestampMs) {
    m_frameId = 0;
    if (!m_loop) return;

    if (m_windowStart < 0.0) {
        m_windowStart = timestampMs;
    } else {
        ++m_windowFrames;
        const double elapsed = timestampMs - m_windowStart;
        if (elapsed >= m_settings.sampleWindowMs) {
            recordSample(std::round(m_windowFrames * 1000.0 / elapsed));
            m_windowFrames = 0;
            m_windowStart = timestampMs;
        }
    }

    m_frameId = m_loop->requestFrame([this](double t) { onFrame(t); });
}

void PerformanceMonitor::recordSample(double fps) {
    m_currentFps = fps;
    ++m_sampleCount;
    m_history.push_back(fps);
    while (m_history.size() > m_settings.historySize) {
        m_history.pop_front();
    }

    const bool crossing = m_lowPerformance ? fps >= m_settings.recoverFps
                                           : fps < m_settings.lowFps;
    if (!crossing) {
        m_crossingRun = 0;
        return;
    }

    if (++m_crossingRun < m_settings.confirmSamples) return;

    m_crossingRun = 0;
    m_lowPerformance = !m_lowPerformance;
    ++m_transitions;

    if (m_lowPerformance) {
        std::cerr << "[PerformanceMonitor] Low FPS: " << fps
                  << " (threshold " << m_settings.lowFps << "), reducing decorative work\n";
    } else {
        std::cout << "[PerformanceMonitor] FPS recovered: " << fps << "\n";
    }
}

} // namespace flowmap
