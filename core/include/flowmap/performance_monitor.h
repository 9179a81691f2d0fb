#pragma once

/**
 * @file performance_monitor.h
 * @brief Frame-rate sampling with a hysteresis "low performance" flag
 *
 * The monitor counts frames through a repeating frame request and converts
 * the count to a rate once per sample window. The low-performance flag only
 * flips on samples that actually cross a threshold:
 * - normal -> low when the rate drops below lowFps
 * - low -> normal when the rate reaches recoverFps
 *
 * confirmSamples consecutive crossing samples are needed to flip. The
 * default of 1 reacts fastest but lets a noisy rate near a threshold flap.
 */

#include <flowmap/run_loop.h>

#include <cstdint>
#include <deque>

namespace flowmap {

/**
 * @brief Performance monitor tuning
 */
struct PerformanceSettings {
    double lowFps = 20.0;          ///< Flip to low below this rate
    double recoverFps = 30.0;      ///< Flip back at or above this rate (>= lowFps)
    int confirmSamples = 1;        ///< Consecutive crossing samples required
    double sampleWindowMs = 1000.0;
    double targetFps = 60.0;       ///< Reference for performanceRatio()
    size_t historySize = 60;       ///< Rates kept in history()
};

class PerformanceMonitor {
public:
    explicit PerformanceMonitor(PerformanceSettings settings = {});
    ~PerformanceMonitor();

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    /**
     * @brief Start sampling frames on a run loop
     *
     * Calling start() while running on the same loop does nothing.
     */
    void start(RunLoop& loop);

    /// @brief Stop sampling and cancel the pending frame request
    void stop();

    bool running() const { return m_loop != nullptr; }

    /**
     * @brief Feed one rate sample
     * @param fps Frames per second measured over one window
     *
     * Called by the frame sampler; exposed so hosts with their own frame
     * statistics can drive the monitor directly.
     */
    void recordSample(double fps);

    /// @brief Replace settings (hysteresis counters are reset)
    void configure(const PerformanceSettings& settings);
    const PerformanceSettings& settings() const { return m_settings; }

    /// @brief Most recent rate (targetFps until the first sample)
    double currentFps() const { return m_currentFps; }

    /// @brief Hysteresis flag: skip decorative work while true
    bool isLowPerformance() const { return m_lowPerformance; }

    /// @brief currentFps() / targetFps
    double performanceRatio() const;

    const std::deque<double>& history() const { return m_history; }
    uint64_t sampleCount() const { return m_sampleCount; }

    /// @brief Number of times the flag changed
    uint64_t transitionCount() const { return m_transitions; }

private:
    void onFrame(double timestampMs);

    PerformanceSettings m_settings;
    RunLoop* m_loop = nullptr;
    FrameId m_frameId = 0;

    double m_windowStart = -1.0;
    uint64_t m_windowFrames = 0;

    double m_currentFps = 0.0;
    bool m_lowPerformance = false;
    int m_crossingRun = 0;
    uint64_t m_sampleCount = 0;
    uint64_t m_transitions = 0;
    std::deque<double> m_history;
};

} // namespace flowmap
