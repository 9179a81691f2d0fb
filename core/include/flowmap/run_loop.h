#pragma once

/**
 * @file run_loop.h
 * @brief Single-threaded frame and timer primitive
 *
 * RunLoop is the cooperative scheduler every component runs on. It offers
 * the two primitives the overlay needs:
 * - frame callbacks (requestFrame/cancelFrame), run once per frame
 * - timers (setTimeout/clearTimeout), run when the clock passes their due time
 *
 * The host drives the loop: call advance() as wall-clock time passes and
 * frame() once per rendered frame. Tests drive it the same way, which makes
 * every timing-dependent behavior deterministic.
 *
 * @par Example
 * @code
 * RunLoop loop;
 * loop.requestFrame([](double t) { std::cout << "frame at " << t << "\n"; });
 *
 * while (running) {
 *     loop.step(16.0);  // advance 16 ms, then run one frame
 * }
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <map>

namespace flowmap {

using FrameId = uint64_t;
using TimerId = uint64_t;
using ObserverId = uint64_t;

/// Frame callback, receives the frame timestamp in milliseconds
using FrameCallback = std::function<void(double timestampMs)>;
using TimerCallback = std::function<void()>;

class RunLoop {
public:
    RunLoop() = default;
    ~RunLoop() = default;

    RunLoop(const RunLoop&) = delete;
    RunLoop& operator=(const RunLoop&) = delete;

    // -------------------------------------------------------------------------
    /// @name Frames
    /// @{

    /**
     * @brief Request a callback on the next frame
     * @return Id usable with cancelFrame(), never 0
     *
     * A request made while a frame is running is deferred to the next frame.
     */
    FrameId requestFrame(FrameCallback callback);

    /// @brief Cancel a pending frame callback (unknown ids are ignored)
    void cancelFrame(FrameId id);

    /**
     * @brief Observe the end of every frame
     *
     * Observers run after all frame callbacks of the frame, in registration
     * order. Used to apply work accumulated during the frame exactly once.
     */
    ObserverId addFrameEndObserver(FrameCallback observer);
    void removeFrameEndObserver(ObserverId id);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Timers
    /// @{

    /**
     * @brief Run a callback once after a delay
     * @param callback Function to run
     * @param delayMs Delay in milliseconds (negative is treated as 0)
     * @return Id usable with clearTimeout(), never 0
     */
    TimerId setTimeout(TimerCallback callback, double delayMs);

    /// @brief Cancel a pending timer (unknown ids are ignored)
    void clearTimeout(TimerId id);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Driving
    /// @{

    /**
     * @brief Advance the clock, firing due timers in due-time order
     * @param ms Milliseconds to advance
     *
     * Timers scheduled by a firing timer also fire if they fall due inside
     * the advanced interval.
     */
    void advance(double ms);

    /// @brief Run one frame at the current time
    void frame();

    /// @brief advance(ms) followed by frame()
    void step(double ms) { advance(ms); frame(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    /// @brief Current time in milliseconds
    double now() const { return m_now; }

    /// @brief Number of frames run so far
    uint64_t frameCount() const { return m_frameCount; }

    /// @brief True while frame callbacks or observers are running
    bool inFrame() const { return m_inFrame; }

    size_t pendingFrames() const { return m_frames.size() + m_currentFrame.size(); }
    size_t pendingTimers() const { return m_timers.size(); }
    bool isFramePending(FrameId id) const;
    bool isTimerPending(TimerId id) const;

    /// @}

private:
    struct Timer {
        double due = 0.0;
        TimerCallback callback;
    };

    double m_now = 0.0;
    uint64_t m_frameCount = 0;
    uint64_t m_nextId = 1;
    bool m_inFrame = false;

    std::map<FrameId, FrameCallback> m_frames;        // Requested for the next frame
    std::map<FrameId, FrameCallback> m_currentFrame;  // Still to run in the current frame
    std::map<TimerId, Timer> m_timers;
    std::map<ObserverId, FrameCallback> m_frameEndObservers;
};

} // namespace flowmap
