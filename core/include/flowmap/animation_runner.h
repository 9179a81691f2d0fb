#pragma once

/**
 * @file animation_runner.h
 * @brief Visibility-driven frame scheduling for one animation clock
 *
 * The runner owns a clock and keeps exactly one frame request pending while
 * its animation is visible. Hiding cancels that request and resets the clock
 * in the same call, so no later frame can observe torn-down state. A frame
 * callback that was already queued re-checks visibility before touching the
 * clock.
 */

#include <flowmap/animation_clock.h>
#include <flowmap/run_loop.h>

#include <functional>
#include <memory>
#include <string>

namespace flowmap {

class AnimationRunner {
public:
    using TickCallback = std::function<void(const AnimationRunner&)>;

    /**
     * @brief Construct a runner
     * @param id Animation id (matches the layer id)
     * @param loop Run loop used for frame requests
     * @param clock Clock to drive (takes ownership)
     */
    AnimationRunner(std::string id, RunLoop& loop, std::unique_ptr<AnimationClock> clock);
    ~AnimationRunner();

    AnimationRunner(const AnimationRunner&) = delete;
    AnimationRunner& operator=(const AnimationRunner&) = delete;

    /**
     * @brief Show or hide the animation
     *
     * Showing schedules the next frame. Hiding cancels the pending frame and
     * resets the clock. Repeated calls with the same value do nothing.
     */
    void setVisible(bool visible);
    bool visible() const { return m_visible; }

    /// @brief True while a frame request is outstanding
    bool hasActiveClock() const { return m_frameId != 0; }

    /// @brief Called after every clock advance
    void onTick(TickCallback callback) { m_onTick = std::move(callback); }

    const std::string& id() const { return m_id; }
    const AnimationClock& clock() const { return *m_clock; }
    AnimationClock& clock() { return *m_clock; }

    /// @brief Number of frames the clock has advanced since construction
    uint64_t tickCount() const { return m_ticks; }

private:
    void schedule();
    void onFrame(double timestampMs);

    std::string m_id;
    RunLoop& m_loop;
    std::unique_ptr<AnimationClock> m_clock;
    TickCallback m_onTick;
    FrameId m_frameId = 0;
    uint64_t m_ticks = 0;
    bool m_visible = false;
};

} // namespace flowmap
