// Flowmap - Animation Runner Implementation

#include <flowmap/animation_runner.h>

namespace flowmap {

AnimationRunner::AnimationRunner(std::string id, RunLoop& loop, std::unique_ptr<AnimationClock> clock)
    : m_id(std::move(id)), m_loop(loop), m_clock(std::move(clock)) {}

AnimationRunner::~AnimationRunner() {
    if (m_frameId != 0) {
        m_loop.cancelFrame(m_frameId);
        m_frameId = 0;
    }
}

void AnimationRunner::setVisible(bool visible) {
    if (visible == m_visible) return;
    m_visible = visible;

    if (visible) {
        m_clock->reset();
        schedule();
    } else {
        if (m_frameId != 0) {
            m_loop.cancelFrame(m_frameId);
            m_frameId = 0;
        }
        m_clock->reset();
    }
}

void AnimationRunner::schedule() {
    if (m_frameId != 0) return;
    m_frameId = m_loop.requestFrame([this](double timestampMs) { onFrame(timestampMs); });
}

void AnimationRunner::onFrame(double timestampMs) {
    m_frameId = 0;
    if (!m_visible) return;

    m_clock->advance(timestampMs);
    ++m_ticks;
    if (m_onTick) m_onTick(*this);

    // The tick observer may have hidden us
    if (m_visible) schedule();
}

} // namespace flowmap
