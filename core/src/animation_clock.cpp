// Flowmap - Animation Clocks Implementation

#include <flowmap/animation_clock.h>

#include <algorithm>
#include <cmath>

namespace flowmap {

namespace {
constexpr double TAU = 6.28318530717958647692;
// Fraction of the loop length treated as having reached the end
constexpr double WRAP_TOLERANCE = 1e-9;
}

const char* pulseWaveformName(PulseWaveform waveform) {
    switch (waveform) {
        case PulseWaveform::Sine:     return "sine";
        case PulseWaveform::Triangle: return "triangle";
        case PulseWaveform::Saw:      return "saw";
        case PulseWaveform::Square:   return "square";
    }
    return "sine";
}

bool parsePulseWaveform(const std::string& name, PulseWaveform& out) {
    if (name == "sine")     { out = PulseWaveform::Sine; return true; }
    if (name == "triangle") { out = PulseWaveform::Triangle; return true; }
    if (name == "saw")      { out = PulseWaveform::Saw; return true; }
    if (name == "square")   { out = PulseWaveform::Square; return true; }
    return false;
}

// -----------------------------------------------------------------------------
// PulseClock

PulseClock::PulseClock(double periodMs, double minValue, double maxValue, PulseWaveform waveform)
    : m_period(periodMs), m_min(minValue), m_max(maxValue), m_waveform(waveform) {}

double PulseClock::shape(PulseWaveform waveform, double progress, double pulseWidth) {
    switch (waveform) {
        case PulseWaveform::Sine:
            return 0.5 - 0.5 * std::cos(progress * TAU);
        case PulseWaveform::Triangle:
            return 1.0 - std::abs(progress * 2.0 - 1.0);
        case PulseWaveform::Saw:
            return progress;
        case PulseWaveform::Square:
            return progress < pulseWidth ? 0.0 : 1.0;
    }
    return 0.0;
}

void PulseClock::advance(double timestampMs) {
    if (!m_started) {
        m_started = true;
        m_startTime = timestampMs;
    }

    m_elapsed = std::max(0.0, timestampMs - m_startTime);
    m_progress = m_period > 0.0 ? std::fmod(m_elapsed, m_period) / m_period : 0.0;
    m_phaseValue = shape(m_waveform, m_progress, m_pulseWidth);
}

void PulseClock::reset() {
    m_started = false;
    m_startTime = 0.0;
    m_elapsed = 0.0;
    m_progress = 0.0;
    m_phaseValue = 0.0;
}

// -----------------------------------------------------------------------------
// TripClock

void TripClock::advance(double timestampMs) {
    if (!m_hasLastFrame) {
        m_hasLastFrame = true;
        m_lastFrame = timestampMs;
        return;
    }
    const double delta = timestampMs - m_lastFrame;
    m_lastFrame = timestampMs;
    accumulate(delta);
}

void TripClock::accumulate(double deltaMs) {
    if (!(deltaMs > 0.0)) return;
    if (m_loopLength <= 0.0) {
        m_currentTime = 0.0;
        return;
    }
    double next = m_currentTime + deltaMs;
    if (next >= m_loopLength) {
        next = std::fmod(next, m_loopLength);
    }
    // Summed frame deltas drift just short of the loop end
    if (m_loopLength - next <= m_loopLength * WRAP_TOLERANCE) {
        next = 0.0;
    }
    m_currentTime = next;
}

void TripClock::reset() {
    m_currentTime = 0.0;
    m_lastFrame = 0.0;
    m_hasLastFrame = false;
}

} // namespace flowmap
