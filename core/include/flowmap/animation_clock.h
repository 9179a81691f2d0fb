#pragma once

/**
 * @file animation_clock.h
 * @brief Frame-driven clocks behind the animated layers
 *
 * Two archetypes:
 * - PulseClock maps elapsed time through a periodic waveform into [min, max]
 * - TripClock accumulates frame deltas into a time cursor that wraps at the
 *   loop length
 *
 * Clocks are fed frame timestamps by an AnimationRunner and are reset when
 * their animation is hidden, so every show starts from the same phase.
 */

#include <string>

namespace flowmap {

/**
 * @brief Base class for animation clocks
 */
class AnimationClock {
public:
    virtual ~AnimationClock() = default;

    /**
     * @brief Feed a frame timestamp
     * @param timestampMs Frame time in milliseconds
     *
     * The first timestamp after construction or reset() defines t = 0.
     */
    virtual void advance(double timestampMs) = 0;

    /// @brief Return to the initial phase and forget the last timestamp
    virtual void reset() = 0;

    /// @brief Current clock output (pulse value or trip time)
    virtual double output() const = 0;

    /// @brief True once a timestamp has been received since the last reset
    virtual bool started() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Waveform shapes for PulseClock
 *
 * Every shape starts at its minimum at t = 0.
 */
enum class PulseWaveform {
    Sine,      ///< Smooth rise and fall
    Triangle,  ///< Linear rise and fall
    Saw,       ///< Linear rise, sharp reset
    Square     ///< Low for pulseWidth of the period, then high
};

const char* pulseWaveformName(PulseWaveform waveform);
bool parsePulseWaveform(const std::string& name, PulseWaveform& out);

/**
 * @brief Periodic clock producing a value in [min, max]
 *
 * @par Example
 * @code
 * PulseClock radius;
 * radius.period(3000.0).range(500.0, 2000.0);
 * radius.advance(now);
 * double r = radius.value();
 * @endcode
 */
class PulseClock : public AnimationClock {
public:
    PulseClock() = default;
    PulseClock(double periodMs, double minValue, double maxValue,
               PulseWaveform waveform = PulseWaveform::Sine);

    // -------------------------------------------------------------------------
    /// @name Fluent API
    /// @{

    PulseClock& period(double ms) { m_period = ms; return *this; }
    PulseClock& range(double minValue, double maxValue) { m_min = minValue; m_max = maxValue; return *this; }
    PulseClock& waveform(PulseWaveform w) { m_waveform = w; return *this; }
    PulseClock& pulseWidth(double w) { m_pulseWidth = w; return *this; }

    /// @}

    void advance(double timestampMs) override;
    void reset() override;
    double output() const override { return value(); }
    bool started() const override { return m_started; }
    std::string name() const override { return "PulseClock"; }

    /// @brief Current value in [min, max]
    double value() const { return m_min + m_phaseValue * (m_max - m_min); }

    /// @brief Position within the current period (0-1)
    double progress() const { return m_progress; }

    /// @brief Milliseconds since the first timestamp
    double elapsed() const { return m_elapsed; }

    double periodMs() const { return m_period; }
    double minValue() const { return m_min; }
    double maxValue() const { return m_max; }

    /**
     * @brief Evaluate a waveform at a period position
     * @param waveform Shape
     * @param progress Position within the period (0-1)
     * @param pulseWidth Low fraction for Square
     * @return Normalized value (0-1), 0 at progress 0
     */
    static double shape(PulseWaveform waveform, double progress, double pulseWidth = 0.5);

private:
    double m_period = 3000.0;
    double m_min = 0.0;
    double m_max = 1.0;
    double m_pulseWidth = 0.5;
    PulseWaveform m_waveform = PulseWaveform::Sine;

    double m_startTime = 0.0;
    double m_elapsed = 0.0;
    double m_progress = 0.0;
    double m_phaseValue = 0.0;
    bool m_started = false;
};

/**
 * @brief Looping time cursor driven by frame deltas
 *
 * Absolute timestamps are only used to derive deltas, so scheduling jitter
 * and pauses (frames simply not delivered while hidden) never make the
 * cursor jump.
 */
class TripClock : public AnimationClock {
public:
    TripClock() = default;
    explicit TripClock(double loopLengthMs) : m_loopLength(loopLengthMs) {}

    TripClock& loopLength(double ms) { m_loopLength = ms; return *this; }

    void advance(double timestampMs) override;
    void reset() override;
    double output() const override { return m_currentTime; }
    bool started() const override { return m_hasLastFrame; }
    std::string name() const override { return "TripClock"; }

    /**
     * @brief Add a delta directly
     * @param deltaMs Milliseconds to add (negative deltas are ignored)
     */
    void accumulate(double deltaMs);

    double currentTime() const { return m_currentTime; }
    double loopLengthMs() const { return m_loopLength; }
    double lastFrameTime() const { return m_lastFrame; }

private:
    double m_loopLength = 150000.0;
    double m_currentTime = 0.0;
    double m_lastFrame = 0.0;
    bool m_hasLastFrame = false;
};

} // namespace flowmap
