/**
 * @file test_animation_clock.cpp
 * @brief Unit tests for PulseClock and TripClock
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flowmap/animation_clock.h>

#include <initializer_list>

using namespace flowmap;
using Catch::Matchers::WithinAbs;

TEST_CASE("PulseClock defaults and fluent API", "[unit][clock]") {
    PulseClock clock;

    SECTION("defaults") {
        REQUIRE_THAT(clock.periodMs(), WithinAbs(3000.0, 1e-9));
        REQUIRE_FALSE(clock.started());
        REQUIRE(clock.name() == "PulseClock");
    }

    SECTION("setters chain") {
        PulseClock& ref = clock.period(1000.0).range(10.0, 20.0).waveform(PulseWaveform::Saw);
        REQUIRE(&ref == &clock);
        REQUIRE_THAT(clock.periodMs(), WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(clock.minValue(), WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(clock.maxValue(), WithinAbs(20.0, 1e-9));
    }
}

TEST_CASE("PulseClock sine output", "[unit][clock]") {
    PulseClock clock(3000.0, 500.0, 2000.0);

    SECTION("first timestamp is t = 0 and outputs the minimum") {
        clock.advance(12345.0);
        REQUIRE(clock.started());
        REQUIRE_THAT(clock.elapsed(), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(clock.value(), WithinAbs(500.0, 1e-6));
    }

    SECTION("half period reaches the maximum") {
        clock.advance(0.0);
        clock.advance(1500.0);
        REQUIRE_THAT(clock.value(), WithinAbs(2000.0, 1e-6));
    }

    SECTION("quarter period sits at the midpoint") {
        clock.advance(0.0);
        clock.advance(750.0);
        REQUIRE_THAT(clock.value(), WithinAbs(1250.0, 1e-6));
    }

    SECTION("output stays within range over many periods") {
        clock.advance(0.0);
        for (double t = 0.0; t < 20000.0; t += 17.0) {
            clock.advance(t);
            REQUIRE(clock.value() >= 500.0 - 1e-9);
            REQUIRE(clock.value() <= 2000.0 + 1e-9);
        }
    }

    SECTION("reset restarts from the minimum") {
        clock.advance(0.0);
        clock.advance(1400.0);
        REQUIRE(clock.value() > 1900.0);

        clock.reset();
        REQUIRE_FALSE(clock.started());
        REQUIRE_THAT(clock.value(), WithinAbs(500.0, 1e-9));

        clock.advance(90000.0);
        REQUIRE_THAT(clock.value(), WithinAbs(500.0, 1e-6));
    }
}

TEST_CASE("PulseClock waveforms", "[unit][clock]") {
    SECTION("every shape starts at zero") {
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Sine, 0.0), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Triangle, 0.0), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Saw, 0.0), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Square, 0.0), WithinAbs(0.0, 1e-9));
    }

    SECTION("triangle peaks at half period") {
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Triangle, 0.5), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Triangle, 0.25), WithinAbs(0.5, 1e-9));
    }

    SECTION("saw rises linearly") {
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Saw, 0.8), WithinAbs(0.8, 1e-9));
    }

    SECTION("square honors pulse width") {
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Square, 0.2, 0.25), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(PulseClock::shape(PulseWaveform::Square, 0.3, 0.25), WithinAbs(1.0, 1e-9));
    }

    SECTION("names round-trip through the parser") {
        for (PulseWaveform w : {PulseWaveform::Sine, PulseWaveform::Triangle,
                                PulseWaveform::Saw, PulseWaveform::Square}) {
            PulseWaveform parsed = PulseWaveform::Sine;
            REQUIRE(parsePulseWaveform(pulseWaveformName(w), parsed));
            REQUIRE(parsed == w);
        }
        PulseWaveform out = PulseWaveform::Saw;
        REQUIRE_FALSE(parsePulseWaveform("wobble", out));
        REQUIRE(out == PulseWaveform::Saw);
    }
}

TEST_CASE("TripClock accumulation", "[unit][clock]") {
    TripClock clock(1000.0);

    SECTION("first frame only records the timestamp") {
        clock.advance(5000.0);
        REQUIRE(clock.started());
        REQUIRE_THAT(clock.currentTime(), WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(clock.lastFrameTime(), WithinAbs(5000.0, 1e-9));
    }

    SECTION("frame deltas accumulate") {
        clock.advance(100.0);
        clock.advance(116.0);
        clock.advance(150.0);
        REQUIRE_THAT(clock.output(), WithinAbs(50.0, 1e-9));
    }

    SECTION("wraps at the loop length") {
        clock.accumulate(600.0);
        clock.accumulate(600.0);
        REQUIRE_THAT(clock.currentTime(), WithinAbs(200.0, 1e-9));
    }

    SECTION("deltas summing to a multiple of the loop return to zero") {
        for (int i = 0; i < 8; ++i) {
            clock.accumulate(250.0);
        }
        REQUIRE_THAT(clock.currentTime(), WithinAbs(0.0, 1e-9));
    }

    SECTION("inexact frame deltas still land on zero at the loop end") {
        for (int i = 0; i < 60; ++i) {
            clock.accumulate(1000.0 / 60.0);
        }
        REQUIRE(clock.currentTime() == 0.0);

        for (int i = 0; i < 120; ++i) {
            clock.accumulate(1000.0 / 60.0);
        }
        REQUIRE(clock.currentTime() == 0.0);

        TripClock unit(1.0);
        for (int i = 0; i < 10; ++i) {
            unit.accumulate(0.1);
        }
        REQUIRE(unit.currentTime() == 0.0);
    }

    SECTION("non-positive deltas are ignored") {
        clock.accumulate(100.0);
        clock.accumulate(-50.0);
        clock.accumulate(0.0);
        REQUIRE_THAT(clock.currentTime(), WithinAbs(100.0, 1e-9));

        clock.advance(500.0);
        clock.advance(400.0);
        REQUIRE_THAT(clock.currentTime(), WithinAbs(100.0, 1e-9));
    }

    SECTION("reset returns to zero and forgets the last frame") {
        clock.advance(0.0);
        clock.advance(300.0);
        clock.reset();
        REQUIRE_FALSE(clock.started());
        REQUIRE_THAT(clock.currentTime(), WithinAbs(0.0, 1e-9));

        clock.advance(10000.0);
        REQUIRE_THAT(clock.currentTime(), WithinAbs(0.0, 1e-9));
    }

    SECTION("default loop length covers 15 trips of 10 s") {
        TripClock defaults;
        REQUIRE_THAT(defaults.loopLengthMs(), WithinAbs(150000.0, 1e-9));
        REQUIRE(defaults.name() == "TripClock");
    }
}
