#include "photon/log/Log.hpp"
#include "photon/protocol/Protocol.hpp"

#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <string>

using namespace photon::protocol;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { photon::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { photon::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); if (std::fabs(_va-_vb) > (tol)) { photon::logError("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " vs ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static ProtocolLine line(int number) {
    ProtocolLine l;
    l.lineNumber = number;
    return l;
}

static ProtocolLine absoluteMove(int number, double target, double speed) {
    auto l = line(number);
    l.movement = MoveAction{AbsoluteMove{target, speed}};
    return l;
}

static ProtocolLine relativeMove(int number, double delta, double speed, int repeat = 1) {
    auto l = line(number);
    l.movement = MoveAction{RelativeMove{delta, speed}};
    l.repeatCount = repeat;
    return l;
}

static Protocol protocolOf(std::vector<ProtocolLine> lines, int loops = 1) {
    Protocol p;
    p.name = "model";
    p.lines = std::move(lines);
    p.loopCount = loops;
    return p;
}

static std::vector<std::string> describeAll(const ValidationResult& result) {
    std::vector<std::string> out;
    if (!result) {
        for (const auto& error : result.error()) out.push_back(error.describe());
    }
    return out;
}

static void testValidProtocolPasses() {
    auto first = absoluteMove(1, 5.0, 1.0);
    first.laser = LaserAction{SetPower{0.5}};
    auto second = line(2);
    second.laser = LaserAction{PowerRamp{0.5, 2.0, 3.0}};
    second.dwell = Dwell{2.0};
    auto third = line(3);
    third.movement = MoveAction{HomeMove{}};

    ASSERT_TRUE(protocolOf({first, second, third}).validate().has_value(), "valid protocol accepted");
}

static void testBoundsAreReported() {
    auto tooFar = absoluteMove(1, 25.0, 1.0);
    auto tooFast = absoluteMove(2, 1.0, 6.0);
    auto tooHot = line(3);
    tooHot.laser = LaserAction{SetPower{12.0}};
    auto noDwell = line(4);
    noDwell.dwell = Dwell{0.0};
    auto longRamp = line(5);
    longRamp.laser = LaserAction{PowerRamp{0.0, 1.0, 400.0}};
    auto negative = line(6);
    negative.laser = LaserAction{SetPower{-1.0}};

    const auto errors =
        describeAll(protocolOf({tooFar, tooFast, tooHot, noDwell, longRamp, negative}).validate());
    ASSERT_EQ(errors.size(), std::size_t(6), "one error per offending line");
    if (errors.size() == 6) {
        ASSERT_EQ(errors[0], std::string("Line 1: Movement: Position 25mm above maximum 20mm"), "position");
        ASSERT_EQ(errors[1], std::string("Line 2: Movement: Speed 6mm/s exceeds limit 5mm/s"), "speed");
        ASSERT_EQ(errors[2], std::string("Line 3: Laser: Laser power 12W exceeds limit 10W"), "power");
        ASSERT_EQ(errors[3], std::string("Line 4: Dwell: Dwell duration must be positive"), "dwell");
        ASSERT_EQ(errors[4], std::string("Line 5: Laser ramp: Ramp duration 400s exceeds limit 300s"), "ramp");
        ASSERT_EQ(errors[5], std::string("Line 6: Laser: Laser power cannot be negative"), "negative power");
    }
}

static void testStructuralErrors() {
    Protocol empty;
    empty.loopCount = 0;
    const auto errors = describeAll(empty.validate());
    ASSERT_EQ(errors.size(), std::size_t(3), "name, lines and loop count");
    if (errors.size() == 3) {
        ASSERT_EQ(errors[0], std::string("Protocol name is required"), "name");
        ASSERT_EQ(errors[1], std::string("Protocol must contain at least one line"), "lines");
        ASSERT_EQ(errors[2], std::string("Loop count must be at least 1"), "loops");
    }

    auto zeroRepeat = line(1);
    zeroRepeat.repeatCount = 0;
    const auto lineErrors = describeAll(protocolOf({zeroRepeat}).validate());
    ASSERT_TRUE(lineErrors.size() == 1 && lineErrors[0] == "Line 1: Repeat count must be at least 1",
                "repeat count");
}

static void testRelativeDriftAcrossRepeats() {
    const auto errors = describeAll(protocolOf({relativeMove(1, 8.0, 1.0, 3)}).validate());
    ASSERT_EQ(errors.size(), std::size_t(1), "third repetition leaves the envelope");
    if (!errors.empty()) {
        ASSERT_EQ(errors[0],
                  std::string("Line 1: Movement: Relative move of 8mm reaches Position 24mm above maximum 20mm"),
                  "relative message");
    }
    ASSERT_TRUE(protocolOf({relativeMove(1, 8.0, 1.0, 2)}).validate().has_value(),
                "two repetitions stay inside");
}

static void testRelativeDriftAcrossLoops() {
    ASSERT_TRUE(!protocolOf({relativeMove(1, 8.0, 1.0)}, 3).validate().has_value(),
                "drift caught on the third loop");

    auto home = line(2);
    home.movement = MoveAction{HomeMove{}};
    ASSERT_TRUE(protocolOf({relativeMove(1, 8.0, 1.0), home}, 50).validate().has_value(),
                "homing every loop keeps relative moves bounded");

    const auto errors = describeAll(protocolOf({relativeMove(1, 8.0, 1.0)}, 10).validate());
    ASSERT_EQ(errors.size(), std::size_t(1), "a line is reported once");
}

static void testLineValidateFromStartPosition() {
    const auto l = relativeMove(1, 5.0, 1.0);
    ASSERT_TRUE(l.validate(SafetyLimits{}, 0.0).empty(), "fine from zero");
    ASSERT_EQ(l.validate(SafetyLimits{}, 18.0).size(), std::size_t(1), "out of bounds from 18mm");
}

static void testCustomLimits() {
    SafetyLimits strict;
    strict.maxPowerW = 1.0;
    auto hot = line(1);
    hot.laser = LaserAction{SetPower{2.0}};
    auto p = protocolOf({hot});
    ASSERT_TRUE(p.validate().has_value(), "within the protocol's own limits");
    ASSERT_TRUE(!p.validate(strict).has_value(), "outside stricter limits");
}

static void testDurationIsMaxOfSubActions() {
    auto l = absoluteMove(1, 5.0, 1.0);
    l.laser = LaserAction{SetPower{0.5}};
    ASSERT_NEAR(l.durationSeconds(), 5.0, 1e-12, "travel dominates");

    l.dwell = Dwell{7.0};
    ASSERT_NEAR(l.durationSeconds(), 7.0, 1e-12, "dwell dominates");

    auto ramp = line(2);
    ramp.laser = LaserAction{PowerRamp{0.0, 1.0, 3.0}};
    ramp.dwell = Dwell{2.0};
    ASSERT_NEAR(ramp.durationSeconds(), 3.0, 1e-12, "ramp dominates");

    ASSERT_EQ(line(3).durationSeconds(), 0.0, "empty line takes no time");

    auto home = line(4);
    home.movement = MoveAction{HomeMove{2.0}};
    ASSERT_NEAR(home.durationSeconds(10.0), 5.0, 1e-12, "home billed for the distance back");
}

static void testTotalDuration() {
    auto repeated = line(1);
    repeated.dwell = Dwell{2.0};
    repeated.repeatCount = 3;
    ASSERT_NEAR(protocolOf({repeated}, 2).totalDurationSeconds(), 12.0, 1e-12, "repeats x loops");

    // Second loop starts at 5mm, so the absolute move costs nothing.
    ASSERT_NEAR(protocolOf({absoluteMove(1, 5.0, 1.0)}, 2).totalDurationSeconds(), 5.0, 1e-12,
                "position carried across loops");

    auto longer = absoluteMove(1, 5.0, 1.0);
    auto shorter = absoluteMove(1, 5.0, 1.0);
    shorter.dwell = Dwell{1.0};
    longer.dwell = Dwell{9.0};
    ASSERT_TRUE(protocolOf({longer}).totalDurationSeconds() >=
                    protocolOf({shorter}).totalDurationSeconds(),
                "a longer sub-action never shortens the protocol");
}

static void testEnergy() {
    auto set = absoluteMove(1, 5.0, 1.0);
    set.laser = LaserAction{SetPower{0.5}};
    ASSERT_NEAR(set.energyJoules(), 2.5, 1e-12, "power x line duration");

    auto ramp = line(2);
    ramp.laser = LaserAction{PowerRamp{0.0, 2.0, 4.0}};
    ASSERT_NEAR(ramp.energyJoules(), 4.0, 1e-12, "trapezoid for ramps");

    ASSERT_EQ(line(3).energyJoules(), 0.0, "no laser, no energy");

    ASSERT_NEAR(protocolOf({set, ramp}, 2).totalEnergyJoules(), 13.0, 1e-12, "summed and looped");
}

static void testSummary() {
    auto l = absoluteMove(2, 5.0, 1.0);
    l.laser = LaserAction{SetPower{0.5}};
    ASSERT_EQ(l.summary(), std::string("Line 2: [Move Abs] 5.0mm @ 1.0mm/s | [Laser] Set 0.5W | Duration: 5.0s"),
              "line summary");

    auto d = line(3);
    d.dwell = Dwell{2.0};
    d.repeatCount = 4;
    ASSERT_EQ(d.summary(), std::string("Line 3: [Dwell] 2.0s | x4 | Duration: 2.0s"), "repeat shown");
}

static void testEquality() {
    auto a = protocolOf({absoluteMove(1, 5.0, 1.0)});
    auto b = a;
    ASSERT_TRUE(a == b, "copies compare equal");
    b.lines[0].notes = "changed";
    ASSERT_TRUE(a != b, "notes take part in equality");
}

static double secondsToRun(const std::function<void()>& body) {
    const auto start = std::chrono::steady_clock::now();
    body();
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

static void testHugeCountsValidateQuickly() {
    const int most = std::numeric_limits<int>::max();

    // Net drift is a rounding error, not zero.
    auto nearlyClosed = protocolOf({relativeMove(1, 0.1, 1.0), relativeMove(2, 0.7, 1.0),
                                    relativeMove(3, -0.8, 1.0)},
                                   most);
    bool valid = false;
    const double closedS = secondsToRun([&] { valid = nearlyClosed.validate().has_value(); });
    ASSERT_TRUE(valid, "rounding drift stays inside the envelope");
    ASSERT_TRUE(closedS < 0.5, "validation does not walk every loop");

    std::vector<std::string> errors;
    const double driftS = secondsToRun([&] {
        errors = describeAll(protocolOf({relativeMove(1, 0.5, 1.0)}, 1000000).validate());
    });
    ASSERT_TRUE(driftS < 0.5, "drift found without walking every loop");
    ASSERT_EQ(errors.size(), std::size_t(1), "drifting line reported once");
    if (!errors.empty()) {
        ASSERT_EQ(errors[0],
                  std::string("Line 1: Movement: Relative move of 0.5mm reaches Position 20.5mm above maximum 20mm"),
                  "first loop to leave the envelope is reported");
    }

    const double repeatS = secondsToRun([&] {
        errors = describeAll(protocolOf({relativeMove(1, 0.25, 1.0, most)}).validate());
    });
    ASSERT_TRUE(repeatS < 0.5, "repeats are not walked one by one");
    ASSERT_TRUE(errors.size() == 1 && errors[0].find("reaches Position 20.25mm") != std::string::npos,
                "first repetition out of bounds reported");

    double total = 0.0;
    const double durationS = secondsToRun([&] { total = nearlyClosed.totalDurationSeconds(); });
    ASSERT_TRUE(durationS < 0.5, "total duration is computed per loop, not per iteration");
    ASSERT_NEAR(total, 1.6 * most, 1.0, "every loop costs the same travel time");
}

int main() {
    testValidProtocolPasses();
    testBoundsAreReported();
    testStructuralErrors();
    testRelativeDriftAcrossRepeats();
    testRelativeDriftAcrossLoops();
    testLineValidateFromStartPosition();
    testCustomLimits();
    testDurationIsMaxOfSubActions();
    testTotalDuration();
    testEnergy();
    testSummary();
    testEquality();
    testHugeCountsValidateQuickly();

    if (g_failures) {
        photon::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    photon::logInfo("Protocol model tests passed.\n");
    return 0;
}
