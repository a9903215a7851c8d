#include <gtest/gtest.h>
#include "../nav_route/step_formatter.h"
#include "test_support.h"

using namespace tripnav;
using namespace tripnav::nav_route;
using tripnav::testing_support::makeStep;

// ============================================================================
// Test Suite: StepInstruction
// ============================================================================

TEST(StepInstruction, DepartNamesTheStartingRoad) {
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::DEPART, Coordinate{0, 0}, 10.0, "Main St")),
              "Start on Main St");
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::DEPART, Coordinate{0, 0}, 10.0)), "Depart");
}

TEST(StepInstruction, ArriveIgnoresRoadName) {
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::ARRIVE, Coordinate{0, 0}, 0.0, "Main St")),
              "Arrive at destination");
}

TEST(StepInstruction, ModifierLeadsTheInstruction) {
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::TURN, Coordinate{0, 0}, 10.0, "Oak Ave",
                                             ManeuverModifier::SLIGHT_LEFT)),
              "Slight left onto Oak Ave");
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::TURN, Coordinate{0, 0}, 10.0, "",
                                             ManeuverModifier::RIGHT)),
              "Right");
}

TEST(StepInstruction, NoModifierContinues) {
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::NEW_NAME, Coordinate{0, 0}, 10.0, "Elm Rd")),
              "Continue on Elm Rd");
    EXPECT_EQ(formatStepInstruction(makeStep(ManeuverType::CONTINUE, Coordinate{0, 0}, 10.0)), "Continue");
}

// ============================================================================
// Test Suite: DistanceText
// ============================================================================

TEST(DistanceText, MetersBelowOneKilometer) {
    EXPECT_EQ(formatDistance(0.0), "0 m");
    EXPECT_EQ(formatDistance(0.5), "1 m");
    EXPECT_EQ(formatDistance(350.4), "350 m");
}

TEST(DistanceText, KilometersWithOneDecimal) {
    EXPECT_EQ(formatDistance(1000.0), "1.0 km");
    EXPECT_EQ(formatDistance(1234.0), "1.2 km");
    EXPECT_EQ(formatDistance(12500.0), "12.5 km");
}

// ============================================================================
// Test Suite: DurationText
// ============================================================================

TEST(DurationText, MinutesBelowOneHour) {
    EXPECT_EQ(formatDuration(0.0), "0 min");
    EXPECT_EQ(formatDuration(720.0), "12 min");
    EXPECT_EQ(formatDuration(89.0), "1 min");
}

TEST(DurationText, HoursAndMinutesFromOneHour) {
    EXPECT_EQ(formatDuration(3600.0), "1h 0m");
    EXPECT_EQ(formatDuration(3900.0), "1h 5m");
}
