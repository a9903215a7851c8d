#include <gtest/gtest.h>
#include "../nav_route/route_model.h"
#include "test_support.h"
#include <stdexcept>

using namespace tripnav;
using namespace tripnav::nav_route;
using tripnav::testing_support::makeStep;
using tripnav::testing_support::routeThrough;

namespace {

RouteCandidate validCandidate() {
    return routeThrough({Coordinate{0.0, 0.0}, Coordinate{0.0, 0.001}, Coordinate{0.001, 0.001}}).routes.front();
}

RouteResponse responseOf(const RouteCandidate& candidate) {
    RouteResponse response;
    response.routes.push_back(candidate);
    return response;
}

} // namespace

// ============================================================================
// Test Suite: BuildRoute
// ============================================================================

TEST(BuildRoute, UsesFirstCandidate) {
    RouteCandidate best = validCandidate();
    RouteCandidate alternative = routeThrough({Coordinate{0.0, 0.0}, Coordinate{0.001, 0.001}}).routes.front();
    RouteResponse response;
    response.routes.push_back(best);
    response.routes.push_back(alternative);

    RouteHandle route;
    NavError error = noError();
    ASSERT_TRUE(buildRouteFromResponse(response, route, error));
    ASSERT_NE(route, nullptr);
    EXPECT_FALSE(error.isSet());
    EXPECT_EQ(route->getStepCount(), 3u);
    EXPECT_EQ(route->getGeometry().size(), 3u);
    EXPECT_NEAR(route->getTotalDistanceMeters(), 222.0, 1e-6);
}

TEST(BuildRoute, KeepsStepsInProviderOrder) {
    RouteHandle route;
    NavError error = noError();
    ASSERT_TRUE(buildRouteFromResponse(responseOf(validCandidate()), route, error));
    EXPECT_EQ(route->getStep(0).maneuver.type, ManeuverType::DEPART);
    EXPECT_EQ(route->getStep(1).maneuver.type, ManeuverType::TURN);
    EXPECT_EQ(route->getStep(1).road_name, "Road 2");
    EXPECT_EQ(route->getStep(2).maneuver.type, ManeuverType::ARRIVE);
}

TEST(BuildRoute, ZeroCandidatesIsRouteUnavailable) {
    RouteHandle route;
    NavError error = noError();
    EXPECT_FALSE(buildRouteFromResponse(RouteResponse{}, route, error));
    EXPECT_EQ(route, nullptr);
    EXPECT_EQ(error.code, NavErrorCode::ROUTE_UNAVAILABLE);
    EXPECT_EQ(error.details, "No route found");
}

TEST(BuildRoute, EmptyStepListIsMalformed) {
    RouteCandidate candidate = validCandidate();
    candidate.steps.clear();
    RouteHandle route;
    NavError error = noError();
    EXPECT_FALSE(buildRouteFromResponse(responseOf(candidate), route, error));
    EXPECT_EQ(route, nullptr);
    EXPECT_EQ(error.code, NavErrorCode::MALFORMED_ROUTE);
}

TEST(BuildRoute, MissingGeometryIsMalformed) {
    RouteCandidate candidate = validCandidate();
    candidate.geometry.clear();
    RouteHandle route;
    NavError error = noError();
    EXPECT_FALSE(buildRouteFromResponse(responseOf(candidate), route, error));
    EXPECT_EQ(error.code, NavErrorCode::MALFORMED_ROUTE);
}

TEST(BuildRoute, RouteMustStartWithDepartAndEndWithArrive) {
    RouteCandidate no_depart = validCandidate();
    no_depart.steps.erase(no_depart.steps.begin());
    RouteCandidate no_arrive = validCandidate();
    no_arrive.steps.pop_back();

    RouteHandle route;
    NavError error = noError();
    EXPECT_FALSE(buildRouteFromResponse(responseOf(no_depart), route, error));
    EXPECT_EQ(error.code, NavErrorCode::MALFORMED_ROUTE);
    error = noError();
    EXPECT_FALSE(buildRouteFromResponse(responseOf(no_arrive), route, error));
    EXPECT_EQ(error.code, NavErrorCode::MALFORMED_ROUTE);
    EXPECT_EQ(route, nullptr);
}

TEST(BuildRoute, NegativeStepDistanceIsMalformed) {
    RouteCandidate candidate = validCandidate();
    candidate.steps[1].distance_m = -5.0;
    RouteHandle route;
    NavError error = noError();
    EXPECT_FALSE(buildRouteFromResponse(responseOf(candidate), route, error));
    EXPECT_EQ(error.code, NavErrorCode::MALFORMED_ROUTE);
}

// ============================================================================
// Test Suite: RouteProgress
// ============================================================================

TEST(RouteProgress, RemainingSumsFromIndex) {
    std::vector<Step> steps = {
        makeStep(ManeuverType::DEPART, Coordinate{0.0, 0.0}, 100.0),
        makeStep(ManeuverType::TURN, Coordinate{0.0, 0.001}, 250.0),
        makeStep(ManeuverType::ARRIVE, Coordinate{0.002, 0.001}, 0.0)
    };
    Route route(350.0, 35.0, {Coordinate{0.0, 0.0}, Coordinate{0.002, 0.001}}, steps);

    EXPECT_DOUBLE_EQ(route.remainingDistanceMeters(0), 350.0);
    EXPECT_DOUBLE_EQ(route.remainingDistanceMeters(1), 250.0);
    EXPECT_DOUBLE_EQ(route.remainingDurationSeconds(1), 25.0);
    EXPECT_DOUBLE_EQ(route.remainingDistanceMeters(3), 0.0);
}

TEST(RouteProgress, StepOutOfRangeThrows) {
    RouteHandle route;
    NavError error = noError();
    ASSERT_TRUE(buildRouteFromResponse(responseOf(validCandidate()), route, error));
    EXPECT_THROW(route->getStep(3), std::out_of_range);
}

// ============================================================================
// Test Suite: ManeuverVocabulary
// ============================================================================

TEST(ManeuverVocabulary, ParsesProviderTypes) {
    EXPECT_EQ(maneuverTypeFromString("depart"), ManeuverType::DEPART);
    EXPECT_EQ(maneuverTypeFromString("end of road"), ManeuverType::END_OF_ROAD);
    EXPECT_EQ(maneuverTypeFromString("new name"), ManeuverType::NEW_NAME);
    EXPECT_EQ(maneuverTypeFromString("teleport"), ManeuverType::UNKNOWN);
    EXPECT_STREQ(maneuverTypeToString(ManeuverType::OFF_RAMP), "off ramp");
}

TEST(ManeuverVocabulary, ParsesModifiers) {
    EXPECT_EQ(maneuverModifierFromString("slight left"), ManeuverModifier::SLIGHT_LEFT);
    EXPECT_EQ(maneuverModifierFromString("uturn"), ManeuverModifier::UTURN);
    EXPECT_EQ(maneuverModifierFromString(""), ManeuverModifier::NONE);
    EXPECT_STREQ(maneuverModifierToString(ManeuverModifier::SHARP_RIGHT), "sharp right");
}
