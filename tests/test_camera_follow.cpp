#include <gtest/gtest.h>
#include "../nav_guidance/camera_follow_controller.h"

using tripnav::Coordinate;
using tripnav::nav_guidance::CameraFollowController;
using tripnav::nav_guidance::NavigationMode;

// ============================================================================
// Test Suite: CameraFollow
// ============================================================================

TEST(CameraFollow, OffUntilNavigationStarts) {
    CameraFollowController camera;
    EXPECT_FALSE(camera.isFollowing());
    EXPECT_FALSE(camera.onNavigationStopped());

    EXPECT_TRUE(camera.onNavigationStarted());
    EXPECT_TRUE(camera.isFollowing());
    EXPECT_FALSE(camera.onNavigationStarted()); // already following
}

TEST(CameraFollow, ManualPanTurnsFollowOffUntilRecenter) {
    CameraFollowController camera;
    camera.onNavigationStarted();

    EXPECT_TRUE(camera.onManualPan());
    EXPECT_FALSE(camera.isFollowing());
    EXPECT_FALSE(camera.onManualPan());

    EXPECT_TRUE(camera.onRecenterRequested());
    EXPECT_TRUE(camera.isFollowing());
}

TEST(CameraFollow, FreshStartRestoresFollow) {
    CameraFollowController camera;
    camera.onNavigationStarted();
    camera.onManualPan();
    EXPECT_TRUE(camera.onNavigationStarted());
    EXPECT_TRUE(camera.isFollowing());
}

TEST(CameraFollow, StopTurnsFollowOff) {
    CameraFollowController camera;
    camera.onNavigationStarted();
    EXPECT_TRUE(camera.onNavigationStopped());
    EXPECT_FALSE(camera.isFollowing());
}

TEST(CameraFollow, TracksPositionOnlyWhileNavigating) {
    CameraFollowController camera;
    EXPECT_FALSE(camera.shouldTrackPosition(NavigationMode::NAVIGATING));
    camera.onNavigationStarted();
    EXPECT_TRUE(camera.shouldTrackPosition(NavigationMode::NAVIGATING));
    EXPECT_FALSE(camera.shouldTrackPosition(NavigationMode::PREVIEW));
    EXPECT_FALSE(camera.shouldTrackPosition(NavigationMode::ARRIVED));

    camera.onManualPan();
    EXPECT_FALSE(camera.shouldTrackPosition(NavigationMode::NAVIGATING));
}

// ============================================================================
// Test Suite: ViewportCenter
// ============================================================================

TEST(ViewportCenter, DestinationWhenPositionUnknown) {
    Coordinate center = CameraFollowController::viewportCenter(
        NavigationMode::NAVIGATING, false, Coordinate{0.0, 0.0}, Coordinate{1.0, 2.0});
    EXPECT_DOUBLE_EQ(center.latitude, 1.0);
    EXPECT_DOUBLE_EQ(center.longitude, 2.0);
}

TEST(ViewportCenter, PositionWhileNavigating) {
    Coordinate center = CameraFollowController::viewportCenter(
        NavigationMode::NAVIGATING, true, Coordinate{0.5, 0.5}, Coordinate{1.0, 2.0});
    EXPECT_DOUBLE_EQ(center.latitude, 0.5);
    EXPECT_DOUBLE_EQ(center.longitude, 0.5);
}

TEST(ViewportCenter, MidpointInPreview) {
    Coordinate center = CameraFollowController::viewportCenter(
        NavigationMode::PREVIEW, true, Coordinate{0.0, 0.0}, Coordinate{1.0, 2.0});
    EXPECT_DOUBLE_EQ(center.latitude, 0.5);
    EXPECT_DOUBLE_EQ(center.longitude, 1.0);
}
