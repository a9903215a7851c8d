// TripNavSim/nav_guidance/camera_follow_controller.cpp
#include "camera_follow_controller.h"
#include "../common/logger.h"
#include "../nav_geometry/geo_distance.h"

namespace tripnav {
namespace nav_guidance {

CameraFollowController::CameraFollowController() :
    following_(false)
{
}

bool CameraFollowController::setFollowing(bool following, const char* reason) {
    if (following_ == following) {
        TRIPNAV_LOG_VERBOSE("CameraFollowController: %s, follow already %s.", reason, following ? "ON" : "OFF");
        return false;
    }
    following_ = following;
    TRIPNAV_LOG_INFO("CameraFollowController: Follow %s (%s).", following_ ? "ON" : "OFF", reason);
    return true;
}

bool CameraFollowController::onNavigationStarted() {
    return setFollowing(true, "navigation started");
}

bool CameraFollowController::onNavigationStopped() {
    return setFollowing(false, "navigation stopped");
}

bool CameraFollowController::onManualPan() {
    return setFollowing(false, "manual pan");
}

bool CameraFollowController::onRecenterRequested() {
    return setFollowing(true, "recenter requested");
}

bool CameraFollowController::shouldTrackPosition(NavigationMode mode) const {
    return mode == NavigationMode::NAVIGATING && following_;
}

Coordinate CameraFollowController::viewportCenter(NavigationMode mode, bool has_position,
                                                  const Coordinate& position, const Coordinate& destination) {
    if (!has_position) {
        return destination;
    }
    if (mode == NavigationMode::NAVIGATING) {
        return position;
    }
    return nav_geometry::midpoint(position, destination);
}

} // namespace nav_guidance
} // namespace tripnav
