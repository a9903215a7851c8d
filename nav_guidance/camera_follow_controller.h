// TripNavSim/nav_guidance/camera_follow_controller.h
#ifndef TRIPNAV_CAMERA_FOLLOW_CONTROLLER_H
#define TRIPNAV_CAMERA_FOLLOW_CONTROLLER_H

#include "../common/datatypes.h"
#include "navigation_snapshot.h"

namespace tripnav {
namespace nav_guidance {

// Decides whether the map viewport tracks the live position.
// Follow starts off. It is switched on by a fresh navigation start or an explicit recenter,
// and off by a manual pan or a stop. It is never switched back on implicitly.
class CameraFollowController {
public:
    CameraFollowController();

    // Each returns true when the follow flag changed.
    bool onNavigationStarted();
    bool onNavigationStopped();
    bool onManualPan();
    bool onRecenterRequested();

    bool isFollowing() const { return following_; }
    bool shouldTrackPosition(NavigationMode mode) const;

    // Live position while navigating, midpoint to the destination in preview,
    // the destination itself when no position is known.
    static Coordinate viewportCenter(NavigationMode mode, bool has_position,
                                     const Coordinate& position, const Coordinate& destination);

private:
    bool following_;

    bool setFollowing(bool following, const char* reason);
};

} // namespace nav_guidance
} // namespace tripnav

#endif // TRIPNAV_CAMERA_FOLLOW_CONTROLLER_H
