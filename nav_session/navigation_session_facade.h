// TripNavSim/nav_session/navigation_session_facade.h
#ifndef TRIPNAV_NAVIGATION_SESSION_FACADE_H
#define TRIPNAV_NAVIGATION_SESSION_FACADE_H

#include "../common/datatypes.h"
#include "../nav_guidance/navigation_snapshot.h"
#include "../nav_guidance/navigation_state_machine.h"
#include "../nav_providers/position_source.h"
#include "../nav_providers/route_provider.h"
#include "../nav_scheduling/event_loop.h"
#include <functional>
#include <memory>
#include <mutex>

namespace tripnav {
namespace nav_session {

// Public entry point for the presentation layer.
//
// Commands are posted to the event loop and take effect when the loop is pumped, in the order
// they were issued. currentSnapshot() may be called from any thread. The change listener runs
// on the loop thread.
class NavigationSessionFacade {
public:
    using ChangeListener = std::function<void(const nav_guidance::NavigationEvent&)>;

    NavigationSessionFacade(nav_scheduling::EventLoop& loop,
                            nav_providers::IPositionSource* position_source,
                            nav_providers::IRouteProvider* route_provider);
    ~NavigationSessionFacade(); // Must run on the loop thread: tears down the active trip

    NavigationSessionFacade(const NavigationSessionFacade&) = delete;
    NavigationSessionFacade& operator=(const NavigationSessionFacade&) = delete;

    void setChangeListener(ChangeListener listener);

    // --- Commands ---
    void startTrip(const Coordinate& destination);
    void startTrip(const Coordinate& destination, const Coordinate& initial_origin);
    void changeDestination(const Coordinate& destination);
    void beginNavigating();
    void stopNavigating();
    void requestRecenter();
    void reportManualPan();
    void onPositionExternal(const PositionFix& fix);
    void closeTrip();

    // --- Observation ---
    nav_guidance::NavigationSnapshot currentSnapshot() const;

private:
    nav_scheduling::EventLoop& loop_;
    nav_providers::IPositionSource* position_source_; // Not owned
    nav_providers::IRouteProvider* route_provider_;   // Not owned

    std::unique_ptr<nav_guidance::NavigationStateMachine> session_; // Loop thread only

    mutable std::mutex snapshot_mutex_;
    nav_guidance::NavigationSnapshot latest_snapshot_;
    ChangeListener change_listener_;

    std::shared_ptr<bool> alive_token_;

    void postCommand(const char* name, std::function<void(nav_guidance::NavigationStateMachine&)> command);
    void createSession(const Coordinate& destination, bool has_origin, const Coordinate& origin);
    void destroySession();
    void onSessionEvent(const nav_guidance::NavigationEvent& event);
};

} // namespace nav_session
} // namespace tripnav

#endif // TRIPNAV_NAVIGATION_SESSION_FACADE_H
