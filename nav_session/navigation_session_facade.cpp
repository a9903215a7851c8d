// TripNavSim/nav_session/navigation_session_facade.cpp
#include "navigation_session_facade.h"
#include "../common/logger.h"
#include <utility>

namespace tripnav {
namespace nav_session {

using nav_guidance::NavigationEvent;
using nav_guidance::NavigationSnapshot;
using nav_guidance::NavigationStateMachine;

NavigationSessionFacade::NavigationSessionFacade(nav_scheduling::EventLoop& loop,
                                                 nav_providers::IPositionSource* position_source,
                                                 nav_providers::IRouteProvider* route_provider) :
    loop_(loop),
    position_source_(position_source),
    route_provider_(route_provider),
    alive_token_(std::make_shared<bool>(true))
{
    TRIPNAV_LOG_INFO("NavigationSessionFacade: Initializing. Position source: %s, route provider: %s.",
                     position_source_ ? "attached" : "external feed",
                     route_provider_ ? "attached" : "NONE");
}

NavigationSessionFacade::~NavigationSessionFacade() {
    alive_token_.reset();
    if (session_) {
        TRIPNAV_LOG_INFO("NavigationSessionFacade: Shutting down with an open trip. Tearing it down.");
        session_.reset();
    }
}

void NavigationSessionFacade::setChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    change_listener_ = std::move(listener);
}

// --- Commands ---

void NavigationSessionFacade::startTrip(const Coordinate& destination) {
    std::weak_ptr<bool> alive = alive_token_;
    loop_.post([this, alive, destination]() {
        if (!alive.lock()) return;
        createSession(destination, false, Coordinate{0.0, 0.0});
    });
}

void NavigationSessionFacade::startTrip(const Coordinate& destination, const Coordinate& initial_origin) {
    std::weak_ptr<bool> alive = alive_token_;
    loop_.post([this, alive, destination, initial_origin]() {
        if (!alive.lock()) return;
        createSession(destination, true, initial_origin);
    });
}

void NavigationSessionFacade::changeDestination(const Coordinate& destination) {
    postCommand("changeDestination", [destination](NavigationStateMachine& session) {
        session.changeDestination(destination);
    });
}

void NavigationSessionFacade::beginNavigating() {
    postCommand("beginNavigating", [](NavigationStateMachine& session) {
        if (!session.beginNavigating()) {
            TRIPNAV_LOG_DEBUG("NavigationSessionFacade: beginNavigating refused, see session error.");
        }
    });
}

void NavigationSessionFacade::stopNavigating() {
    postCommand("stopNavigating", [](NavigationStateMachine& session) {
        if (!session.stopNavigating()) {
            TRIPNAV_LOG_DEBUG("NavigationSessionFacade: stopNavigating had nothing to stop.");
        }
    });
}

void NavigationSessionFacade::requestRecenter() {
    postCommand("requestRecenter", [](NavigationStateMachine& session) {
        session.handleRecenterRequest();
    });
}

void NavigationSessionFacade::reportManualPan() {
    postCommand("reportManualPan", [](NavigationStateMachine& session) {
        session.handleManualPan();
    });
}

void NavigationSessionFacade::onPositionExternal(const PositionFix& fix) {
    postCommand("onPositionExternal", [fix](NavigationStateMachine& session) {
        session.handlePositionFix(fix);
    });
}

void NavigationSessionFacade::closeTrip() {
    std::weak_ptr<bool> alive = alive_token_;
    loop_.post([this, alive]() {
        if (!alive.lock()) return;
        destroySession();
    });
}

// --- Observation ---

NavigationSnapshot NavigationSessionFacade::currentSnapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return latest_snapshot_;
}

// --- Internal helpers ---

void NavigationSessionFacade::postCommand(const char* name,
                                          std::function<void(NavigationStateMachine&)> command) {
    std::weak_ptr<bool> alive = alive_token_;
    loop_.post([this, alive, name, command]() {
        if (!alive.lock()) return;
        if (!session_) {
            TRIPNAV_LOG_WARNING("NavigationSessionFacade: %s ignored, no trip in progress.", name);
            return;
        }
        TRIPNAV_LOG_VERBOSE("NavigationSessionFacade: Dispatching %s.", name);
        command(*session_);
    });
}

void NavigationSessionFacade::createSession(const Coordinate& destination, bool has_origin, const Coordinate& origin) {
    if (session_) {
        TRIPNAV_LOG_INFO("NavigationSessionFacade: New trip requested, closing the current one first.");
        destroySession();
    }
    TRIPNAV_LOG_INFO("NavigationSessionFacade: Starting trip to (%.6f, %.6f).", destination.latitude, destination.longitude);
    session_ = std::make_unique<NavigationStateMachine>(loop_, position_source_, route_provider_, destination,
        [this](const NavigationEvent& event) { onSessionEvent(event); });
    session_->startTrip(has_origin, origin);
}

void NavigationSessionFacade::destroySession() {
    if (!session_) {
        TRIPNAV_LOG_DEBUG("NavigationSessionFacade: closeTrip with no trip in progress.");
        return;
    }
    session_->closeTrip();
    session_.reset();
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    latest_snapshot_.trip_active = false;
}

void NavigationSessionFacade::onSessionEvent(const NavigationEvent& event) {
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        latest_snapshot_ = event.snapshot;
        listener = change_listener_;
    }
    TRIPNAV_LOG_DEBUG("NavigationSessionFacade: %s (mode %s, step %zu).",
                      nav_guidance::navigationEventKindToString(event.kind),
                      nav_guidance::navigationModeToString(event.snapshot.mode),
                      event.snapshot.current_step_index);
    if (listener) {
        listener(event);
    }
}

} // namespace nav_session
} // namespace tripnav
