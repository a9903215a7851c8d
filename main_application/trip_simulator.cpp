// TripNavSim/main_application/trip_simulator.cpp
#include "trip_simulator.h"
#include "../common/logger.h"
#include "../nav_geometry/geo_distance.h"
#include "../nav_route/step_formatter.h"
#include <chrono>
#include <thread>

namespace main_application {

using tripnav::Coordinate;
using tripnav::nav_guidance::NavigationEvent;
using tripnav::nav_guidance::NavigationEventKind;
using tripnav::nav_guidance::NavigationMode;
using tripnav::nav_guidance::NavigationSnapshot;

namespace {

// How far the traveler keeps going straight after a missed turn.
constexpr double kOvershootMeters = 250.0;

bool isTurnManeuver(tripnav::nav_route::ManeuverType type) {
    return type != tripnav::nav_route::ManeuverType::DEPART && type != tripnav::nav_route::ManeuverType::ARRIVE;
}

} // namespace

TripSimulator::TripSimulator(const TripSimConfig& config) :
    config_(config),
    loop_(),
    arrived_(false),
    turn_miss_pending_(config.miss_turn),
    routes_received_(0),
    reroutes_started_(0),
    reroute_failures_(0)
{
    TRIPNAV_LOG_INFO("TripSimulator: Initializing. Trip (%.6f, %.6f) -> (%.6f, %.6f).",
                     config_.origin.latitude, config_.origin.longitude,
                     config_.destination.latitude, config_.destination.longitude);
    route_provider_ = std::make_unique<tripnav::nav_simulation::SimulatedRouteProvider>(
        loop_, config_.provider_latency_ms, config_.speed_mps);
    position_source_ = std::make_unique<tripnav::nav_simulation::SimulatedPositionSource>(
        loop_, config_.fix_interval_ms, config_.speed_mps);
    position_source_->setPath({config_.origin});
    facade_ = std::make_unique<tripnav::nav_session::NavigationSessionFacade>(
        loop_, position_source_.get(), route_provider_.get());
    facade_->setChangeListener([this](const NavigationEvent& event) { onNavigationEvent(event); });
}

TripSimulator::~TripSimulator() {
    TRIPNAV_LOG_INFO("TripSimulator: Shutting down.");
    // Facade first: it unsubscribes from the source and must not outlive the providers.
    facade_.reset();
    loop_.runPending();
}

bool TripSimulator::runTrip() {
    TRIPNAV_LOG_INFO("TripSimulator: Planning trip...");
    facade_->startTrip(config_.destination, config_.origin);
    loop_.runPending();

    advanceUntil([this]() {
        NavigationSnapshot snapshot = facade_->currentSnapshot();
        return snapshot.active_route != nullptr || (!snapshot.route_loading && snapshot.last_error.isSet());
    }, config_.max_sim_ms);

    NavigationSnapshot preview = facade_->currentSnapshot();
    if (!preview.active_route) {
        TRIPNAV_LOG_ERROR("TripSimulator: No route to follow (%s). Giving up.",
                          preview.last_error.isSet() ? preview.last_error.details.c_str() : "timed out");
        facade_->closeTrip();
        loop_.runPending();
        return false;
    }
    TRIPNAV_LOG_INFO("TripSimulator: Route ready: %s, %s, %zu steps.",
                     tripnav::nav_route::formatDistance(preview.active_route->getTotalDistanceMeters()).c_str(),
                     tripnav::nav_route::formatDuration(preview.active_route->getTotalDurationSeconds()).c_str(),
                     preview.active_route->getStepCount());

    position_source_->setFailToStart(config_.gps_fails_to_start);
    facade_->beginNavigating();
    loop_.runPending();
    if (facade_->currentSnapshot().mode != NavigationMode::NAVIGATING) {
        TRIPNAV_LOG_ERROR("TripSimulator: Navigation did not start.");
        facade_->closeTrip();
        loop_.runPending();
        return false;
    }

    // Injected failures only hit reroutes: the initial route is already in hand.
    if (config_.provider_failures > 0) {
        route_provider_->failNextFetches(config_.provider_failures);
    }

    if (!advanceUntil([this]() { return arrived_; }, config_.max_sim_ms)) {
        TRIPNAV_LOG_WARNING("TripSimulator: Simulation time limit (%lld ms) reached before arrival.",
                            static_cast<long long>(config_.max_sim_ms));
    }

    TRIPNAV_LOG_INFO("TripSimulator: Trip over after %lld ms. Routes: %d, reroutes: %d (%d failed), fixes: %d.",
                     static_cast<long long>(loop_.nowMs()), routes_received_, reroutes_started_,
                     reroute_failures_, position_source_->getFixesEmitted());
    facade_->closeTrip();
    loop_.runPending();
    return arrived_;
}

bool TripSimulator::advanceUntil(const std::function<bool()>& done, int64_t deadline_ms) {
    loop_.runPending();
    while (!done() && loop_.nowMs() < deadline_ms) {
        loop_.advanceBy(config_.fix_interval_ms);
        if (config_.tick_sleep_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.tick_sleep_ms));
        }
    }
    return done();
}

void TripSimulator::onNavigationEvent(const NavigationEvent& event) {
    const NavigationSnapshot& snapshot = event.snapshot;
    switch (event.kind) {
        case NavigationEventKind::ROUTE_UPDATED:
            ++routes_received_;
            steerAlongRoute(snapshot.active_route);
            break;
        case NavigationEventKind::NAVIGATION_STARTED:
            TRIPNAV_LOG_INFO("TripSimulator: Departing.");
            printGuidance(snapshot);
            break;
        case NavigationEventKind::STEP_ADVANCED:
            if (snapshot.active_route && snapshot.current_step_index < snapshot.active_route->getStepCount() &&
                isTurnManeuver(snapshot.active_route->getStep(snapshot.current_step_index).maneuver.type)) {
                turn_miss_pending_ = false;
            }
            printGuidance(snapshot);
            break;
        case NavigationEventKind::REROUTE_STARTED:
            ++reroutes_started_;
            TRIPNAV_LOG_INFO("TripSimulator: Recalculating route...");
            break;
        case NavigationEventKind::REROUTE_FINISHED:
            printGuidance(snapshot);
            break;
        case NavigationEventKind::ERROR_RAISED:
            if (snapshot.last_error.code == tripnav::NavErrorCode::REROUTE_FAILED) {
                ++reroute_failures_;
            }
            TRIPNAV_LOG_WARNING("TripSimulator: %s: %s", tripnav::navErrorCodeToString(snapshot.last_error.code),
                                snapshot.last_error.details.c_str());
            break;
        case NavigationEventKind::ARRIVED:
            arrived_ = true;
            TRIPNAV_LOG_INFO("TripSimulator: You have arrived.");
            break;
        default:
            break;
    }
}

void TripSimulator::steerAlongRoute(const tripnav::nav_route::RouteHandle& route) {
    if (!route || route->getGeometry().empty()) {
        return;
    }
    const std::vector<Coordinate>& geometry = route->getGeometry();
    std::vector<Coordinate> path;
    if (routes_received_ == 1) {
        path = geometry;
    } else {
        // The fetch started a moment ago: pick up the new line from where the traveler is now.
        path.push_back(position_source_->getCurrentPosition());
        path.insert(path.end(), geometry.begin() + 1, geometry.end());
    }

    if (turn_miss_pending_) {
        const Coordinate* turn_location = nullptr;
        for (const auto& step : route->getSteps()) {
            if (isTurnManeuver(step.maneuver.type)) {
                turn_location = &step.maneuver.location;
                break;
            }
        }
        for (size_t i = 1; turn_location != nullptr && i < path.size(); ++i) {
            if (tripnav::nav_geometry::distanceMeters(path[i], *turn_location) > 1.0) {
                continue;
            }
            const Coordinate previous = path[i - 1];
            const Coordinate corner = path[i];
            double approach = tripnav::nav_geometry::distanceMeters(previous, corner);
            if (approach < 1.0) {
                break;
            }
            double scale = kOvershootMeters / approach;
            path.resize(i + 1);
            path.push_back(Coordinate{corner.latitude + (corner.latitude - previous.latitude) * scale,
                                      corner.longitude + (corner.longitude - previous.longitude) * scale});
            TRIPNAV_LOG_INFO("TripSimulator: Traveler will miss the turn at (%.6f, %.6f).",
                             corner.latitude, corner.longitude);
            break;
        }
    }

    position_source_->setPath(path);
}

void TripSimulator::printGuidance(const NavigationSnapshot& snapshot) const {
    if (!snapshot.active_route) {
        return;
    }
    std::string next_maneuver = snapshot.distance_to_next_maneuver_m >= 0.0
        ? tripnav::nav_route::formatDistance(snapshot.distance_to_next_maneuver_m)
        : std::string("-");
    TRIPNAV_LOG_INFO("TripSimulator: [Step %zu/%zu] %s | next in %s: %s | %s, %s left.",
                     snapshot.current_step_index + 1, snapshot.active_route->getStepCount(),
                     snapshot.current_instruction.c_str(), next_maneuver.c_str(),
                     snapshot.next_instruction.empty() ? "-" : snapshot.next_instruction.c_str(),
                     tripnav::nav_route::formatDistance(snapshot.remaining_route_distance_m).c_str(),
                     tripnav::nav_route::formatDuration(snapshot.remaining_route_duration_s).c_str());
}

} // namespace main_application
