// TripNavSim/nav_guidance/reroute_scheduler.cpp
#include "reroute_scheduler.h"
#include "../common/logger.h"
#include "../common/nav_constants.h"
#include <utility>

namespace tripnav {
namespace nav_guidance {

RerouteScheduler::RerouteScheduler(nav_scheduling::EventLoop& loop,
                                   nav_providers::IRouteProvider* route_provider,
                                   const Coordinate& destination,
                                   ResultHandler on_result) :
    loop_(loop),
    route_provider_(route_provider),
    destination_(destination),
    on_result_(std::move(on_result)),
    debounce_timer_(loop),
    cycle_in_flight_(false),
    fetch_outstanding_(false),
    cycle_id_(0),
    fetches_issued_(0),
    alive_token_(std::make_shared<bool>(true))
{
    TRIPNAV_LOG_DEBUG("RerouteScheduler: Initializing. Debounce: %lld ms.",
                      static_cast<long long>(constants::kRerouteDebounceMs));
}

RerouteScheduler::~RerouteScheduler() {
    cancel();
    TRIPNAV_LOG_DEBUG("RerouteScheduler: Shutting down. Fetches issued: %llu.",
                      static_cast<unsigned long long>(fetches_issued_));
}

void RerouteScheduler::setDestination(const Coordinate& destination) {
    destination_ = destination;
}

bool RerouteScheduler::requestReroute(const Coordinate& origin, uint64_t validity_token) {
    if (cycle_in_flight_) {
        TRIPNAV_LOG_VERBOSE("RerouteScheduler: Reroute already in flight (cycle %llu). Request ignored.",
                            static_cast<unsigned long long>(cycle_id_));
        return false;
    }

    ++cycle_id_;
    cycle_in_flight_ = true;
    const uint64_t cycle_id = cycle_id_;

    bool armed = debounce_timer_.start(constants::kRerouteDebounceMs, [this, origin, validity_token, cycle_id]() {
        issueFetch(origin, validity_token, cycle_id);
    });
    if (!armed) {
        TRIPNAV_LOG_WARNING("RerouteScheduler: Debounce timer unexpectedly armed at cycle %llu start.",
                            static_cast<unsigned long long>(cycle_id));
    }

    TRIPNAV_LOG_INFO("RerouteScheduler: Reroute cycle %llu armed from (%.6f, %.6f). Fetch in %lld ms.",
                     static_cast<unsigned long long>(cycle_id), origin.latitude, origin.longitude,
                     static_cast<long long>(constants::kRerouteDebounceMs));
    return true;
}

void RerouteScheduler::cancel() {
    debounce_timer_.cancel();
    if (!cycle_in_flight_) {
        return;
    }
    TRIPNAV_LOG_INFO("RerouteScheduler: Reroute cycle %llu cancelled%s.",
                     static_cast<unsigned long long>(cycle_id_),
                     fetch_outstanding_ ? " (outstanding fetch result will be discarded)" : "");
    ++cycle_id_;
    cycle_in_flight_ = false;
    fetch_outstanding_ = false;
}

void RerouteScheduler::issueFetch(const Coordinate& origin, uint64_t validity_token, uint64_t cycle_id) {
    if (cycle_id != cycle_id_ || !cycle_in_flight_) {
        TRIPNAV_LOG_DEBUG("RerouteScheduler: Stale debounce firing for cycle %llu ignored.",
                          static_cast<unsigned long long>(cycle_id));
        return;
    }

    fetch_outstanding_ = true;
    ++fetches_issued_;

    if (route_provider_ == nullptr) {
        TRIPNAV_LOG_ERROR("RerouteScheduler: No route provider configured. Reroute cycle %llu fails.",
                          static_cast<unsigned long long>(cycle_id));
        nav_providers::RouteFetchResult failure{false, "No route provider configured", nav_route::RouteResponse{}};
        std::weak_ptr<bool> alive = alive_token_;
        loop_.post([this, alive, cycle_id, validity_token, failure]() {
            if (alive.lock()) {
                onFetchCompleted(cycle_id, validity_token, failure);
            }
        });
        return;
    }

    TRIPNAV_LOG_INFO("RerouteScheduler: Issuing reroute fetch #%llu from (%.6f, %.6f) to (%.6f, %.6f).",
                     static_cast<unsigned long long>(fetches_issued_),
                     origin.latitude, origin.longitude, destination_.latitude, destination_.longitude);

    std::weak_ptr<bool> alive = alive_token_;
    nav_scheduling::EventLoop* loop = &loop_;
    route_provider_->fetchRoute(origin, destination_,
        [this, alive, loop, cycle_id, validity_token](const nav_providers::RouteFetchResult& result) {
            // May run on a provider thread: hop onto the event queue before touching any state.
            loop->post([this, alive, cycle_id, validity_token, result]() {
                if (!alive.lock()) {
                    return;
                }
                onFetchCompleted(cycle_id, validity_token, result);
            });
        });
}

void RerouteScheduler::onFetchCompleted(uint64_t cycle_id, uint64_t validity_token,
                                        const nav_providers::RouteFetchResult& result) {
    if (cycle_id != cycle_id_ || !fetch_outstanding_) {
        TRIPNAV_LOG_INFO("RerouteScheduler: Discarding result of abandoned reroute cycle %llu.",
                         static_cast<unsigned long long>(cycle_id));
        return;
    }
    fetch_outstanding_ = false;
    cycle_in_flight_ = false;

    TRIPNAV_LOG_DEBUG("RerouteScheduler: Reroute cycle %llu completed (transport %s).",
                      static_cast<unsigned long long>(cycle_id), result.transport_ok ? "OK" : "FAILED");
    if (on_result_) {
        on_result_(validity_token, result);
    }
}

} // namespace nav_guidance
} // namespace tripnav
