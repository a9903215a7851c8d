// TripNavSim/nav_simulation/simulated_position_source.h
#ifndef TRIPNAV_SIMULATED_POSITION_SOURCE_H
#define TRIPNAV_SIMULATED_POSITION_SOURCE_H

#include "../common/datatypes.h"
#include "../nav_providers/position_source.h"
#include "../nav_scheduling/event_loop.h"
#include "../nav_scheduling/single_shot_timer.h"
#include <cstdint>
#include <string>
#include <vector>

namespace tripnav {
namespace nav_simulation {

// Moves a traveler along a polyline at constant speed and reports a fix every interval.
// Only one subscriber at a time, like a GPS watch.
class SimulatedPositionSource : public nav_providers::IPositionSource {
public:
    SimulatedPositionSource(nav_scheduling::EventLoop& loop, int64_t fix_interval_ms, double speed_mps);
    ~SimulatedPositionSource() override;

    nav_providers::SubscriptionId subscribe(nav_providers::FixCallback on_fix,
                                            nav_providers::PositionErrorCallback on_error) override;
    void unsubscribe(nav_providers::SubscriptionId id) override;

    // Restarts the traveler at path.front().
    void setPath(const std::vector<Coordinate>& path);
    void setFailToStart(bool fail) { fail_to_start_ = fail; }
    void injectError(const std::string& details);

    bool hasSubscriber() const { return active_id_ != nav_providers::kInvalidSubscriptionId; }
    Coordinate getCurrentPosition() const { return current_position_; }
    int getFixesEmitted() const { return fixes_emitted_; }

private:
    nav_scheduling::EventLoop& loop_;
    int64_t fix_interval_ms_;
    double speed_mps_;
    bool fail_to_start_;

    std::vector<Coordinate> path_;
    size_t segment_index_;
    double segment_progress_m_;
    Coordinate current_position_;

    nav_providers::SubscriptionId next_id_;
    nav_providers::SubscriptionId active_id_;
    nav_providers::FixCallback on_fix_;
    nav_providers::PositionErrorCallback on_error_;
    nav_scheduling::SingleShotTimer tick_timer_;
    int fixes_emitted_;

    void onTick();
    void moveAlongPath(double distance_m);
};

} // namespace nav_simulation
} // namespace tripnav

#endif // TRIPNAV_SIMULATED_POSITION_SOURCE_H
