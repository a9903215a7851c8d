// TripNavSim/nav_providers/position_source.h
#ifndef TRIPNAV_POSITION_SOURCE_H
#define TRIPNAV_POSITION_SOURCE_H

#include "../common/datatypes.h"
#include <cstdint>
#include <functional>
#include <string>

namespace tripnav {
namespace nav_providers {

using SubscriptionId = uint64_t;
constexpr SubscriptionId kInvalidSubscriptionId = 0;

using FixCallback = std::function<void(const PositionFix&)>;
using PositionErrorCallback = std::function<void(const std::string& details)>;

// Live position stream (GPS watch or equivalent). Callbacks may arrive on any thread and at
// any cadence, or never.
class IPositionSource {
public:
    virtual ~IPositionSource() = default;

    // Returns kInvalidSubscriptionId if the source cannot start.
    virtual SubscriptionId subscribe(FixCallback on_fix, PositionErrorCallback on_error) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

// Owned subscription handle. release() (or destruction) is the single path that unsubscribes.
class PositionSubscription {
public:
    PositionSubscription();
    PositionSubscription(IPositionSource* source, SubscriptionId id);
    ~PositionSubscription();

    PositionSubscription(const PositionSubscription&) = delete;
    PositionSubscription& operator=(const PositionSubscription&) = delete;
    PositionSubscription(PositionSubscription&& other) noexcept;
    PositionSubscription& operator=(PositionSubscription&& other) noexcept;

    void release();
    bool isActive() const { return source_ != nullptr && id_ != kInvalidSubscriptionId; }
    SubscriptionId getId() const { return id_; }

private:
    IPositionSource* source_; // Not owned
    SubscriptionId id_;
};

} // namespace nav_providers
} // namespace tripnav

#endif // TRIPNAV_POSITION_SOURCE_H
