// TripNavSim/nav_providers/position_source.cpp
#include "position_source.h"
#include "../common/logger.h"

namespace tripnav {
namespace nav_providers {

PositionSubscription::PositionSubscription() :
    source_(nullptr),
    id_(kInvalidSubscriptionId)
{
}

PositionSubscription::PositionSubscription(IPositionSource* source, SubscriptionId id) :
    source_(source),
    id_(id)
{
}

PositionSubscription::~PositionSubscription() {
    release();
}

PositionSubscription::PositionSubscription(PositionSubscription&& other) noexcept :
    source_(other.source_),
    id_(other.id_)
{
    other.source_ = nullptr;
    other.id_ = kInvalidSubscriptionId;
}

PositionSubscription& PositionSubscription::operator=(PositionSubscription&& other) noexcept {
    if (this != &other) {
        release();
        source_ = other.source_;
        id_ = other.id_;
        other.source_ = nullptr;
        other.id_ = kInvalidSubscriptionId;
    }
    return *this;
}

void PositionSubscription::release() {
    if (!isActive()) {
        return;
    }
    TRIPNAV_LOG_DEBUG("PositionSubscription: Releasing subscription #%llu.",
                      static_cast<unsigned long long>(id_));
    source_->unsubscribe(id_);
    source_ = nullptr;
    id_ = kInvalidSubscriptionId;
}

} // namespace nav_providers
} // namespace tripnav
