#include "rotation_snapshot.hpp"

#include <ndcapture/logger.hpp>

namespace ndcapture
{

RotationSnapshot RotationSnapshot::capture(const RotationState& rotations)
{
    RotationSnapshot snap;
    snap.data_ = rotations;
    NDCAPTURE_LOG_DEBUG("scene", "Captured rotation snapshot ({} planes)", rotations.size());
    return snap;
}

bool RotationSnapshot::restore_into(RotationState& target)
{
    if (!data_)
        return false;

    target = std::move(*data_);
    data_.reset();
    NDCAPTURE_LOG_DEBUG("scene", "Restored rotation snapshot ({} planes)", target.size());
    return true;
}

}   // namespace ndcapture
