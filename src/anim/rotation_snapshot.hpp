#pragma once

#include <cstddef>
#include <ndcapture/scene_state.hpp>
#include <optional>

namespace ndcapture
{

// Point-in-time copy of the rotation angles.
//
// Taken after warm-up in stream mode so the main recording starts from the
// same state the preview started from. Restoring consumes the snapshot.
class RotationSnapshot
{
   public:
    RotationSnapshot() = default;

    static RotationSnapshot capture(const RotationState& rotations);

    // Replace `target` with the captured angles. Planes absent from the
    // snapshot are removed. Returns false if nothing was captured or the
    // snapshot was already restored.
    bool restore_into(RotationState& target);

    bool   consumed() const { return !data_.has_value(); }
    size_t plane_count() const { return data_ ? data_->size() : 0; }

   private:
    std::optional<RotationState> data_;
};

}   // namespace ndcapture
