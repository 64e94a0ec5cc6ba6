#include "finger_counter.h"

#include <cmath>
#include <cstdlib>

#include "absl/strings/str_cat.h"

absl::Status ValidateThresholds(const FingerThresholds& thresholds) {
    if (!std::isfinite(thresholds.thumb_index) || thresholds.thumb_index < 0.0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Thumb-index threshold must be non-negative, got ",
                         thresholds.thumb_index));
    }
    if (!std::isfinite(thresholds.index_middle) || thresholds.index_middle < 0.0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Index-middle threshold must be non-negative, got ",
                         thresholds.index_middle));
    }
    return absl::OkStatus();
}

absl::StatusOr<FingerState> ClassifyFingers(const HandLandmarks& landmarks,
                                            const FingerThresholds& thresholds,
                                            const FingerCountOptions& options) {
    absl::Status status = ValidateHandLandmarks(landmarks);
    if (!status.ok()) return status;
    status = ValidateThresholds(thresholds);
    if (!status.ok()) return status;

    const Landmark& thumb_tip = landmarks[kThumbTip];
    const Landmark& index_tip = landmarks[kIndexTip];
    const Landmark& middle_tip = landmarks[kMiddleTip];
    const Landmark& ring_tip = landmarks[kRingTip];
    const Landmark& pinky_tip = landmarks[kPinkyTip];
    const Landmark& pinky_base = landmarks[kPinkyMcp];

    FingerState ret;

    const int thumb_index_dist = std::abs(thumb_tip.y - index_tip.y);
    const int index_middle_dist = std::abs(index_tip.y - middle_tip.y);
    if (options.fist_shortcut &&
        thumb_index_dist < thresholds.thumb_index &&
        index_middle_dist < thresholds.index_middle) {
        ret.closed_fist = true;
        return ret;
    }

    ret.thumb_held_up = thumb_tip.y < index_tip.y;
    ret.index_held_up = index_tip.y < middle_tip.y;
    ret.middle_held_up = middle_tip.y < ring_tip.y;
    ret.ring_held_up = ring_tip.y < pinky_tip.y;
    switch (options.little_finger) {
        case LittleFingerRule::kAlwaysUp:
            ret.pinky_held_up = true;
            break;
        case LittleFingerRule::kTipAboveBase:
            ret.pinky_held_up = pinky_tip.y < pinky_base.y;
            break;
    }

    ret.num_fingers_held_up = ret.thumb_held_up + ret.index_held_up +
                              ret.middle_held_up + ret.ring_held_up +
                              ret.pinky_held_up;
    return ret;
}

absl::StatusOr<int> CountFingers(const HandLandmarks& landmarks,
                                 const FingerThresholds& thresholds,
                                 const FingerCountOptions& options) {
    absl::StatusOr<FingerState> state = ClassifyFingers(landmarks, thresholds, options);
    if (!state.ok()) return state.status();
    return state->num_fingers_held_up;
}
