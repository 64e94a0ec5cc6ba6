#ifndef FINGER_COUNTER_H
#define FINGER_COUNTER_H

#include "absl/status/statusor.h"
#include "hand_landmarks.h"

// Pixel distances under which the thumb-index and index-middle tips are
// treated as closed together. Both must be non-negative.
struct FingerThresholds {
    double thumb_index = 0.1;
    double index_middle = 0.1;
};

// How the little finger is decided.
//   kAlwaysUp     - counted on every hand, no comparison is made.
//   kTipAboveBase - counted when its tip is above its MCP joint.
enum class LittleFingerRule { kAlwaysUp, kTipAboveBase };

struct FingerCountOptions {
    LittleFingerRule little_finger = LittleFingerRule::kAlwaysUp;
    // Report 0 when both tip distances fall under their thresholds.
    bool fist_shortcut = true;
};

class FingerState {
public:
    int num_fingers_held_up = 0;
    bool closed_fist = false;
    bool thumb_held_up = false;
    bool index_held_up = false;
    bool middle_held_up = false;
    bool ring_held_up = false;
    bool pinky_held_up = false;
};

absl::Status ValidateThresholds(const FingerThresholds& thresholds);

// Classifies one hand from its 21 landmarks using the vertical order of
// neighbouring fingertips. Only the image y axis is consulted, so the result
// is meaningful for an upright hand facing the camera.
absl::StatusOr<FingerState> ClassifyFingers(const HandLandmarks& landmarks,
                                            const FingerThresholds& thresholds,
                                            const FingerCountOptions& options = {});

// Number of fingers held up, in [0, 5].
absl::StatusOr<int> CountFingers(const HandLandmarks& landmarks,
                                 const FingerThresholds& thresholds,
                                 const FingerCountOptions& options = {});

#endif
