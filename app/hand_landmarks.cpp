#include "hand_landmarks.h"

#include "absl/strings/str_cat.h"

absl::Status ValidateHandLandmarks(const HandLandmarks& landmarks) {
    if (landmarks.size() != static_cast<size_t>(kNumHandLandmarks)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Expected ", kNumHandLandmarks, " hand landmarks, got ",
                         landmarks.size()));
    }
    return absl::OkStatus();
}

HandSide LabelHandSide(const Landmark& wrist, int frame_width) {
    return wrist.x < frame_width / 2 ? HandSide::kLeft : HandSide::kRight;
}

std::string HandSideName(HandSide side) {
    return side == HandSide::kLeft ? "Left" : "Right";
}
