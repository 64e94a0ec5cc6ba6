#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "finger_counter.h"
#include "OverlayRenderer.h"

// For convenience
using json = nlohmann::json;

// Everything the tracker can load from or save to a settings file.
struct ClassifierSettings {
    FingerThresholds thresholds;
    FingerCountOptions options;
    OverlayLayoutMode overlay_layout = OverlayLayoutMode::kStacked;
};

std::string LittleFingerRuleName(LittleFingerRule rule);
absl::StatusOr<LittleFingerRule> ParseLittleFingerRule(const std::string& name);

std::string OverlayLayoutModeName(OverlayLayoutMode mode);
absl::StatusOr<OverlayLayoutMode> ParseOverlayLayoutMode(const std::string& name);

json SettingsToJson(const ClassifierSettings& settings);

// Keys missing from the document keep the values already in *settings.
absl::Status ApplySettingsJson(const json& j, ClassifierSettings* settings);

absl::StatusOr<ClassifierSettings> ParseClassifierSettings(
    const std::string& text, const ClassifierSettings& defaults = {});

// NotFound when the file does not exist.
absl::StatusOr<ClassifierSettings> LoadClassifierSettings(
    const std::string& path, const ClassifierSettings& defaults = {});

absl::Status SaveClassifierSettings(const std::string& path,
                                    const ClassifierSettings& settings);
