#include "classifier_settings.h"

#include <fstream>
#include <sstream>

#include "absl/log/absl_log.h"
#include "absl/strings/str_cat.h"

namespace {

constexpr char kThumbIndexKey[] = "thumb_index_threshold";
constexpr char kIndexMiddleKey[] = "index_middle_threshold";
constexpr char kLittleFingerKey[] = "little_finger_rule";
constexpr char kFistShortcutKey[] = "fist_shortcut";
constexpr char kOverlayLayoutKey[] = "overlay_layout";

}  // namespace

std::string LittleFingerRuleName(LittleFingerRule rule) {
    switch (rule) {
        case LittleFingerRule::kAlwaysUp:
            return "always_up";
        case LittleFingerRule::kTipAboveBase:
            return "tip_above_base";
    }
    return "always_up";
}

absl::StatusOr<LittleFingerRule> ParseLittleFingerRule(const std::string& name) {
    if (name == "always_up") return LittleFingerRule::kAlwaysUp;
    if (name == "tip_above_base") return LittleFingerRule::kTipAboveBase;
    return absl::InvalidArgumentError(absl::StrCat(
        "Unknown little finger rule '", name, "' (expected always_up or tip_above_base)"));
}

std::string OverlayLayoutModeName(OverlayLayoutMode mode) {
    return mode == OverlayLayoutMode::kFixed ? "fixed" : "stacked";
}

absl::StatusOr<OverlayLayoutMode> ParseOverlayLayoutMode(const std::string& name) {
    if (name == "fixed") return OverlayLayoutMode::kFixed;
    if (name == "stacked") return OverlayLayoutMode::kStacked;
    return absl::InvalidArgumentError(absl::StrCat(
        "Unknown overlay layout '", name, "' (expected fixed or stacked)"));
}

json SettingsToJson(const ClassifierSettings& settings) {
    json j;
    j[kThumbIndexKey] = settings.thresholds.thumb_index;
    j[kIndexMiddleKey] = settings.thresholds.index_middle;
    j[kLittleFingerKey] = LittleFingerRuleName(settings.options.little_finger);
    j[kFistShortcutKey] = settings.options.fist_shortcut;
    j[kOverlayLayoutKey] = OverlayLayoutModeName(settings.overlay_layout);
    return j;
}

absl::Status ApplySettingsJson(const json& j, ClassifierSettings* settings) {
    if (!j.is_object()) {
        return absl::InvalidArgumentError("Settings must be a JSON object");
    }
    ClassifierSettings result = *settings;
    try {
        if (j.contains(kThumbIndexKey)) {
            result.thresholds.thumb_index = j.at(kThumbIndexKey).get<double>();
        }
        if (j.contains(kIndexMiddleKey)) {
            result.thresholds.index_middle = j.at(kIndexMiddleKey).get<double>();
        }
        if (j.contains(kFistShortcutKey)) {
            result.options.fist_shortcut = j.at(kFistShortcutKey).get<bool>();
        }
        if (j.contains(kLittleFingerKey)) {
            absl::StatusOr<LittleFingerRule> rule =
                ParseLittleFingerRule(j.at(kLittleFingerKey).get<std::string>());
            if (!rule.ok()) return rule.status();
            result.options.little_finger = *rule;
        }
        if (j.contains(kOverlayLayoutKey)) {
            absl::StatusOr<OverlayLayoutMode> mode =
                ParseOverlayLayoutMode(j.at(kOverlayLayoutKey).get<std::string>());
            if (!mode.ok()) return mode.status();
            result.overlay_layout = *mode;
        }
    } catch (const json::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("Bad settings value: ", e.what()));
    }

    absl::Status status = ValidateThresholds(result.thresholds);
    if (!status.ok()) return status;
    *settings = result;
    return absl::OkStatus();
}

absl::StatusOr<ClassifierSettings> ParseClassifierSettings(
    const std::string& text, const ClassifierSettings& defaults) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return absl::InvalidArgumentError(absl::StrCat("Malformed settings JSON: ", e.what()));
    }
    ClassifierSettings settings = defaults;
    absl::Status status = ApplySettingsJson(j, &settings);
    if (!status.ok()) return status;
    return settings;
}

absl::StatusOr<ClassifierSettings> LoadClassifierSettings(
    const std::string& path, const ClassifierSettings& defaults) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return absl::NotFoundError(absl::StrCat("Settings file not found: ", path));
    }
    std::stringstream contents;
    contents << file.rdbuf();
    absl::StatusOr<ClassifierSettings> settings = ParseClassifierSettings(contents.str(), defaults);
    if (!settings.ok()) {
        return absl::Status(settings.status().code(),
                            absl::StrCat(path, ": ", settings.status().message()));
    }
    ABSL_LOG(INFO) << "Settings loaded from " << path;
    return settings;
}

absl::Status SaveClassifierSettings(const std::string& path,
                                    const ClassifierSettings& settings) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return absl::UnavailableError(absl::StrCat("Cannot write settings file: ", path));
    }
    file << SettingsToJson(settings).dump(4) << std::endl;
    if (!file) {
        return absl::DataLossError(absl::StrCat("Failed writing settings file: ", path));
    }
    ABSL_LOG(INFO) << "Settings saved to " << path;
    return absl::OkStatus();
}
