#pragma once

namespace sprout {

enum class DeviceMode {
    Schedule,
    Threshold,
    Auto,
    Manual
};

// Fixed semantic role of a device when it is driven by thresholds.
enum class DeviceRole {
    ShedExcess,
    CompensateDeficit,
    None
};

enum class DeviceDecision {
    On,
    Off,
    NoOpinion
};

enum class ProjectStatus {
    Active,
    Completed,
    Archived
};

} // namespace sprout
