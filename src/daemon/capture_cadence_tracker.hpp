#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace sprout {

// CaptureCadenceTracker keeps the last time-lapse capture instant of every
// project that currently needs time-lapse and answers whether the next photo
// is due. Persisting a capture is left to the caller.
class CaptureCadenceTracker {
public:
    // Seed the timer for a project seen for the first time: from its persisted
    // last capture if any, otherwise one interval in the past so the first
    // capture happens immediately.
    void observe(const Project &project, std::chrono::system_clock::time_point now);

    bool due(const Project &project, std::chrono::system_clock::time_point now);
    void record(std::int64_t projectId, std::chrono::system_clock::time_point now);

    // Drop every project not listed in `projectIds`.
    void retain(const std::vector<std::int64_t> &projectIds);

    void forceDue(std::int64_t projectId);
    void drop(std::int64_t projectId);

    bool isTracking(std::int64_t projectId) const;
    std::optional<std::chrono::system_clock::time_point>
        lastCapture(std::int64_t projectId) const;
    std::size_t size() const;

private:
    std::map<std::int64_t, std::chrono::system_clock::time_point> m_lastCaptureAt;
};

} // namespace sprout
