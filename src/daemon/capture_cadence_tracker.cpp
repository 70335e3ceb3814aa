#include "daemon/capture_cadence_tracker.hpp"

#include <algorithm>

#include "common/logging.hpp"

namespace sprout {

void CaptureCadenceTracker::observe(const Project &project,
                                    std::chrono::system_clock::time_point now)
{
    if (m_lastCaptureAt.count(project.id) > 0) {
        return;
    }

    const auto seeded = project.lastCaptureAt
        ? *project.lastCaptureAt
        : now - std::chrono::seconds(project.timelapseIntervalSeconds);
    m_lastCaptureAt[project.id] = seeded;

    SLOG_DEBUG(QStringLiteral("CaptureCadenceTracker"),
               QStringLiteral("observe"),
               QStringLiteral("timelapse_timer_seeded"),
               QStringLiteral("project_needs_timelapse"),
               project.lastCaptureAt ? QStringLiteral("persisted_last_capture")
                                     : QStringLiteral("capture_immediately"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"projectId", project.id},
                              {"intervalSeconds", project.timelapseIntervalSeconds}});
}

bool CaptureCadenceTracker::due(const Project &project,
                                std::chrono::system_clock::time_point now)
{
    observe(project, now);
    const auto last = m_lastCaptureAt.at(project.id);
    return now - last >= std::chrono::seconds(project.timelapseIntervalSeconds);
}

void CaptureCadenceTracker::record(std::int64_t projectId,
                                   std::chrono::system_clock::time_point now)
{
    m_lastCaptureAt[projectId] = now;
}

void CaptureCadenceTracker::retain(const std::vector<std::int64_t> &projectIds)
{
    for (auto it = m_lastCaptureAt.begin(); it != m_lastCaptureAt.end();) {
        if (std::find(projectIds.begin(), projectIds.end(), it->first) == projectIds.end()) {
            SLOG_DEBUG(QStringLiteral("CaptureCadenceTracker"),
                       QStringLiteral("retain"),
                       QStringLiteral("timelapse_timer_dropped"),
                       QStringLiteral("project_inactive"),
                       QStringLiteral("erase_timer"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"projectId", it->first}});
            it = m_lastCaptureAt.erase(it);
        } else {
            ++it;
        }
    }
}

void CaptureCadenceTracker::forceDue(std::int64_t projectId)
{
    // The epoch is older than any interval.
    m_lastCaptureAt[projectId] = std::chrono::system_clock::time_point{};
}

void CaptureCadenceTracker::drop(std::int64_t projectId)
{
    m_lastCaptureAt.erase(projectId);
}

bool CaptureCadenceTracker::isTracking(std::int64_t projectId) const
{
    return m_lastCaptureAt.count(projectId) > 0;
}

std::optional<std::chrono::system_clock::time_point>
CaptureCadenceTracker::lastCapture(std::int64_t projectId) const
{
    auto it = m_lastCaptureAt.find(projectId);
    if (it == m_lastCaptureAt.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t CaptureCadenceTracker::size() const
{
    return m_lastCaptureAt.size();
}

} // namespace sprout
