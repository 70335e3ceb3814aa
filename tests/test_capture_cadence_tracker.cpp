#include <QtTest/QtTest>

#include "daemon/capture_cadence_tracker.hpp"

class CaptureCadenceTrackerTests : public QObject
{
    Q_OBJECT
private slots:
    void testFirstCaptureIsImmediate();
    void testSeededFromPersistedCapture();
    void testRecordRestartsInterval();
    void testRetainDropsInactiveProjects();
    void testForceDue();

private:
    static sprout::Project project(std::int64_t id, int intervalSeconds);
    static std::chrono::system_clock::time_point t0()
    {
        return std::chrono::system_clock::from_time_t(1700000000);
    }
};

sprout::Project CaptureCadenceTrackerTests::project(std::int64_t id, int intervalSeconds)
{
    sprout::Project value;
    value.id = id;
    value.name = "project";
    value.timelapseEnabled = true;
    value.timelapseIntervalSeconds = intervalSeconds;
    return value;
}

void CaptureCadenceTrackerTests::testFirstCaptureIsImmediate()
{
    sprout::CaptureCadenceTracker tracker;
    const auto p = project(1, 300);
    QVERIFY(!tracker.isTracking(1));
    QVERIFY(tracker.due(p, t0()));
    QVERIFY(tracker.isTracking(1));
    QVERIFY(tracker.lastCapture(1) == t0() - std::chrono::seconds(300));
}

void CaptureCadenceTrackerTests::testSeededFromPersistedCapture()
{
    sprout::CaptureCadenceTracker tracker;
    auto p = project(2, 300);
    p.lastCaptureAt = t0() - std::chrono::seconds(100);

    QVERIFY(!tracker.due(p, t0()));
    QVERIFY(!tracker.due(p, t0() + std::chrono::seconds(199)));
    QVERIFY(tracker.due(p, t0() + std::chrono::seconds(200)));

    // Observing again does not reseed a tracked project.
    p.lastCaptureAt = t0() + std::chrono::seconds(150);
    tracker.observe(p, t0() + std::chrono::seconds(200));
    QVERIFY(tracker.lastCapture(2) == t0() - std::chrono::seconds(100));
}

void CaptureCadenceTrackerTests::testRecordRestartsInterval()
{
    sprout::CaptureCadenceTracker tracker;
    const auto p = project(3, 60);
    QVERIFY(tracker.due(p, t0()));
    tracker.record(3, t0());

    QVERIFY(!tracker.due(p, t0() + std::chrono::seconds(59)));
    QVERIFY(tracker.due(p, t0() + std::chrono::seconds(60)));

    // Without a record the photo stays due on later ticks.
    QVERIFY(tracker.due(p, t0() + std::chrono::seconds(90)));
}

void CaptureCadenceTrackerTests::testRetainDropsInactiveProjects()
{
    sprout::CaptureCadenceTracker tracker;
    tracker.observe(project(1, 300), t0());
    tracker.observe(project(2, 300), t0());
    tracker.observe(project(3, 300), t0());
    QCOMPARE(static_cast<int>(tracker.size()), 3);

    tracker.retain({2});
    QCOMPARE(static_cast<int>(tracker.size()), 1);
    QVERIFY(tracker.isTracking(2));
    QVERIFY(!tracker.isTracking(1));

    tracker.drop(2);
    QCOMPARE(static_cast<int>(tracker.size()), 0);
    QVERIFY(!tracker.lastCapture(2).has_value());
}

void CaptureCadenceTrackerTests::testForceDue()
{
    sprout::CaptureCadenceTracker tracker;
    const auto p = project(4, 3600);
    tracker.record(4, t0());
    QVERIFY(!tracker.due(p, t0() + std::chrono::seconds(10)));

    tracker.forceDue(4);
    QVERIFY(tracker.due(p, t0() + std::chrono::seconds(10)));
}

QTEST_MAIN(CaptureCadenceTrackerTests)
#include "test_capture_cadence_tracker.moc"
