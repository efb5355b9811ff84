#include <QtTest/QtTest>

#include <memory>

#include "meetings/client/ClientReconciler.hpp"
#include "meetings/data/InMemoryMeetingStorage.hpp"

using namespace meetings;
using data::Meeting;

namespace {
Meeting makeMeeting(const QString &organizer, const QString &topic, const QString &place, int startHour, int endHour)
{
    Meeting meeting;
    meeting.topic = topic;
    meeting.organizer = data::Employee{organizer, organizer + QStringLiteral(" Name")};
    meeting.place = place;
    meeting.start = QDateTime(QDate(2024, 3, 4), QTime(startHour, 0), Qt::UTC);
    meeting.end = QDateTime(QDate(2024, 3, 4), QTime(endHour, 0), Qt::UTC);
    return meeting;
}
} // namespace

class ClientReconcilerTest : public QObject
{
    Q_OBJECT

private slots:
    void mergeUpsertsByIdentity();
    void conflictQueueIgnoresDuplicates();
    void resolutionDropsMatchingConflicts();
    void deletionRemovesCachedMeeting();
    void acknowledgmentsUpdateCache();
    void cacheIsPersisted();
};

void ClientReconcilerTest::mergeUpsertsByIdentity()
{
    client::ClientReconciler reconciler;
    int changes = 0;
    connect(&reconciler, &client::ClientReconciler::meetingsChanged, this, [&changes]() { ++changes; });

    reconciler.mergeMeetings({makeMeeting("E1", "Planning", "Room A", 9, 10), makeMeeting("E1", "Review", "Room A", 13, 14)});
    reconciler.mergeMeetings({makeMeeting("E1", "Planning", "Room A", 10, 11), makeMeeting("E1", "Planning", "Room B", 15, 16)});

    QCOMPARE(reconciler.meetings().size(), 3);
    QCOMPARE(reconciler.meetings().at(0).start.time(), QTime(10, 0));
    QCOMPARE(reconciler.meetings().at(2).place, QStringLiteral("Room B"));
    QCOMPARE(changes, 2);
}

void ClientReconcilerTest::conflictQueueIgnoresDuplicates()
{
    client::ClientReconciler reconciler;
    int received = 0;
    connect(&reconciler, &client::ClientReconciler::conflictReceived, this,
            [&received](const Meeting &) { ++received; });

    const Meeting standup = makeMeeting("E1", "Standup", "Room B", 9, 10);
    reconciler.applyConflict(standup);
    reconciler.applyConflict(standup);
    reconciler.applyConflict(makeMeeting("E1", "Planning", "Room A", 9, 11));

    QCOMPARE(received, 3);
    QCOMPARE(reconciler.pendingConflicts().size(), 2);
    QVERIFY(reconciler.pendingConflicts().front() == standup);

    reconciler.clearPendingConflicts();
    QVERIFY(reconciler.pendingConflicts().isEmpty());
}

void ClientReconcilerTest::resolutionDropsMatchingConflicts()
{
    client::ClientReconciler reconciler;
    int resolved = 0;
    connect(&reconciler, &client::ClientReconciler::conflictResolved, this,
            [&resolved](const Meeting &) { ++resolved; });

    reconciler.applyConflict(makeMeeting("E1", "Standup", "Room B", 9, 10));
    reconciler.applyConflict(makeMeeting("E1", "Planning", "Room A", 9, 11));

    // Matched by organizer and topic, so the new time and room do not matter.
    reconciler.applyResolution(makeMeeting("E1", "Standup", "Room C", 14, 15));

    QCOMPARE(resolved, 1);
    QCOMPARE(reconciler.pendingConflicts().size(), 1);
    QCOMPARE(reconciler.pendingConflicts().front().topic, QStringLiteral("Planning"));
}

void ClientReconcilerTest::deletionRemovesCachedMeeting()
{
    client::ClientReconciler reconciler;
    int deleted = 0;
    connect(&reconciler, &client::ClientReconciler::meetingDeleted, this,
            [&deleted](const Meeting &) { ++deleted; });

    const Meeting planning = makeMeeting("E2", "Planning", "Room A", 9, 10);
    reconciler.mergeMeetings({planning, makeMeeting("E2", "Review", "Room A", 13, 14)});
    reconciler.applyConflict(planning);

    reconciler.applyDeletion(planning);
    QCOMPARE(deleted, 1);
    QCOMPARE(reconciler.meetings().size(), 1);
    QCOMPARE(reconciler.meetings().front().topic, QStringLiteral("Review"));
    QVERIFY(reconciler.pendingConflicts().isEmpty());
}

void ClientReconcilerTest::acknowledgmentsUpdateCache()
{
    client::ClientReconciler reconciler;
    const Meeting planning = makeMeeting("E1", "Planning", "Room A", 9, 10);
    reconciler.recordCreated(planning);
    reconciler.applyConflict(planning);
    QCOMPARE(reconciler.meetings().size(), 1);

    const Meeting moved = makeMeeting("E1", "Planning", "Room A", 11, 12);
    reconciler.recordUpdated(moved);
    QCOMPARE(reconciler.meetings().size(), 1);
    QVERIFY(reconciler.meetings().front() == moved);
    QVERIFY(reconciler.pendingConflicts().isEmpty());

    reconciler.recordDeleted(moved);
    QVERIFY(reconciler.meetings().isEmpty());
}

void ClientReconcilerTest::cacheIsPersisted()
{
    const Meeting cached = makeMeeting("E1", "Planning", "Room A", 9, 10);
    auto storage = std::make_shared<data::InMemoryMeetingStorage>(QVector<Meeting>{cached});

    client::ClientReconciler reconciler(storage);
    QCOMPARE(reconciler.meetings().size(), 1);
    QVERIFY(reconciler.meetings().front() == cached);

    reconciler.recordCreated(makeMeeting("E1", "Review", "Room A", 13, 14));
    QCOMPARE(storage->writeCount(), 1);
    QCOMPARE(storage->meetings().size(), 2);

    // Pending conflicts live in memory only.
    reconciler.applyConflict(cached);
    QCOMPARE(storage->writeCount(), 1);

    reconciler.applyDeletion(cached);
    QCOMPARE(storage->writeCount(), 2);
    QCOMPARE(storage->meetings().size(), 1);
}

QTEST_GUILESS_MAIN(ClientReconcilerTest)
#include "ClientReconcilerTest.moc"
