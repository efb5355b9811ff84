#include <QtTest/QtTest>

#include "meetings/core/ConflictEngine.hpp"
#include "meetings/data/MeetingIndex.hpp"

using namespace meetings;
using data::Meeting;

namespace {
Meeting makeMeeting(const QString &organizer, const QString &topic, const QString &place,
                    const QTime &start, const QTime &end, const QStringList &invitees = {})
{
    Meeting meeting;
    meeting.topic = topic;
    meeting.organizer = data::Employee{organizer, organizer + QStringLiteral(" Name")};
    for (const QString &id : invitees) {
        meeting.invitees.append(data::Employee{id, id + QStringLiteral(" Name")});
    }
    meeting.place = place;
    meeting.start = QDateTime(QDate(2024, 3, 4), start, Qt::UTC);
    meeting.end = QDateTime(QDate(2024, 3, 4), end, Qt::UTC);
    return meeting;
}

Meeting planning()
{
    return makeMeeting("E1", "Planning", "Room A", QTime(9, 0), QTime(10, 0));
}

Meeting standup()
{
    return makeMeeting("E1", "Standup", "Room B", QTime(9, 30), QTime(9, 45));
}
} // namespace

class ConflictEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void overlapDependsOnArgumentOrder();
    void overlapCases();
    void recordsCausingAndAffected();
    void laterCandidateAgainstEarlierMeetingIsNotFlagged();
    void disjointMeetingsDoNotConflict();
    void inviteesReceiveBuckets();
    void bucketsIgnoreDuplicates();
    void clearMeetingRemovesEveryReference();
    void detectAllUsesOrderedPairs();
};

void ConflictEngineTest::overlapDependsOnArgumentOrder()
{
    QVERIFY(core::overlaps(planning(), standup()));
    QVERIFY(!core::overlaps(standup(), planning()));
}

void ConflictEngineTest::overlapCases()
{
    const Meeting base = planning();

    QVERIFY(core::overlaps(base, makeMeeting("E2", "Same", "Room C", QTime(9, 0), QTime(10, 0))));
    QVERIFY(core::overlaps(base, makeMeeting("E2", "Trailing", "Room C", QTime(9, 30), QTime(11, 0))));
    QVERIFY(!core::overlaps(base, makeMeeting("E2", "Adjacent", "Room C", QTime(10, 0), QTime(11, 0))));
    QVERIFY(!core::overlaps(base, makeMeeting("E2", "SameStart", "Room C", QTime(9, 0), QTime(9, 30))));
    QVERIFY(!core::overlaps(base, makeMeeting("E2", "Before", "Room C", QTime(8, 0), QTime(9, 30))));
}

void ConflictEngineTest::recordsCausingAndAffected()
{
    data::MeetingIndex index;
    index.insert(planning());

    core::ConflictEngine engine;
    const QStringList affected = engine.detectFor(standup(), index);
    QCOMPARE(affected, QStringList{"E1"});

    const QVector<core::ConflictGroup> groups = engine.buckets().groupsFor("E1");
    QCOMPARE(groups.size(), 1);
    QVERIFY(groups.front().causing == standup());
    QCOMPARE(groups.front().affected.size(), 1);
    QVERIFY(groups.front().affected.front() == planning());
}

void ConflictEngineTest::laterCandidateAgainstEarlierMeetingIsNotFlagged()
{
    data::MeetingIndex index;
    index.insert(standup());

    core::ConflictEngine engine;
    QVERIFY(engine.detectFor(planning(), index).isEmpty());
    QVERIFY(engine.buckets().isEmpty());
}

void ConflictEngineTest::disjointMeetingsDoNotConflict()
{
    data::MeetingIndex index;
    index.insert(planning());

    core::ConflictEngine engine;
    const Meeting afternoon = makeMeeting("E1", "Review", "Room A", QTime(14, 0), QTime(15, 0), {"E2"});
    QVERIFY(engine.detectFor(afternoon, index).isEmpty());
    QVERIFY(engine.buckets().groupsFor("E1").isEmpty());
    QVERIFY(engine.buckets().groupsFor("E2").isEmpty());
}

void ConflictEngineTest::inviteesReceiveBuckets()
{
    data::MeetingIndex index;
    index.insert(makeMeeting("E2", "Sync", "Room C", QTime(9, 0), QTime(10, 0)));

    core::ConflictEngine engine;
    const Meeting candidate = makeMeeting("E1", "Standup", "Room B", QTime(9, 30), QTime(9, 45), {"E2"});
    QCOMPARE(engine.detectFor(candidate, index), QStringList{"E2"});
    QVERIFY(engine.buckets().hasGroup("E2", candidate));
    QVERIFY(!engine.buckets().hasGroup("E1", candidate));
}

void ConflictEngineTest::bucketsIgnoreDuplicates()
{
    core::ConflictBuckets buckets;
    QVERIFY(buckets.add("E1", standup(), planning()));
    QVERIFY(!buckets.add("E1", standup(), planning()));
    QCOMPARE(buckets.affectedBy("E1", standup()).size(), 1);
}

void ConflictEngineTest::clearMeetingRemovesEveryReference()
{
    data::MeetingIndex index;
    index.insert(planning());
    index.insert(standup());

    core::ConflictEngine engine;
    const Meeting late = makeMeeting("E1", "Late", "Room C", QTime(9, 40), QTime(9, 50));
    engine.detectFor(standup(), index);
    engine.detectFor(late, index);
    QCOMPARE(engine.buckets().groupsFor("E1").size(), 2);

    // Standup is causing in one group and affected in the other.
    const QStringList changed = engine.clearMeeting(standup());
    QCOMPARE(changed, QStringList{"E1"});
    QVERIFY(!engine.buckets().references(standup()));

    const QVector<core::ConflictGroup> groups = engine.buckets().groupsFor("E1");
    QCOMPARE(groups.size(), 1);
    QVERIFY(groups.front().causing == late);
    QCOMPARE(groups.front().affected.size(), 1);
    QVERIFY(groups.front().affected.front() == planning());

    engine.clearMeeting(planning());
    QVERIFY(engine.buckets().isEmpty());
}

void ConflictEngineTest::detectAllUsesOrderedPairs()
{
    core::ConflictEngine engine;
    const Meeting invited = makeMeeting("E1", "Standup", "Room B", QTime(9, 30), QTime(9, 45), {"E2"});
    QCOMPARE(engine.detectAll({planning(), invited}), 2);

    QVERIFY(engine.buckets().hasGroup("E1", invited));
    QVERIFY(engine.buckets().hasGroup("E2", invited));
    QVERIFY(!engine.buckets().hasGroup("E1", planning()));

    engine.reset();
    QVERIFY(engine.buckets().isEmpty());
}

QTEST_GUILESS_MAIN(ConflictEngineTest)
#include "ConflictEngineTest.moc"
