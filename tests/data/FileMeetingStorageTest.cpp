#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "meetings/data/FileMeetingStorage.hpp"
#include "meetings/data/MeetingJson.hpp"

using namespace meetings::data;

namespace {
Meeting makeMeeting(const QString &topic, int startHour, int endHour)
{
    Meeting meeting;
    meeting.topic = topic;
    meeting.organizer = Employee{QStringLiteral("E1"), QStringLiteral("Alice Example")};
    meeting.invitees = {Employee{QStringLiteral("E2"), QStringLiteral("Bob Example")}};
    meeting.place = QStringLiteral("Room A");
    meeting.start = QDateTime(QDate(2024, 3, 4), QTime(startHour, 0), Qt::UTC);
    meeting.end = QDateTime(QDate(2024, 3, 4), QTime(endHour, 0), Qt::UTC);
    return meeting;
}

bool writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(content) == content.size();
}
} // namespace

class FileMeetingStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void missingFileLoadsEmpty();
    void replaceAllPersistsMeetings();
    void replaceAllCreatesDirectories();
    void corruptFileLoadsEmpty();
    void skipsInvalidEntries();
    void replaceAllReportsFailure();
};

void FileMeetingStorageTest::missingFileLoadsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    FileMeetingStorage storage(dir.filePath(QStringLiteral("meetings.json")));
    QVERIFY(storage.loadAll().isEmpty());
}

void FileMeetingStorageTest::replaceAllPersistsMeetings()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("meetings.json"));

    FileMeetingStorage storage(path);
    QVERIFY(storage.replaceAll({makeMeeting(QStringLiteral("Planning"), 9, 10),
                                makeMeeting(QStringLiteral("Review"), 13, 14)}));

    FileMeetingStorage reopened(path);
    const QVector<Meeting> loaded = reopened.loadAll();
    QCOMPARE(loaded.size(), 2);
    QVERIFY(loaded.at(0) == makeMeeting(QStringLiteral("Planning"), 9, 10));
    QCOMPARE(loaded.at(1).topic, QStringLiteral("Review"));

    QVERIFY(storage.replaceAll({}));
    QVERIFY(reopened.loadAll().isEmpty());
}

void FileMeetingStorageTest::replaceAllCreatesDirectories()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("state/server/meetings.json"));

    FileMeetingStorage storage(path);
    QVERIFY(storage.replaceAll({makeMeeting(QStringLiteral("Planning"), 9, 10)}));
    QVERIFY(QFile::exists(path));
}

void FileMeetingStorageTest::corruptFileLoadsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("meetings.json"));
    QVERIFY(writeFile(path, "[{\"meetingTopic\": "));

    FileMeetingStorage storage(path);
    QVERIFY(storage.loadAll().isEmpty());
}

void FileMeetingStorageTest::skipsInvalidEntries()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("meetings.json"));

    const QByteArray valid = encodeMeeting(makeMeeting(QStringLiteral("Planning"), 9, 10));
    const QByteArray backwards = encodeMeeting(makeMeeting(QStringLiteral("Backwards"), 10, 9));
    QVERIFY(writeFile(path, "[" + valid + "," + backwards + ",{\"meetingTopic\":\"x\"},7]"));

    FileMeetingStorage storage(path);
    const QVector<Meeting> loaded = storage.loadAll();
    QCOMPARE(loaded.size(), 1);
    QCOMPARE(loaded.front().topic, QStringLiteral("Planning"));
}

void FileMeetingStorageTest::replaceAllReportsFailure()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    QVERIFY(writeFile(blocker, "not a directory"));

    FileMeetingStorage storage(blocker + QStringLiteral("/meetings.json"));
    QVERIFY(!storage.replaceAll({makeMeeting(QStringLiteral("Planning"), 9, 10)}));
}

QTEST_GUILESS_MAIN(FileMeetingStorageTest)
#include "FileMeetingStorageTest.moc"
