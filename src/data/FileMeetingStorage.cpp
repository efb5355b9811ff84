#include "meetings/data/FileMeetingStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include "meetings/core/Logging.hpp"
#include "meetings/data/MeetingJson.hpp"

namespace meetings {
namespace data {

FileMeetingStorage::FileMeetingStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileMeetingStorage::filePath() const
{
    return m_filePath;
}

QVector<Meeting> FileMeetingStorage::loadAll()
{
    QVector<Meeting> meetings;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcStore) << "No meetings file at" << m_filePath << "- starting empty";
        return meetings;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore) << "Cannot read" << m_filePath << file.errorString();
        return meetings;
    }

    const QByteArray content = file.readAll();
    if (content.trimmed().isEmpty()) {
        return meetings;
    }

    QJsonParseError error{};
    const QJsonDocument document = QJsonDocument::fromJson(content, &error);
    if (error.error != QJsonParseError::NoError || !document.isArray()) {
        qCWarning(lcStore) << "Ignoring corrupt meetings file" << m_filePath << error.errorString();
        return meetings;
    }

    const QJsonArray array = document.array();
    meetings.reserve(array.size());
    for (const QJsonValue &value : array) {
        const auto meeting = value.isObject() ? meetingFromJson(value.toObject()) : std::nullopt;
        if (!meeting) {
            qCWarning(lcStore) << "Skipping malformed meeting entry in" << m_filePath;
            continue;
        }
        QString reason;
        if (!isValid(*meeting, &reason)) {
            qCWarning(lcStore) << "Skipping invalid meeting" << meeting->topic << ":" << reason;
            continue;
        }
        meetings.append(*meeting);
    }

    qCInfo(lcStore) << "Loaded" << meetings.size() << "meetings from" << m_filePath;
    return meetings;
}

bool FileMeetingStorage::replaceAll(const QVector<Meeting> &meetings)
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStore) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcStore) << "Cannot open" << m_filePath << "for writing:" << file.errorString();
        return false;
    }

    const QByteArray payload = encodeMeetingList(meetings);
    if (file.write(payload) != payload.size()) {
        qCWarning(lcStore) << "Short write to" << m_filePath << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcStore) << "Cannot commit" << m_filePath << file.errorString();
        return false;
    }

    qCDebug(lcStore) << "Saved" << meetings.size() << "meetings to" << m_filePath;
    return true;
}

} // namespace data
} // namespace meetings
