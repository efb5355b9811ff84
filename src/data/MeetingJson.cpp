#include "meetings/data/MeetingJson.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include "meetings/core/Logging.hpp"

namespace meetings {
namespace data {

namespace {
constexpr auto TOPIC_KEY = "meetingTopic";
constexpr auto ORGANIZER_KEY = "meetingOrganizer";
constexpr auto ORGANIZER_ID_KEY = "meetingOrganizerID";
constexpr auto ORGANIZER_NAME_KEY = "meetingOrganizerName";
constexpr auto PLACE_KEY = "meetingPlace";
constexpr auto INVITEES_KEY = "meetingInviteeList";
constexpr auto INVITEE_ID_KEY = "meetingInviteeID";
constexpr auto INVITEE_NAME_KEY = "meetingInviteeName";
constexpr auto START_KEY = "meetingStartTime";
constexpr auto END_KEY = "meetingEndTime";

constexpr auto CREDENTIAL_ID_KEY = "credentialEmployeeID";
constexpr auto CREDENTIAL_NAME_KEY = "credentialEmployeeName";
constexpr auto CREDENTIAL_SECRET_KEY = "credentialSecret";

std::optional<qint64> readInstant(const QJsonObject &object, const char *key)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return static_cast<qint64>(value.toDouble());
}

std::optional<QJsonDocument> parseDocument(const QByteArray &document)
{
    QJsonParseError error{};
    QJsonDocument parsed = QJsonDocument::fromJson(document, &error);
    if (error.error != QJsonParseError::NoError) {
        qCDebug(lcProtocol) << "JSON parse error at" << error.offset << error.errorString();
        return std::nullopt;
    }
    return parsed;
}
} // namespace

QJsonObject meetingToJson(const Meeting &meeting)
{
    QJsonObject organizer;
    organizer.insert(QLatin1String(ORGANIZER_ID_KEY), meeting.organizer.id);
    organizer.insert(QLatin1String(ORGANIZER_NAME_KEY), meeting.organizer.fullName);

    QJsonArray invitees;
    for (const Employee &invitee : meeting.invitees) {
        QJsonObject entry;
        entry.insert(QLatin1String(INVITEE_ID_KEY), invitee.id);
        entry.insert(QLatin1String(INVITEE_NAME_KEY), invitee.fullName);
        invitees.append(entry);
    }

    QJsonObject object;
    object.insert(QLatin1String(TOPIC_KEY), meeting.topic);
    object.insert(QLatin1String(ORGANIZER_KEY), organizer);
    object.insert(QLatin1String(PLACE_KEY), meeting.place);
    object.insert(QLatin1String(INVITEES_KEY), invitees);
    object.insert(QLatin1String(START_KEY), static_cast<double>(meeting.start.toMSecsSinceEpoch()));
    object.insert(QLatin1String(END_KEY), static_cast<double>(meeting.end.toMSecsSinceEpoch()));
    return object;
}

std::optional<Meeting> meetingFromJson(const QJsonObject &object)
{
    const QJsonValue topic = object.value(QLatin1String(TOPIC_KEY));
    const QJsonValue organizer = object.value(QLatin1String(ORGANIZER_KEY));
    const QJsonValue place = object.value(QLatin1String(PLACE_KEY));
    const auto start = readInstant(object, START_KEY);
    const auto end = readInstant(object, END_KEY);
    if (!topic.isString() || !organizer.isObject() || !place.isString() || !start || !end) {
        return std::nullopt;
    }

    Meeting meeting;
    meeting.topic = topic.toString();
    meeting.place = place.toString();
    const QJsonObject organizerObject = organizer.toObject();
    meeting.organizer.id = organizerObject.value(QLatin1String(ORGANIZER_ID_KEY)).toString();
    meeting.organizer.fullName = organizerObject.value(QLatin1String(ORGANIZER_NAME_KEY)).toString();
    meeting.start = fromEpochMilliseconds(*start);
    meeting.end = fromEpochMilliseconds(*end);

    const QJsonValue invitees = object.value(QLatin1String(INVITEES_KEY));
    if (!invitees.isUndefined() && !invitees.isNull()) {
        if (!invitees.isArray()) {
            return std::nullopt;
        }
        const QJsonArray entries = invitees.toArray();
        meeting.invitees.reserve(entries.size());
        for (const QJsonValue &entry : entries) {
            if (!entry.isObject()) {
                return std::nullopt;
            }
            const QJsonObject inviteeObject = entry.toObject();
            Employee invitee;
            invitee.id = inviteeObject.value(QLatin1String(INVITEE_ID_KEY)).toString();
            invitee.fullName = inviteeObject.value(QLatin1String(INVITEE_NAME_KEY)).toString();
            meeting.invitees.append(invitee);
        }
    }
    return meeting;
}

QByteArray encodeMeeting(const Meeting &meeting)
{
    return QJsonDocument(meetingToJson(meeting)).toJson(QJsonDocument::Compact);
}

std::optional<Meeting> decodeMeeting(const QByteArray &document)
{
    const auto parsed = parseDocument(document);
    if (!parsed || !parsed->isObject()) {
        return std::nullopt;
    }
    return meetingFromJson(parsed->object());
}

QByteArray encodeMeetingList(const QVector<Meeting> &meetings)
{
    QJsonArray array;
    for (const Meeting &meeting : meetings) {
        array.append(meetingToJson(meeting));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

std::optional<QVector<Meeting>> decodeMeetingList(const QByteArray &document)
{
    const auto parsed = parseDocument(document);
    if (!parsed || !parsed->isArray()) {
        return std::nullopt;
    }
    QVector<Meeting> meetings;
    const QJsonArray array = parsed->array();
    meetings.reserve(array.size());
    for (const QJsonValue &value : array) {
        if (value.isNull()) {
            continue;
        }
        if (!value.isObject()) {
            return std::nullopt;
        }
        auto meeting = meetingFromJson(value.toObject());
        if (!meeting) {
            return std::nullopt;
        }
        meetings.append(std::move(*meeting));
    }
    return meetings;
}

QByteArray encodeCredentials(const Credentials &credentials)
{
    QJsonObject object;
    object.insert(QLatin1String(CREDENTIAL_ID_KEY), credentials.employee.id);
    object.insert(QLatin1String(CREDENTIAL_NAME_KEY), credentials.employee.fullName);
    object.insert(QLatin1String(CREDENTIAL_SECRET_KEY), credentials.secret);
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

std::optional<Credentials> decodeCredentials(const QByteArray &document)
{
    const auto parsed = parseDocument(document);
    if (!parsed || !parsed->isObject()) {
        return std::nullopt;
    }
    const QJsonObject object = parsed->object();

    Credentials credentials;
    if (object.contains(QLatin1String(CREDENTIAL_ID_KEY))) {
        credentials.employee.id = object.value(QLatin1String(CREDENTIAL_ID_KEY)).toString();
        credentials.employee.fullName = object.value(QLatin1String(CREDENTIAL_NAME_KEY)).toString();
        credentials.secret = object.value(QLatin1String(CREDENTIAL_SECRET_KEY)).toString();
    } else {
        const auto legacy = meetingFromJson(object);
        if (!legacy) {
            return std::nullopt;
        }
        credentials.employee = legacy->organizer;
        credentials.secret = legacy->topic;
    }

    if (credentials.employee.id.isEmpty()) {
        return std::nullopt;
    }
    return credentials;
}

} // namespace data
} // namespace meetings
