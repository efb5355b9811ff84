#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <memory>

#include "version.h"

#include "meetings/client/ClientReconciler.hpp"
#include "meetings/client/ClientSettings.hpp"
#include "meetings/client/MeetingClient.hpp"
#include "meetings/core/Logging.hpp"
#include "meetings/data/FileMeetingStorage.hpp"

using namespace meetings;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("meetings-client"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kMeetingsVersion));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Watches an employee's meetings and conflict notifications"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Read settings from <file>."), QStringLiteral("file"),
                                          QStringLiteral("client.ini"));
    parser.addOption(configOption);
    parser.process(app);

    QString error;
    const auto settings = client::ClientSettings::fromFile(parser.value(configOption), &error);
    if (!settings) {
        qCCritical(lcClient) << "Invalid configuration:" << error;
        return 1;
    }

    std::shared_ptr<data::MeetingStorage> cache;
    if (!settings->storagePath.isEmpty()) {
        cache = std::make_shared<data::FileMeetingStorage>(settings->storagePath);
    }

    client::MeetingClient meetingClient(*settings, cache);
    QTextStream out(stdout);

    QObject::connect(&meetingClient.reconciler(), &client::ClientReconciler::conflictReceived,
                     [&out](const data::Meeting &meeting) {
                         out << "conflict: " << data::describe(meeting) << Qt::endl;
                     });
    QObject::connect(&meetingClient.reconciler(), &client::ClientReconciler::conflictResolved,
                     [&out](const data::Meeting &meeting) {
                         out << "resolved: " << data::describe(meeting) << Qt::endl;
                     });
    QObject::connect(&meetingClient.reconciler(), &client::ClientReconciler::meetingDeleted,
                     [&out](const data::Meeting &meeting) {
                         out << "deleted: " << data::describe(meeting) << Qt::endl;
                     });
    QObject::connect(&meetingClient, &client::MeetingClient::disconnected, &app, [&app]() { app.exit(0); });

    if (!meetingClient.connectToServer() || !meetingClient.authenticate()) {
        return 1;
    }

    const auto meetings = meetingClient.fetchMeetings();
    if (!meetings) {
        return 1;
    }
    out << "meetings of " << meetingClient.currentEmployee().id << ": " << meetings->size() << Qt::endl;
    for (const data::Meeting &meeting : *meetings) {
        out << "  " << data::describe(meeting) << Qt::endl;
    }

    return app.exec();
}
