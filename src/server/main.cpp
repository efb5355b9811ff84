#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <memory>

#include "version.h"

#include "meetings/core/Logging.hpp"
#include "meetings/core/MeetingService.hpp"
#include "meetings/data/FileMeetingStorage.hpp"
#include "meetings/server/MeetingServer.hpp"
#include "meetings/server/ServerSettings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("meetings-server"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kMeetingsVersion));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Meeting scheduling server"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Read settings from <file>."), QStringLiteral("file"),
                                          QStringLiteral("server.ini"));
    parser.addOption(configOption);
    parser.process(app);

    QString error;
    const auto settings = meetings::server::ServerSettings::fromFile(parser.value(configOption), &error);
    if (!settings) {
        qCCritical(lcServer) << "Invalid configuration:" << error;
        return 1;
    }

    meetings::core::MeetingService service(std::make_shared<meetings::data::FileMeetingStorage>(settings->storagePath));
    const int loaded = service.load();
    qCInfo(lcServer) << "Restored" << loaded << "meetings from" << settings->storagePath;

    meetings::server::MeetingServer server(*settings, service);
    if (!server.start()) {
        return 1;
    }

    return app.exec();
}
