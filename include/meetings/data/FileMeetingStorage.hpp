#pragma once

#include <QString>

#include "meetings/data/MeetingStorage.hpp"

namespace meetings {
namespace data {

class FileMeetingStorage : public MeetingStorage
{
public:
    explicit FileMeetingStorage(QString filePath);
    ~FileMeetingStorage() override = default;

    QVector<Meeting> loadAll() override;
    bool replaceAll(const QVector<Meeting> &meetings) override;

    const QString &filePath() const;

private:
    QString m_filePath;
};

} // namespace data
} // namespace meetings
