#include "backend/domain/models/ImageRecord.h"
#include <QUuid>

ImageRecord ImageRecord::create(const QString& ownerId, const QDateTime& timestamp, quint64 dataHandle) {
    ImageRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.ownerId = ownerId;
    record.timestamp = timestamp.isValid() ? timestamp : QDateTime::currentDateTimeUtc();
    record.dataHandle = dataHandle;
    record.orphaned = false;
    return record;
}

QString ImageRecord::exportFileName() const {
    QString owner = ownerId;
    owner.replace(':', '_');
    return QString("%1-%2-%3.raw").arg(owner, timestamp.toString("yyyyMMdd-HHmmss-zzz")).arg(dataHandle);
}
