#ifndef IMAGERECORD_H
#define IMAGERECORD_H

#include <QString>
#include <QDateTime>
#include <QMetaType>

/**
 * @brief A captured image known to the console
 *
 * The owning server is referenced by identifier only, so a record can
 * outlive the removal of its server. Such a record is flagged orphaned.
 * The raw bytes live in the image pipeline; dataHandle is its opaque key.
 */
struct ImageRecord {
    QString id;
    QString ownerId;
    QDateTime timestamp;
    quint64 dataHandle = 0;
    bool orphaned = false;

    static ImageRecord create(const QString& ownerId, const QDateTime& timestamp, quint64 dataHandle);

    // File name used when the record is exported, e.g. "192.168.0.5-20141012-153000-123-7.raw"
    QString exportFileName() const;

    bool operator==(const ImageRecord& other) const {
        return id == other.id && ownerId == other.ownerId && timestamp == other.timestamp
            && dataHandle == other.dataHandle && orphaned == other.orphaned;
    }
};

Q_DECLARE_METATYPE(ImageRecord)

#endif // IMAGERECORD_H
