#ifndef IIMAGEPIPELINE_H
#define IIMAGEPIPELINE_H

#include <QObject>
#include <QList>
#include <QString>
#include <QByteArray>
#include <QDateTime>
#include "backend/domain/models/ImageRecord.h"

/**
 * @brief Owner of captured image bytes
 *
 * The console only ever sees ImageRecord values; the bytes stay here and
 * are addressed through ImageRecord::dataHandle.
 */
class IImagePipeline : public QObject {
    Q_OBJECT

public:
    explicit IImagePipeline(QObject* parent = nullptr) : QObject(parent) {}
    ~IImagePipeline() override = default;

    // Takes ownership of bytes received from a server; answers with imageAvailable()
    virtual void ingest(const QString& ownerId, const QByteArray& payload, const QDateTime& timestamp) = 0;

    // Writes the images out; answers with exportFinished()
    virtual void exportImages(const QList<ImageRecord>& images) = 0;

    // Releases the bytes of images that left the collection
    virtual void clearImages(const QList<ImageRecord>& images) = 0;

    virtual void setExportDirectory(const QString& path) = 0;

signals:
    void imageAvailable(const ImageRecord& record);
    void exportFinished(const QList<QString>& imageIds, bool success, const QString& errorMessage);
};

#endif // IIMAGEPIPELINE_H
