#ifndef MEMORYIMAGEPIPELINE_H
#define MEMORYIMAGEPIPELINE_H

#include <QHash>
#include <QSharedPointer>
#include <QByteArray>
#include "shared/interfaces/IImagePipeline.h"

/**
 * MemoryImagePipeline
 *
 * Keeps captured image bytes in memory until they are exported or cleared.
 * No decoding happens here: export writes the bytes as received, one file
 * per record, into the export directory.
 *
 * Responsibilities:
 * - Own payload bytes, addressed by a monotonically increasing handle
 * - Write images to disk on export (reported asynchronously)
 * - Release memory of cleared images
 */
class MemoryImagePipeline : public IImagePipeline {
    Q_OBJECT

public:
    explicit MemoryImagePipeline(QObject* parent = nullptr);
    ~MemoryImagePipeline() override = default;

    void ingest(const QString& ownerId, const QByteArray& payload, const QDateTime& timestamp) override;
    void exportImages(const QList<ImageRecord>& images) override;
    void clearImages(const QList<ImageRecord>& images) override;
    void setExportDirectory(const QString& path) override { m_exportDirectory = path; }

    QString exportDirectory() const { return m_exportDirectory; }
    QSharedPointer<QByteArray> bytesFor(quint64 handle) const { return m_bytes.value(handle); }
    int storedImageCount() const { return m_bytes.size(); }
    qint64 totalStoredBytes() const;

private:
    bool writeImage(const ImageRecord& record, QString* errorMessage) const;

    QHash<quint64, QSharedPointer<QByteArray>> m_bytes; // handle -> payload
    quint64 m_nextHandle = 1;
    QString m_exportDirectory;
};

#endif // MEMORYIMAGEPIPELINE_H
