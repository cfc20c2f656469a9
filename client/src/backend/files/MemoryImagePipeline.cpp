#include "backend/files/MemoryImagePipeline.h"
#include <QDir>
#include <QSaveFile>
#include <QMetaObject>
#include <QDebug>

MemoryImagePipeline::MemoryImagePipeline(QObject* parent)
    : IImagePipeline(parent)
    , m_exportDirectory(QDir::tempPath())
{
}

void MemoryImagePipeline::ingest(const QString& ownerId, const QByteArray& payload, const QDateTime& timestamp) {
    if (ownerId.isEmpty() || payload.isEmpty()) {
        qWarning() << "MemoryImagePipeline::ingest: empty owner or payload";
        return;
    }

    const quint64 handle = m_nextHandle++;
    m_bytes.insert(handle, QSharedPointer<QByteArray>::create(payload));
    qDebug() << "MemoryImagePipeline: Stored" << payload.size() << "bytes from" << ownerId << "as handle" << handle;

    emit imageAvailable(ImageRecord::create(ownerId, timestamp, handle));
}

void MemoryImagePipeline::exportImages(const QList<ImageRecord>& images) {
    QList<QString> exported;
    QString errorMessage;
    bool success = true;

    QDir directory(m_exportDirectory);
    if (!directory.exists() && !directory.mkpath(".")) {
        success = false;
        errorMessage = QString("Cannot create export directory %1").arg(m_exportDirectory);
    }

    if (success) {
        for (const auto& record : images) {
            if (!writeImage(record, &errorMessage)) {
                success = false;
                break;
            }
            exported.append(record.id);
        }
    }

    if (success) {
        qDebug() << "MemoryImagePipeline: Exported" << exported.size() << "image(s) to" << m_exportDirectory;
    } else {
        qWarning() << "MemoryImagePipeline: Export stopped:" << errorMessage;
    }

    // Completion is always reported from the event loop, never from inside exportImages()
    QMetaObject::invokeMethod(this, [this, exported, success, errorMessage]() {
        emit exportFinished(exported, success, errorMessage);
    }, Qt::QueuedConnection);
}

void MemoryImagePipeline::clearImages(const QList<ImageRecord>& images) {
    for (const auto& record : images) {
        if (m_bytes.remove(record.dataHandle) > 0) {
            qDebug() << "MemoryImagePipeline: Released handle" << record.dataHandle;
        }
    }
}

qint64 MemoryImagePipeline::totalStoredBytes() const {
    qint64 total = 0;
    for (auto it = m_bytes.constBegin(); it != m_bytes.constEnd(); ++it) {
        if (it.value()) total += it.value()->size();
    }
    return total;
}

bool MemoryImagePipeline::writeImage(const ImageRecord& record, QString* errorMessage) const {
    const QSharedPointer<QByteArray> data = m_bytes.value(record.dataHandle);
    if (!data) {
        *errorMessage = QString("No data held for image %1").arg(record.id);
        return false;
    }

    const QString filePath = QDir(m_exportDirectory).filePath(record.exportFileName());
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QString("Failed to open %1: %2").arg(filePath, file.errorString());
        return false;
    }
    if (file.write(*data) != data->size() || !file.commit()) {
        *errorMessage = QString("Failed to write %1: %2").arg(filePath, file.errorString());
        return false;
    }
    return true;
}
