#ifndef ENTITYSTORE_H
#define ENTITYSTORE_H

#include <QList>
#include <QSet>
#include <QString>
#include "backend/domain/models/ServerEntry.h"
#include "backend/domain/models/ImageRecord.h"

/**
 * @brief Owner of the ordered fleet list and of the image collection
 *
 * Responsibilities:
 * - Keep the fleet free of duplicate identifiers
 * - Keep image records alive when their server goes away (orphaned)
 * - Apply a reordered fleet produced by ReorderEngine
 *
 * The store does not emit notifications itself; every mutator reports
 * whether something changed and CommandDispatcher publishes the snapshots.
 * Not thread-safe: only the dispatcher's thread may touch it.
 */
class EntityStore {
public:
    EntityStore() = default;

    // Fleet
    FleetError add(const ServerEntry& entry);
    QList<QString> remove(const QList<QString>& ids, bool* imagesOrphaned = nullptr);
    bool updateStatus(const QString& id, ServerStatus status);
    void applyOrder(const QList<ServerEntry>& reordered);

    const QList<ServerEntry>& fleet() const { return m_fleet; }
    bool contains(const QString& id) const { return m_ids.contains(id); }
    int indexOf(const QString& id) const;
    const ServerEntry* find(const QString& id) const;
    int size() const { return m_fleet.size(); }

    // Images
    void setStrictImageOwnership(bool strict) { m_strictImageOwnership = strict; }
    bool strictImageOwnership() const { return m_strictImageOwnership; }

    FleetError addImage(const ImageRecord& record);
    QList<ImageRecord> removeImages(const QList<QString>& imageIds);
    QList<ImageRecord> imagesOwnedBy(const QList<QString>& ownerIds) const;

    const QList<ImageRecord>& images() const { return m_images; }
    int imageCount() const { return m_images.size(); }
    int orphanedImageCount() const;

private:
    QList<ServerEntry> m_fleet;
    QSet<QString> m_ids; // mirror of m_fleet identifiers for O(1) lookup
    QList<ImageRecord> m_images;
    bool m_strictImageOwnership = false;
};

#endif // ENTITYSTORE_H
