#include "backend/domain/fleet/EntityStore.h"
#include <QDebug>
#include <QtGlobal>

FleetError EntityStore::add(const ServerEntry& entry) {
    if (!entry.isValid()) {
        qWarning() << "EntityStore::add: entry has no identifier";
        return FleetError::DuplicateIdentifier;
    }
    if (m_ids.contains(entry.getId())) {
        qWarning() << "EntityStore::add: server" << entry.getId() << "already in fleet";
        return FleetError::DuplicateIdentifier;
    }

    m_fleet.append(entry);
    m_ids.insert(entry.getId());

    // A server coming back re-adopts the images it left behind
    for (auto& image : m_images) {
        if (image.orphaned && image.ownerId == entry.getId()) {
            image.orphaned = false;
        }
    }

    qDebug() << "EntityStore: Added server" << entry.getId() << "at position" << m_fleet.size() - 1;
    return FleetError::NoError;
}

QList<QString> EntityStore::remove(const QList<QString>& ids, bool* imagesOrphaned) {
    if (imagesOrphaned) *imagesOrphaned = false;

    QSet<QString> wanted;
    for (const auto& id : ids) {
        if (m_ids.contains(id)) wanted.insert(id);
    }
    if (wanted.isEmpty()) {
        return {};
    }

    QList<QString> removed;
    for (auto it = m_fleet.begin(); it != m_fleet.end(); ) {
        if (wanted.contains(it->getId())) {
            removed.append(it->getId());
            m_ids.remove(it->getId());
            it = m_fleet.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& image : m_images) {
        if (!image.orphaned && wanted.contains(image.ownerId)) {
            image.orphaned = true;
            if (imagesOrphaned) *imagesOrphaned = true;
        }
    }

    Q_ASSERT(m_ids.size() == m_fleet.size());
    qDebug() << "EntityStore: Removed" << removed.size() << "server(s):" << removed;
    return removed;
}

bool EntityStore::updateStatus(const QString& id, ServerStatus status) {
    for (auto& entry : m_fleet) {
        if (entry.getId() == id) {
            entry.setStatus(status);
            return true;
        }
    }
    return false;
}

void EntityStore::applyOrder(const QList<ServerEntry>& reordered) {
    Q_ASSERT(reordered.size() == m_fleet.size());
#ifndef QT_NO_DEBUG
    for (const auto& entry : reordered) {
        Q_ASSERT(m_ids.contains(entry.getId()));
    }
#endif
    m_fleet = reordered;
}

int EntityStore::indexOf(const QString& id) const {
    for (int i = 0; i < m_fleet.size(); ++i) {
        if (m_fleet.at(i).getId() == id) return i;
    }
    return -1;
}

const ServerEntry* EntityStore::find(const QString& id) const {
    const int index = indexOf(id);
    return index >= 0 ? &m_fleet.at(index) : nullptr;
}

FleetError EntityStore::addImage(const ImageRecord& record) {
    const bool ownerKnown = m_ids.contains(record.ownerId);
    if (!ownerKnown && m_strictImageOwnership) {
        qWarning() << "EntityStore::addImage: rejecting image" << record.id
                   << "from unknown server" << record.ownerId;
        return FleetError::UnknownOwner;
    }

    ImageRecord stored = record;
    stored.orphaned = !ownerKnown;
    m_images.append(stored);
    qDebug() << "EntityStore: Added image" << stored.id << "from" << stored.ownerId
             << (stored.orphaned ? "(orphaned)" : "");
    return FleetError::NoError;
}

QList<ImageRecord> EntityStore::removeImages(const QList<QString>& imageIds) {
    const QSet<QString> wanted(imageIds.cbegin(), imageIds.cend());
    QList<ImageRecord> removed;
    for (auto it = m_images.begin(); it != m_images.end(); ) {
        if (wanted.contains(it->id)) {
            removed.append(*it);
            it = m_images.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

QList<ImageRecord> EntityStore::imagesOwnedBy(const QList<QString>& ownerIds) const {
    const QSet<QString> owners(ownerIds.cbegin(), ownerIds.cend());
    QList<ImageRecord> result;
    for (const auto& image : m_images) {
        if (owners.contains(image.ownerId)) result.append(image);
    }
    return result;
}

int EntityStore::orphanedImageCount() const {
    int count = 0;
    for (const auto& image : m_images) {
        if (image.orphaned) ++count;
    }
    return count;
}
