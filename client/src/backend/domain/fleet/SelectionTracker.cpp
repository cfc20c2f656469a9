#include "backend/domain/fleet/SelectionTracker.h"
#include <QDebug>
#include <algorithm>

namespace {
int positionOf(const QList<ServerEntry>& fleet, const QString& id) {
    for (int i = 0; i < fleet.size(); ++i) {
        if (fleet.at(i).getId() == id) return i;
    }
    return -1;
}
}

bool SelectionTracker::setSelection(const QList<QString>& ids, const QList<ServerEntry>& fleet) {
    QSet<QString> clamped;
    std::optional<QString> lastPresent;
    for (const auto& id : ids) {
        if (positionOf(fleet, id) < 0) {
            qDebug() << "SelectionTracker: Ignoring unknown server" << id;
            continue;
        }
        clamped.insert(id);
        lastPresent = id;
    }
    m_anchor = lastPresent;
    return replace(clamped);
}

bool SelectionTracker::toggle(const QString& id, const QList<ServerEntry>& fleet) {
    if (positionOf(fleet, id) < 0) {
        return false;
    }
    QSet<QString> next = m_selected;
    if (next.contains(id)) {
        next.remove(id);
    } else {
        next.insert(id);
    }
    m_anchor = id;
    return replace(next);
}

bool SelectionTracker::extendRangeTo(const QString& id, const QList<ServerEntry>& fleet) {
    const int target = positionOf(fleet, id);
    if (target < 0) {
        return false;
    }
    const int anchor = m_anchor ? positionOf(fleet, *m_anchor) : -1;
    if (anchor < 0) {
        // No usable anchor: behave like a plain click on the target
        return setSelection({id}, fleet);
    }

    QSet<QString> range;
    for (int i = std::min(anchor, target); i <= std::max(anchor, target); ++i) {
        range.insert(fleet.at(i).getId());
    }
    return replace(range);
}

bool SelectionTracker::clear() {
    m_anchor.reset();
    return replace({});
}

bool SelectionTracker::prune(const QList<QString>& removedIds) {
    QSet<QString> next = m_selected;
    for (const auto& id : removedIds) {
        next.remove(id);
        if (m_anchor && *m_anchor == id) m_anchor.reset();
    }
    return replace(next);
}

QList<QString> SelectionTracker::orderedSelection(const QList<ServerEntry>& fleet) const {
    QList<QString> ordered;
    for (const auto& entry : fleet) {
        if (m_selected.contains(entry.getId())) ordered.append(entry.getId());
    }
    Q_ASSERT(ordered.size() == m_selected.size());
    return ordered;
}

bool SelectionTracker::replace(const QSet<QString>& ids) {
    if (ids == m_selected) {
        return false;
    }
    m_selected = ids;
    return true;
}
