#include "backend/domain/fleet/InFlightTracker.h"
#include <QDebug>

void InFlightTracker::mark(const QList<QString>& ids, FleetAction action, quint64 dispatchId) {
    for (const auto& id : ids) {
        Q_ASSERT(!m_pending.contains(id));
        m_pending.insert(id, PendingAction{action, dispatchId});
    }
    qDebug() << "InFlightTracker:" << fleetActionName(action) << "#" << dispatchId << "pending on" << ids;
}

bool InFlightTracker::resolve(const QString& id, FleetAction action, quint64 dispatchId) {
    auto it = m_pending.find(id);
    if (it == m_pending.end() || it.value().action != action || it.value().dispatchId != dispatchId) {
        return false;
    }
    m_pending.erase(it);
    return true;
}

QList<QString> InFlightTracker::detach(const QList<QString>& ids) {
    QList<QString> detached;
    for (const auto& id : ids) {
        if (m_pending.remove(id) > 0) {
            detached.append(id);
        }
    }
    if (!detached.isEmpty()) {
        qDebug() << "InFlightTracker: Detached pending actions of" << detached;
    }
    return detached;
}

bool InFlightTracker::overlaps(const QList<QString>& ids) const {
    for (const auto& id : ids) {
        if (m_pending.contains(id)) return true;
    }
    return false;
}

std::optional<FleetAction> InFlightTracker::actionFor(const QString& id) const {
    auto it = m_pending.constFind(id);
    if (it == m_pending.constEnd()) {
        return std::nullopt;
    }
    return it.value().action;
}
