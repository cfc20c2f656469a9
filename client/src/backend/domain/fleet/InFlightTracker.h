#ifndef INFLIGHTTRACKER_H
#define INFLIGHTTRACKER_H

#include <QHash>
#include <QList>
#include <QString>
#include <optional>
#include "shared/fleet/FleetTypes.h"

/**
 * @brief Bookkeeping of dispatched batch actions that have not completed yet
 *
 * Maps a server identifier to the action currently pending on it and the
 * dispatch that sent it. A server carries at most one pending action: the
 * enablement rules reject any action whose targets overlap the tracked
 * identifiers.
 *
 * Results are matched on the dispatch id, so a late result of a detached
 * dispatch never clears the record of a newer one on the same server.
 */
class InFlightTracker {
public:
    struct PendingAction {
        FleetAction action = FleetAction::Refresh;
        quint64 dispatchId = 0;
    };

    void mark(const QList<QString>& ids, FleetAction action, quint64 dispatchId = 0);

    // Clears the record of id if it is pending for action from dispatchId; false otherwise
    bool resolve(const QString& id, FleetAction action, quint64 dispatchId);

    // Forgets ids without waiting for completion (server removed)
    QList<QString> detach(const QList<QString>& ids);

    bool overlaps(const QList<QString>& ids) const;
    std::optional<FleetAction> actionFor(const QString& id) const;
    bool contains(const QString& id) const { return m_pending.contains(id); }
    bool isEmpty() const { return m_pending.isEmpty(); }
    int size() const { return m_pending.size(); }
    const QHash<QString, PendingAction>& pending() const { return m_pending; }

private:
    QHash<QString, PendingAction> m_pending; // serverId -> pending action
};

#endif // INFLIGHTTRACKER_H
