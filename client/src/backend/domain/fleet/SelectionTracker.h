#ifndef SELECTIONTRACKER_H
#define SELECTIONTRACKER_H

#include <QList>
#include <QSet>
#include <QString>
#include <optional>
#include "backend/domain/models/ServerEntry.h"

/**
 * @brief Current selection of fleet entries, stored by identifier
 *
 * Identifiers that are not part of the fleet passed in are silently dropped:
 * a selection intent may race with an asynchronous removal.
 * The range anchor is the last identifier given to a non-range call.
 *
 * Every mutator returns true only when the selected set actually changed.
 */
class SelectionTracker {
public:
    bool setSelection(const QList<QString>& ids, const QList<ServerEntry>& fleet);
    bool toggle(const QString& id, const QList<ServerEntry>& fleet);
    bool extendRangeTo(const QString& id, const QList<ServerEntry>& fleet);
    bool clear();

    // Drops identifiers that left the fleet
    bool prune(const QList<QString>& removedIds);

    const QSet<QString>& selected() const { return m_selected; }
    bool isSelected(const QString& id) const { return m_selected.contains(id); }
    bool isEmpty() const { return m_selected.isEmpty(); }
    int size() const { return m_selected.size(); }
    std::optional<QString> anchor() const { return m_anchor; }

    // Selected identifiers in fleet order
    QList<QString> orderedSelection(const QList<ServerEntry>& fleet) const;

private:
    bool replace(const QSet<QString>& ids);

    QSet<QString> m_selected;
    std::optional<QString> m_anchor;
};

#endif // SELECTIONTRACKER_H
