#ifndef REORDERENGINE_H
#define REORDERENGINE_H

#include <QList>
#include <QSet>
#include <QString>
#include "backend/domain/models/ServerEntry.h"

/**
 * @brief Moves the selected entries of the fleet list
 *
 * All functions are pure: they return a reordered copy of the fleet and
 * never change which identifiers are selected. Entries keep their relative
 * order except where a move requires otherwise.
 *
 * moveUp/moveDown step every maximal run of selected entries by exactly one
 * position. A run already touching the edge stays where it is; the other
 * runs still move. When nothing can move, the input is returned unchanged.
 */
class ReorderEngine {
public:
    static QList<ServerEntry> moveTop(const QList<ServerEntry>& fleet, const QSet<QString>& selected);
    static QList<ServerEntry> moveUp(const QList<ServerEntry>& fleet, const QSet<QString>& selected);
    static QList<ServerEntry> moveDown(const QList<ServerEntry>& fleet, const QSet<QString>& selected);
    static QList<ServerEntry> moveBottom(const QList<ServerEntry>& fleet, const QSet<QString>& selected);

    // True when some unselected entry precedes a selected one
    static bool canMoveUp(const QList<ServerEntry>& fleet, const QSet<QString>& selected);
    // True when some unselected entry follows a selected one
    static bool canMoveDown(const QList<ServerEntry>& fleet, const QSet<QString>& selected);

private:
    struct Run {
        int first;
        int last;
    };
    static QList<Run> selectedRuns(const QList<ServerEntry>& fleet, const QSet<QString>& selected);
};

#endif // REORDERENGINE_H
