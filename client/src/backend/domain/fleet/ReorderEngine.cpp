#include "backend/domain/fleet/ReorderEngine.h"

QList<ServerEntry> ReorderEngine::moveTop(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    if (!canMoveUp(fleet, selected)) {
        return fleet;
    }
    QList<ServerEntry> block;
    QList<ServerEntry> rest;
    for (const auto& entry : fleet) {
        if (selected.contains(entry.getId())) {
            block.append(entry);
        } else {
            rest.append(entry);
        }
    }
    return block + rest;
}

QList<ServerEntry> ReorderEngine::moveBottom(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    if (!canMoveDown(fleet, selected)) {
        return fleet;
    }
    QList<ServerEntry> block;
    QList<ServerEntry> rest;
    for (const auto& entry : fleet) {
        if (selected.contains(entry.getId())) {
            block.append(entry);
        } else {
            rest.append(entry);
        }
    }
    return rest + block;
}

QList<ServerEntry> ReorderEngine::moveUp(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    QList<ServerEntry> result = fleet;
    // Runs are separated by at least one unselected entry, so stepping them
    // top-down never touches an entry another run already moved.
    for (const Run& run : selectedRuns(fleet, selected)) {
        if (run.first == 0) {
            continue;
        }
        // The entry above the run drops below it: rotate [first-1, last] left by one
        const ServerEntry displaced = result.at(run.first - 1);
        for (int i = run.first - 1; i < run.last; ++i) {
            result[i] = result.at(i + 1);
        }
        result[run.last] = displaced;
    }
    return result;
}

QList<ServerEntry> ReorderEngine::moveDown(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    QList<ServerEntry> result = fleet;
    const QList<Run> runs = selectedRuns(fleet, selected);
    for (auto it = runs.crbegin(); it != runs.crend(); ++it) {
        const Run& run = *it;
        if (run.last == fleet.size() - 1) {
            continue;
        }
        const ServerEntry displaced = result.at(run.last + 1);
        for (int i = run.last + 1; i > run.first; --i) {
            result[i] = result.at(i - 1);
        }
        result[run.first] = displaced;
    }
    return result;
}

bool ReorderEngine::canMoveUp(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    bool seenUnselected = false;
    for (const auto& entry : fleet) {
        if (!selected.contains(entry.getId())) {
            seenUnselected = true;
        } else if (seenUnselected) {
            return true;
        }
    }
    return false;
}

bool ReorderEngine::canMoveDown(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    bool seenSelected = false;
    for (const auto& entry : fleet) {
        if (selected.contains(entry.getId())) {
            seenSelected = true;
        } else if (seenSelected) {
            return true;
        }
    }
    return false;
}

QList<ReorderEngine::Run> ReorderEngine::selectedRuns(const QList<ServerEntry>& fleet, const QSet<QString>& selected) {
    QList<Run> runs;
    int start = -1;
    for (int i = 0; i < fleet.size(); ++i) {
        const bool isSelected = selected.contains(fleet.at(i).getId());
        if (isSelected && start < 0) {
            start = i;
        } else if (!isSelected && start >= 0) {
            runs.append({start, i - 1});
            start = -1;
        }
    }
    if (start >= 0) {
        runs.append({start, static_cast<int>(fleet.size()) - 1});
    }
    return runs;
}
