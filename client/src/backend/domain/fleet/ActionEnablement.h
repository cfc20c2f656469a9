#ifndef ACTIONENABLEMENT_H
#define ACTIONENABLEMENT_H

#include <QMap>
#include <QList>
#include <QSet>
#include <QString>
#include <QMetaType>
#include "shared/fleet/FleetTypes.h"
#include "backend/domain/models/ServerEntry.h"
#include "backend/domain/fleet/InFlightTracker.h"

/**
 * @brief Enabled flag of every FleetAction
 *
 * Value object: produced by ActionEnablement::compute() and compared with
 * the previous one to decide whether a change notification is due.
 */
class ActionState {
public:
    ActionState();

    bool isEnabled(FleetAction action) const { return m_enabled.value(action, false); }
    QList<FleetAction> enabledActions() const;

    bool operator==(const ActionState& other) const { return m_enabled == other.m_enabled; }
    bool operator!=(const ActionState& other) const { return !(*this == other); }

private:
    friend class ActionEnablement;
    void setEnabled(FleetAction action, bool enabled) { m_enabled[action] = enabled; }

    QMap<FleetAction, bool> m_enabled;
};

/**
 * @brief Inputs of the enablement rules, gathered by CommandDispatcher
 */
struct EnablementInputs {
    QList<ServerEntry> fleet;
    QSet<QString> selection;
    InFlightTracker inFlight;
    int imageCount = 0;
    bool exportPending = false;
};

/**
 * @brief The single table of action enablement rules
 *
 * - Remove, Identify, Configure, Capture, Copy, Clear: selection non-empty
 * - Reference: exactly one selected server and at least two in the fleet
 * - MoveTop/MoveUp: an unselected entry precedes a selected one
 * - MoveBottom/MoveDown: an unselected entry follows a selected one
 * - Export: images present and no export pending
 * - Find, Add, Refresh, Quit: always
 *
 * Server-targeted actions are additionally disabled while any of their
 * targets has an action in flight. Reference targets the whole fleet.
 */
class ActionEnablement {
public:
    static ActionState compute(const EnablementInputs& inputs);

    // Servers an action would be sent to for the given selection
    static QList<QString> targetsOf(FleetAction action,
                                    const QList<ServerEntry>& fleet,
                                    const QSet<QString>& selection);
};

Q_DECLARE_METATYPE(ActionState)

#endif // ACTIONENABLEMENT_H
