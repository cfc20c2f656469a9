#include "backend/domain/fleet/ActionEnablement.h"
#include "backend/domain/fleet/ReorderEngine.h"

ActionState::ActionState() {
    for (FleetAction action : allFleetActions()) {
        m_enabled.insert(action, false);
    }
}

QList<FleetAction> ActionState::enabledActions() const {
    QList<FleetAction> result;
    for (auto it = m_enabled.constBegin(); it != m_enabled.constEnd(); ++it) {
        if (it.value()) result.append(it.key());
    }
    return result;
}

QList<QString> ActionEnablement::targetsOf(FleetAction action,
                                           const QList<ServerEntry>& fleet,
                                           const QSet<QString>& selection) {
    QList<QString> targets;
    for (const auto& entry : fleet) {
        // Reference reads the settings of the selected server and writes all others
        if (action == FleetAction::Reference || selection.contains(entry.getId())) {
            targets.append(entry.getId());
        }
    }
    return targets;
}

ActionState ActionEnablement::compute(const EnablementInputs& inputs) {
    ActionState state;
    const QList<ServerEntry>& fleet = inputs.fleet;
    const QSet<QString>& selection = inputs.selection;
    const bool hasSelection = !selection.isEmpty();

    state.setEnabled(FleetAction::Find, true);
    state.setEnabled(FleetAction::Add, true);
    state.setEnabled(FleetAction::Refresh, true);
    state.setEnabled(FleetAction::Quit, true);

    state.setEnabled(FleetAction::Remove, hasSelection);
    state.setEnabled(FleetAction::Identify, hasSelection);
    state.setEnabled(FleetAction::Configure, hasSelection);
    state.setEnabled(FleetAction::Capture, hasSelection);
    state.setEnabled(FleetAction::Copy, hasSelection);
    state.setEnabled(FleetAction::Clear, hasSelection);
    state.setEnabled(FleetAction::Reference, selection.size() == 1 && fleet.size() > 1);

    const bool canMoveUp = hasSelection && ReorderEngine::canMoveUp(fleet, selection);
    const bool canMoveDown = hasSelection && ReorderEngine::canMoveDown(fleet, selection);
    state.setEnabled(FleetAction::MoveTop, canMoveUp);
    state.setEnabled(FleetAction::MoveUp, canMoveUp);
    state.setEnabled(FleetAction::MoveDown, canMoveDown);
    state.setEnabled(FleetAction::MoveBottom, canMoveDown);

    state.setEnabled(FleetAction::Export, inputs.imageCount > 0 && !inputs.exportPending);

    if (!inputs.inFlight.isEmpty()) {
        for (FleetAction action : allFleetActions()) {
            if (!isServerTargetedAction(action) || !state.isEnabled(action)) {
                continue;
            }
            if (inputs.inFlight.overlaps(targetsOf(action, fleet, selection))) {
                state.setEnabled(action, false);
            }
        }
    }

    return state;
}
