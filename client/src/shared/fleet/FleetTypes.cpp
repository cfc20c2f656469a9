#include "shared/fleet/FleetTypes.h"

QList<FleetAction> allFleetActions() {
    return {
        FleetAction::Find, FleetAction::Add, FleetAction::Remove,
        FleetAction::MoveTop, FleetAction::MoveUp, FleetAction::MoveDown, FleetAction::MoveBottom,
        FleetAction::Identify, FleetAction::Configure, FleetAction::Reference,
        FleetAction::Capture, FleetAction::Copy, FleetAction::Export, FleetAction::Clear,
        FleetAction::Refresh, FleetAction::Quit
    };
}

QString fleetActionName(FleetAction action) {
    switch (action) {
        case FleetAction::Find: return "Find";
        case FleetAction::Add: return "Add";
        case FleetAction::Remove: return "Remove";
        case FleetAction::MoveTop: return "MoveTop";
        case FleetAction::MoveUp: return "MoveUp";
        case FleetAction::MoveDown: return "MoveDown";
        case FleetAction::MoveBottom: return "MoveBottom";
        case FleetAction::Identify: return "Identify";
        case FleetAction::Configure: return "Configure";
        case FleetAction::Reference: return "Reference";
        case FleetAction::Capture: return "Capture";
        case FleetAction::Copy: return "Copy";
        case FleetAction::Export: return "Export";
        case FleetAction::Clear: return "Clear";
        case FleetAction::Refresh: return "Refresh";
        case FleetAction::Quit: return "Quit";
    }
    return "Unknown";
}

bool fleetActionFromName(const QString& name, FleetAction* action) {
    for (FleetAction candidate : allFleetActions()) {
        if (fleetActionName(candidate).compare(name, Qt::CaseInsensitive) == 0) {
            if (action) *action = candidate;
            return true;
        }
    }
    return false;
}

bool isServerTargetedAction(FleetAction action) {
    switch (action) {
        case FleetAction::Remove:
        case FleetAction::Identify:
        case FleetAction::Configure:
        case FleetAction::Reference:
        case FleetAction::Capture:
        case FleetAction::Copy:
        case FleetAction::Clear:
            return true;
        default:
            return false;
    }
}

QString serverStatusText(ServerStatus status) {
    switch (status) {
        case ServerStatus::Unknown: return "UNKNOWN";
        case ServerStatus::Online: return "ONLINE";
        case ServerStatus::Busy: return "BUSY";
        case ServerStatus::Unreachable: return "UNREACHABLE";
    }
    return "UNKNOWN";
}

QString fleetErrorString(FleetError error) {
    switch (error) {
        case FleetError::NoError: return "No error";
        case FleetError::DuplicateIdentifier: return "Server is already part of the fleet";
        case FleetError::ActionNotPermitted: return "Action is not permitted in the current state";
        case FleetError::UnknownOwner: return "Image belongs to a server that is not part of the fleet";
    }
    return "Unknown error";
}
