#ifndef FLEETTYPES_H
#define FLEETTYPES_H

#include <QString>
#include <QList>
#include <QByteArray>
#include <QDateTime>
#include <QMetaType>

/**
 * @brief Batch and list actions exposed to the presentation layer
 *
 * The order matches the toolbar order of the console and is used when
 * iterating over every action (see allFleetActions()).
 */
enum class FleetAction {
    Find,
    Add,
    Remove,
    MoveTop,
    MoveUp,
    MoveDown,
    MoveBottom,
    Identify,
    Configure,
    Reference,
    Capture,
    Copy,
    Export,
    Clear,
    Refresh,
    Quit
};

enum class ServerStatus {
    Unknown,
    Online,
    Busy,
    Unreachable
};

/**
 * @brief Error codes returned by the coordinator's command surface
 *
 * Everything that is not listed here (unknown identifiers in remove,
 * status updates or selections) is treated as a benign no-op.
 */
enum class FleetError {
    NoError,
    DuplicateIdentifier,
    ActionNotPermitted,
    UnknownOwner
};

/**
 * @brief Per-server result of a batch action reported by the executor
 *
 * payload carries image bytes when the action produced one (Capture, Copy).
 */
struct ActionOutcome {
    QString serverId;
    bool success = true;
    QString failureReason;
    QByteArray payload;
    QDateTime timestamp;

    static ActionOutcome succeeded(const QString& id) {
        ActionOutcome outcome;
        outcome.serverId = id;
        outcome.success = true;
        return outcome;
    }

    static ActionOutcome failed(const QString& id, const QString& reason) {
        ActionOutcome outcome;
        outcome.serverId = id;
        outcome.success = false;
        outcome.failureReason = reason;
        return outcome;
    }
};

QList<FleetAction> allFleetActions();
QString fleetActionName(FleetAction action);
bool fleetActionFromName(const QString& name, FleetAction* action);

// Actions sent to servers; these are the ones guarded by the in-flight check
bool isServerTargetedAction(FleetAction action);

QString serverStatusText(ServerStatus status);
QString fleetErrorString(FleetError error);

Q_DECLARE_METATYPE(FleetAction)
Q_DECLARE_METATYPE(ServerStatus)
Q_DECLARE_METATYPE(FleetError)
Q_DECLARE_METATYPE(ActionOutcome)

#endif // FLEETTYPES_H
