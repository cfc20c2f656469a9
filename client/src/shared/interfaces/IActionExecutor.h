#ifndef IACTIONEXECUTOR_H
#define IACTIONEXECUTOR_H

#include <QObject>
#include <QList>
#include <QString>
#include <QVariantMap>
#include "shared/fleet/FleetTypes.h"
#include "backend/domain/models/ServerEntry.h"

/**
 * @brief Network side of the console: discovery, status and batch commands
 *
 * Implementations own the transport. Every call returns immediately; the
 * results come back through the signals, possibly from another thread, so
 * connect them with Qt::QueuedConnection when crossing threads.
 */
class IActionExecutor : public QObject {
    Q_OBJECT

public:
    explicit IActionExecutor(QObject* parent = nullptr) : QObject(parent) {}
    ~IActionExecutor() override = default;

    virtual void discover() = 0;

    /**
     * @brief Send a batch action to the given servers
     * @param dispatchId Caller's identifier for this call, echoed by actionFinished
     * @param action Action to run
     * @param targets Server identifiers, in fleet order
     * @param parameters Action specific values ("resolution", "framerate", "source")
     */
    virtual void execute(quint64 dispatchId, FleetAction action, const QList<QString>& targets, const QVariantMap& parameters) = 0;

    // Connection parameters shared by all servers
    virtual void setTimeout(int seconds) = 0;
    virtual void setPorts(int clientPort, int serverPort) = 0;

signals:
    void serverDiscovered(const ServerEntry& entry);
    void statusReceived(const QString& serverId, ServerStatus status);
    // May be emitted several times for one execute() call, each with a subset of the targets
    void actionFinished(quint64 dispatchId, FleetAction action, const QList<ActionOutcome>& outcomes);
};

#endif // IACTIONEXECUTOR_H
