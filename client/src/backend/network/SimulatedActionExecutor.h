#ifndef SIMULATEDACTIONEXECUTOR_H
#define SIMULATEDACTIONEXECUTOR_H

#include <QSet>
#include "shared/interfaces/IActionExecutor.h"
#include "backend/network/AddressListParser.h"

/**
 * SimulatedActionExecutor
 *
 * Loopback executor used when no camera servers are reachable. Every batch
 * action succeeds after a fixed delay; Capture and Copy answer with a small
 * synthetic frame per server.
 */
class SimulatedActionExecutor : public IActionExecutor {
    Q_OBJECT

public:
    explicit SimulatedActionExecutor(QObject* parent = nullptr);
    ~SimulatedActionExecutor() override = default;

    void discover() override;
    void execute(quint64 dispatchId, FleetAction action, const QList<QString>& targets, const QVariantMap& parameters) override;
    void setTimeout(int seconds) override { m_timeoutSeconds = seconds; }
    void setPorts(int clientPort, int serverPort) override;

    // Simulation knobs
    void setNetwork(const QString& cidr);
    void setServerCount(int count) { m_serverCount = count; }
    void setResponseDelay(int milliseconds) { m_responseDelayMs = milliseconds; }
    // Servers listed here answer every action with a failure
    void setFailingServers(const QSet<QString>& ids) { m_failingServers = ids; }

    int timeout() const { return m_timeoutSeconds; }
    int clientPort() const { return m_clientPort; }
    int serverPort() const { return m_serverPort; }

private:
    ActionOutcome simulateOutcome(FleetAction action, const QString& serverId, const QVariantMap& parameters);
    QByteArray syntheticFrame(const QString& serverId, const QVariantMap& parameters, quint64 frameNumber) const;

    AddressListParser m_addresses;
    QSet<QString> m_failingServers;
    int m_serverCount = 4;
    int m_responseDelayMs = 200;
    int m_timeoutSeconds = 5;
    int m_clientPort = 8000;
    int m_serverPort = 8000;
    quint64 m_frameCounter = 0;
};

#endif // SIMULATEDACTIONEXECUTOR_H
