#include "backend/network/SimulatedActionExecutor.h"
#include <QTimer>
#include <QSize>
#include <QDebug>

SimulatedActionExecutor::SimulatedActionExecutor(QObject* parent)
    : IActionExecutor(parent)
{
}

void SimulatedActionExecutor::setNetwork(const QString& cidr) {
    QString errorMessage;
    if (!m_addresses.setNetwork(cidr, &errorMessage)) {
        qWarning() << "SimulatedActionExecutor: Keeping network" << m_addresses.network() << "-" << errorMessage;
    }
}

void SimulatedActionExecutor::setPorts(int clientPort, int serverPort) {
    m_clientPort = clientPort;
    m_serverPort = serverPort;
}

void SimulatedActionExecutor::discover() {
    const QList<QString> found = m_addresses.hostAddresses(m_serverCount);
    qDebug() << "SimulatedActionExecutor: Discovering" << found.size() << "server(s) in" << m_addresses.network();

    QTimer::singleShot(m_responseDelayMs, this, [this, found]() {
        for (const QString& address : found) {
            ServerEntry entry(address, QString("camera@%1:%2").arg(address).arg(m_serverPort));
            entry.setStatus(ServerStatus::Online);
            emit serverDiscovered(entry);
        }
    });
}

void SimulatedActionExecutor::execute(quint64 dispatchId, FleetAction action, const QList<QString>& targets, const QVariantMap& parameters) {
    if (targets.isEmpty()) {
        qWarning() << "SimulatedActionExecutor::execute:" << fleetActionName(action) << "without targets";
        return;
    }

    qDebug() << "SimulatedActionExecutor: Executing" << fleetActionName(action) << "on" << targets << "#" << dispatchId;

    QTimer::singleShot(m_responseDelayMs, this, [this, dispatchId, action, targets, parameters]() {
        QList<ActionOutcome> outcomes;
        outcomes.reserve(targets.size());
        for (const QString& serverId : targets) {
            outcomes.append(simulateOutcome(action, serverId, parameters));
        }

        if (action == FleetAction::Refresh) {
            for (const ActionOutcome& outcome : outcomes) {
                emit statusReceived(outcome.serverId,
                                    outcome.success ? ServerStatus::Online : ServerStatus::Unreachable);
            }
        }
        emit actionFinished(dispatchId, action, outcomes);
    });
}

ActionOutcome SimulatedActionExecutor::simulateOutcome(FleetAction action, const QString& serverId, const QVariantMap& parameters) {
    if (m_failingServers.contains(serverId)) {
        return ActionOutcome::failed(serverId, QString("No answer from %1:%2 within %3 s")
                                                   .arg(serverId).arg(m_serverPort).arg(m_timeoutSeconds));
    }

    ActionOutcome outcome = ActionOutcome::succeeded(serverId);
    outcome.timestamp = QDateTime::currentDateTimeUtc();
    if (action == FleetAction::Capture || action == FleetAction::Copy) {
        outcome.payload = syntheticFrame(serverId, parameters, ++m_frameCounter);
    }
    return outcome;
}

QByteArray SimulatedActionExecutor::syntheticFrame(const QString& serverId, const QVariantMap& parameters, quint64 frameNumber) const {
    QSize size = parameters.value("resolution").toSize();
    if (!size.isValid()) size = QSize(64, 48);

    // PGM header followed by a gradient seeded by the server address and frame number
    QByteArray frame = QString("P5\n%1 %2\n255\n").arg(size.width()).arg(size.height()).toLatin1();
    const int headerSize = frame.size();
    const qsizetype pixels = static_cast<qsizetype>(size.width()) * size.height();
    frame.resize(headerSize + pixels);

    const uint seed = qHash(serverId) + static_cast<uint>(frameNumber);
    for (qsizetype i = 0; i < pixels; ++i) {
        frame[headerSize + i] = static_cast<char>((i + seed) & 0xFF);
    }
    return frame;
}
