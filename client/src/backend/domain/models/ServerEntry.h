#ifndef SERVERENTRY_H
#define SERVERENTRY_H

#include <QString>
#include <QList>
#include <QMetaType>
#include "shared/fleet/FleetTypes.h"

/**
 * @brief One camera server of the fleet
 *
 * The identifier is the server's network address. There is deliberately no
 * position field: the position of an entry is its index in the fleet list.
 */
class ServerEntry {
public:
    ServerEntry();
    explicit ServerEntry(const QString& id, const QString& label = QString());

    // Getters
    QString getId() const { return m_id; }
    QString getLabel() const { return m_label.isEmpty() ? m_id : m_label; }
    ServerStatus getStatus() const { return m_status; }

    // Setters
    void setLabel(const QString& label) { m_label = label; }
    void setStatus(ServerStatus status) { m_status = status; }

    // Helper methods
    QString getDisplayText() const;
    bool isValid() const { return !m_id.isEmpty(); }

    bool operator==(const ServerEntry& other) const {
        return m_id == other.m_id && m_label == other.m_label && m_status == other.m_status;
    }
    bool operator!=(const ServerEntry& other) const { return !(*this == other); }

private:
    QString m_id;
    QString m_label;
    ServerStatus m_status = ServerStatus::Unknown;
};

// Identifiers of the given entries, in list order
QList<QString> serverIds(const QList<ServerEntry>& entries);

Q_DECLARE_METATYPE(ServerEntry)

#endif // SERVERENTRY_H
