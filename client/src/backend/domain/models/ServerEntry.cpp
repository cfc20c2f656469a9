#include "backend/domain/models/ServerEntry.h"

ServerEntry::ServerEntry() : m_status(ServerStatus::Unknown) {
}

ServerEntry::ServerEntry(const QString& id, const QString& label)
    : m_id(id), m_label(label), m_status(ServerStatus::Unknown) {
}

QString ServerEntry::getDisplayText() const {
    QString text = getLabel();
    if (!m_label.isEmpty() && m_label != m_id) {
        text += QString(" (%1)").arg(m_id);
    }
    if (m_status != ServerStatus::Online) {
        text += QString(" [%1]").arg(serverStatusText(m_status).toLower());
    }
    return text;
}

QList<QString> serverIds(const QList<ServerEntry>& entries) {
    QList<QString> ids;
    ids.reserve(entries.size());
    for (const auto& entry : entries) {
        ids.append(entry.getId());
    }
    return ids;
}
