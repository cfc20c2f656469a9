#include "backend/network/AddressListParser.h"
#include <QStringList>
#include <QDebug>
#include <algorithm>

namespace {
void setError(QString* errorMessage, const QString& message) {
    if (errorMessage) *errorMessage = message;
}
}

AddressListParser::AddressListParser(const QString& network) {
    if (!setNetwork(network)) {
        qWarning() << "AddressListParser: Invalid network" << network << "- falling back to 192.168.0.0/16";
        setNetwork(QStringLiteral("192.168.0.0/16"));
    }
}

bool AddressListParser::setNetwork(const QString& cidr, QString* errorMessage) {
    const QPair<QHostAddress, int> subnet = QHostAddress::parseSubnet(cidr.trimmed());
    if (subnet.first.isNull() || subnet.first.protocol() != QAbstractSocket::IPv4Protocol) {
        setError(errorMessage, QString("Invalid network \"%1\"").arg(cidr));
        return false;
    }
    m_network = subnet;
    return true;
}

QString AddressListParser::network() const {
    return QString("%1/%2").arg(m_network.first.toString()).arg(m_network.second);
}

bool AddressListParser::parseAddress(const QString& text, quint32* address, QString* errorMessage) const {
    const QString trimmed = text.trimmed();
    QHostAddress host;
    if (!host.setAddress(trimmed) || host.protocol() != QAbstractSocket::IPv4Protocol) {
        setError(errorMessage, QString("Invalid address \"%1\"").arg(trimmed));
        return false;
    }
    if (!host.isInSubnet(m_network)) {
        setError(errorMessage, QString("Address \"%1\" does not belong to the configured network \"%2\"")
                                   .arg(trimmed, network()));
        return false;
    }
    *address = host.toIPv4Address();
    return true;
}

bool AddressListParser::parse(const QString& text, QList<QString>* addresses, QString* errorMessage) const {
    if (text.trimmed().isEmpty()) {
        setError(errorMessage, "You must specify address(es)");
        return false;
    }

    QList<quint32> values;
    const QStringList items = text.split(',');
    for (const QString& item : items) {
        if (item.contains('-')) {
            const QStringList bounds = item.split('-');
            if (bounds.size() != 2) {
                setError(errorMessage, "Expected two dash-separated addresses");
                return false;
            }
            quint32 start = 0;
            quint32 finish = 0;
            if (!parseAddress(bounds.at(0), &start, errorMessage)
                || !parseAddress(bounds.at(1), &finish, errorMessage)) {
                return false;
            }
            if (finish < start) {
                setError(errorMessage, QString("Address range \"%1\" is reversed").arg(item.trimmed()));
                return false;
            }
            if (finish - start >= static_cast<quint32>(MaxRangeSize)) {
                setError(errorMessage, QString("Address range \"%1\" is too large").arg(item.trimmed()));
                return false;
            }
            for (quint32 value = start; ; ++value) {
                values.append(value);
                if (value == finish) break;
            }
        } else {
            quint32 value = 0;
            if (!parseAddress(item, &value, errorMessage)) {
                return false;
            }
            values.append(value);
        }
    }

    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());

    if (addresses) {
        addresses->clear();
        for (quint32 value : values) {
            addresses->append(QHostAddress(value).toString());
        }
    }
    return true;
}

QList<QString> AddressListParser::hostAddresses(int count) const {
    QList<QString> result;
    const int hostBits = 32 - m_network.second;
    const quint64 capacity = hostBits >= 32 ? Q_UINT64_C(0xFFFFFFFF) : ((Q_UINT64_C(1) << hostBits) - 1);
    const quint32 base = m_network.first.toIPv4Address();
    for (quint64 offset = 1; offset < capacity && result.size() < count; ++offset) {
        result.append(QHostAddress(static_cast<quint32>(base + offset)).toString());
    }
    return result;
}
