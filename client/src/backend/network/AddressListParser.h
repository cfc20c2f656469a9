#ifndef ADDRESSLISTPARSER_H
#define ADDRESSLISTPARSER_H

#include <QHostAddress>
#include <QList>
#include <QPair>
#include <QString>

/**
 * @brief Parses user supplied server address lists
 *
 * Accepted forms, freely combined with commas:
 *   192.168.0.1
 *   192.168.0.1-192.168.0.10     (inclusive range)
 *   192.168.0.1,192.168.0.5-192.168.0.10
 *
 * Every address must belong to the configured network. The result is sorted
 * numerically and free of duplicates.
 */
class AddressListParser {
public:
    static constexpr int MaxRangeSize = 65536;

    explicit AddressListParser(const QString& network = QStringLiteral("192.168.0.0/16"));

    bool setNetwork(const QString& cidr, QString* errorMessage = nullptr);
    QString network() const;

    bool parse(const QString& text, QList<QString>* addresses, QString* errorMessage = nullptr) const;

    // First count host addresses of the network, skipping the network address itself
    QList<QString> hostAddresses(int count) const;

private:
    bool parseAddress(const QString& text, quint32* address, QString* errorMessage) const;

    QPair<QHostAddress, int> m_network;
};

#endif // ADDRESSLISTPARSER_H
