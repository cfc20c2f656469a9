#include "backend/managers/app/SettingsManager.h"
#include "backend/network/AddressListParser.h"
#include <QSettings>
#include <QDir>
#include <QRegularExpression>
#include <QDebug>

namespace {
    const QString SETTINGS_ORGANIZATION = QStringLiteral("FleetConsole");
    const QString SETTINGS_APPLICATION = QStringLiteral("Console");

    const QString DEFAULT_NETWORK = QStringLiteral("192.168.0.0/16");
    const int DEFAULT_TIMEOUT = 5;
    const int DEFAULT_PORT = 8000;
    const int DEFAULT_SIMULATED_SERVERS = 4;

    bool parseBool(const QString& text, bool* value) {
        const QString lowered = text.trimmed().toLower();
        if (lowered == "true" || lowered == "on" || lowered == "yes" || lowered == "1") {
            *value = true;
            return true;
        }
        if (lowered == "false" || lowered == "off" || lowered == "no" || lowered == "0") {
            *value = false;
            return true;
        }
        return false;
    }

    bool parseBoundedInt(const QString& text, int minimum, int maximum, int* value) {
        bool ok = false;
        const int parsed = text.trimmed().toInt(&ok);
        if (!ok || parsed < minimum || parsed > maximum) return false;
        *value = parsed;
        return true;
    }
}

SettingsManager::SettingsManager(const QString& profile, QObject* parent)
    : QObject(parent)
    , m_profile(profile)
    , m_network(DEFAULT_NETWORK)
    , m_timeout(DEFAULT_TIMEOUT)
    , m_clientPort(DEFAULT_PORT)
    , m_serverPort(DEFAULT_PORT)
    , m_path(QDir::tempPath())
    , m_strictImageOwnership(false)
    , m_exportConsumesImages(false)
    , m_simulatedServers(DEFAULT_SIMULATED_SERVERS)
{
}

QString SettingsManager::scopeName() const {
    if (m_profile.isEmpty()) {
        return SETTINGS_APPLICATION;
    }
    QString sanitized = m_profile;
    sanitized.replace(QRegularExpression("[^A-Za-z0-9_]"), "_");
    return QStringLiteral("%1_%2").arg(SETTINGS_APPLICATION, sanitized);
}

void SettingsManager::loadSettings() {
    QSettings settings(SETTINGS_ORGANIZATION, scopeName());

    const QString network = settings.value("network", DEFAULT_NETWORK).toString();
    AddressListParser parser;
    if (parser.setNetwork(network)) {
        m_network = parser.network();
    } else {
        qWarning() << "SettingsManager: Ignoring invalid stored network" << network;
        m_network = DEFAULT_NETWORK;
    }

    m_timeout = settings.value("timeout", DEFAULT_TIMEOUT).toInt();
    if (m_timeout <= 0) m_timeout = DEFAULT_TIMEOUT;
    m_clientPort = settings.value("clientPort", DEFAULT_PORT).toInt();
    if (m_clientPort <= 0 || m_clientPort > 65535) m_clientPort = DEFAULT_PORT;
    m_serverPort = settings.value("serverPort", DEFAULT_PORT).toInt();
    if (m_serverPort <= 0 || m_serverPort > 65535) m_serverPort = DEFAULT_PORT;
    m_path = settings.value("path", QDir::tempPath()).toString();
    if (m_path.isEmpty()) m_path = QDir::tempPath();
    m_strictImageOwnership = settings.value("strictImageOwnership", false).toBool();
    m_exportConsumesImages = settings.value("exportConsumesImages", false).toBool();
    m_simulatedServers = settings.value("simulatedServers", DEFAULT_SIMULATED_SERVERS).toInt();
    if (m_simulatedServers < 0) m_simulatedServers = DEFAULT_SIMULATED_SERVERS;

    qDebug() << "SettingsManager: Settings loaded - network:" << m_network
             << "timeout:" << m_timeout << "ports:" << m_clientPort << m_serverPort
             << "path:" << m_path << "profile:" << (m_profile.isEmpty() ? QStringLiteral("<default>") : m_profile);
}

void SettingsManager::saveSettings() {
    QSettings settings(SETTINGS_ORGANIZATION, scopeName());
    settings.setValue("network", m_network);
    settings.setValue("timeout", m_timeout);
    settings.setValue("clientPort", m_clientPort);
    settings.setValue("serverPort", m_serverPort);
    settings.setValue("path", m_path);
    settings.setValue("strictImageOwnership", m_strictImageOwnership);
    settings.setValue("exportConsumesImages", m_exportConsumesImages);
    settings.setValue("simulatedServers", m_simulatedServers);
    settings.sync();

    qDebug() << "SettingsManager: Settings saved";
    emit settingsChanged();
}

bool SettingsManager::setValue(const QString& name, const QString& value, QString* errorMessage) {
    const QString key = name.trimmed();
    bool accepted = false;

    if (key == "network") {
        AddressListParser parser;
        QString parseError;
        accepted = parser.setNetwork(value, &parseError);
        if (accepted) {
            m_network = parser.network();
        } else if (errorMessage) {
            *errorMessage = parseError;
            return false;
        }
    } else if (key == "timeout") {
        accepted = parseBoundedInt(value, 1, 3600, &m_timeout);
    } else if (key == "client_port" || key == "clientPort") {
        accepted = parseBoundedInt(value, 1, 65535, &m_clientPort);
    } else if (key == "server_port" || key == "serverPort") {
        accepted = parseBoundedInt(value, 1, 65535, &m_serverPort);
    } else if (key == "path") {
        accepted = !value.trimmed().isEmpty();
        if (accepted) m_path = QDir::cleanPath(value.trimmed());
    } else if (key == "strict_images" || key == "strictImageOwnership") {
        accepted = parseBool(value, &m_strictImageOwnership);
    } else if (key == "export_consumes" || key == "exportConsumesImages") {
        accepted = parseBool(value, &m_exportConsumesImages);
    } else if (key == "simulated_servers" || key == "simulatedServers") {
        accepted = parseBoundedInt(value, 0, 1024, &m_simulatedServers);
    } else {
        if (errorMessage) *errorMessage = QString("Unknown setting \"%1\"").arg(key);
        return false;
    }

    if (!accepted) {
        if (errorMessage) *errorMessage = QString("Invalid value \"%1\" for %2").arg(value.trimmed(), key);
        return false;
    }
    saveSettings();
    return true;
}

QList<QPair<QString, QString>> SettingsManager::describe() const {
    return {
        {"network", m_network},
        {"timeout", QString::number(m_timeout)},
        {"client_port", QString::number(m_clientPort)},
        {"server_port", QString::number(m_serverPort)},
        {"path", m_path},
        {"strict_images", m_strictImageOwnership ? "true" : "false"},
        {"export_consumes", m_exportConsumesImages ? "true" : "false"},
        {"simulated_servers", QString::number(m_simulatedServers)}
    };
}

QString SettingsManager::profileFromEnvironment() {
    return qEnvironmentVariable("FLEETCONSOLE_PROFILE");
}
