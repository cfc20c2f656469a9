#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QString>
#include <QList>
#include <QPair>

/**
 * SettingsManager
 * Manages console settings persistence.
 * Handles:
 * - Network that server addresses must belong to
 * - Connection timeout and ports handed to the action executor
 * - Export directory and image retention policies
 * - Named profiles (separate QSettings scopes) for running several consoles
 */
class SettingsManager : public QObject {
    Q_OBJECT

public:
    explicit SettingsManager(const QString& profile = QString(), QObject* parent = nullptr);
    ~SettingsManager() override = default;

    // Settings persistence
    void loadSettings();
    void saveSettings();

    // Getters
    QString getNetwork() const { return m_network; }
    int getTimeout() const { return m_timeout; }
    int getClientPort() const { return m_clientPort; }
    int getServerPort() const { return m_serverPort; }
    QString getPath() const { return m_path; }
    bool getStrictImageOwnership() const { return m_strictImageOwnership; }
    bool getExportConsumesImages() const { return m_exportConsumesImages; }
    int getSimulatedServers() const { return m_simulatedServers; }
    QString getProfile() const { return m_profile; }

    /**
     * @brief Change one setting from its textual form (console "set" command)
     * @param name Setting name as listed by describe()
     * @param value New value
     * @param errorMessage Filled when the name is unknown or the value invalid
     * @return true when the value was accepted and saved
     */
    bool setValue(const QString& name, const QString& value, QString* errorMessage = nullptr);

    // (name, value) pairs in display order
    QList<QPair<QString, QString>> describe() const;

    // Profile requested through FLEETCONSOLE_PROFILE
    static QString profileFromEnvironment();

signals:
    void settingsChanged();

private:
    QString scopeName() const;

    QString m_profile;
    QString m_network;
    int m_timeout;
    int m_clientPort;
    int m_serverPort;
    QString m_path;
    bool m_strictImageOwnership;
    bool m_exportConsumesImages;
    int m_simulatedServers;
};

#endif // SETTINGSMANAGER_H
