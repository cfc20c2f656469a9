#ifndef FLEETSHELL_H
#define FLEETSHELL_H

#include <QObject>
#include <QFile>
#include <QTextStream>
#include <QStringList>
#include <QVariantMap>
#include <QPointer>
#include "shared/fleet/FleetTypes.h"
#include "backend/network/AddressListParser.h"

class QSocketNotifier;
class QIODevice;
class CommandDispatcher;
class SettingsManager;
class ActionState;
class ServerEntry;

/**
 * FleetShell
 *
 * Line oriented front end of the console. Each input line is one command;
 * results of asynchronous actions are printed as they arrive.
 *
 * The shell never touches fleet state itself: every command becomes an
 * intent on the CommandDispatcher.
 */
class FleetShell : public QObject {
    Q_OBJECT

public:
    /**
     * @param dispatcher Command surface driven by this shell
     * @param settings Settings shown by "config" and changed by "set"
     * @param output Device the shell writes to; stdout when null
     */
    FleetShell(CommandDispatcher* dispatcher, SettingsManager* settings,
               QIODevice* output = nullptr, QObject* parent = nullptr);
    ~FleetShell() override;

    // Starts reading commands from standard input
    void start();

    /**
     * @brief Execute one command line
     * @return false when the command was unknown or rejected
     */
    bool processLine(const QString& line);

    /**
     * @brief Execute every complete line readable from input
     * @return false once input is exhausted
     */
    bool consumeInput(QIODevice* input);

    QString prompt() const { return QStringLiteral("fleet> "); }

private slots:
    void onInputReady();
    void onSettingsChanged();
    void onActionCompleted(FleetAction action, const QList<QString>& ids);
    void onActionFailed(FleetAction action, const QString& serverId, const QString& reason);
    void onAddRequested();

private:
    bool runCommand(const QString& command, const QStringList& args);

    // Individual commands
    bool cmdHelp();
    bool cmdConfig();
    bool cmdSet(const QStringList& args);
    bool cmdServers();
    bool cmdImages();
    bool cmdDiscard();
    bool cmdActions();
    bool cmdAdd(const QStringList& args);
    bool cmdRemove(const QStringList& args);
    bool cmdSelect(const QStringList& args);
    bool cmdToggle(const QStringList& args);
    bool cmdExtend(const QStringList& args);
    bool cmdMove(const QStringList& args);
    bool cmdConfigure(const QStringList& args);
    bool cmdInvoke(FleetAction action, const QVariantMap& parameters = QVariantMap());

    bool parseAddresses(const QStringList& args, QList<QString>* addresses);
    QString describeEntry(const ServerEntry& entry, int index) const;
    void printError(const QString& message);
    void printPrompt();

    QPointer<CommandDispatcher> m_dispatcher;
    QPointer<SettingsManager> m_settings;
    AddressListParser m_addresses;

    QFile m_stdout;
    QTextStream m_out;
    QFile m_stdin;
    QSocketNotifier* m_notifier = nullptr;
    bool m_interactive = false;
};

#endif // FLEETSHELL_H
