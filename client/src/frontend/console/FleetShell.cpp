#include "frontend/console/FleetShell.h"
#include "backend/controllers/CommandDispatcher.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/domain/models/CameraSettings.h"
#include <QSocketNotifier>
#include <QRegularExpression>
#include <QCoreApplication>
#include <QDebug>
#include <cstdio>
#include <unistd.h>

namespace {
    struct CommandHelp {
        const char* usage;
        const char* description;
    };

    const CommandHelp COMMANDS[] = {
        {"help", "Show this list"},
        {"config", "Show settings"},
        {"set NAME VALUE", "Change a setting"},
        {"servers", "List the fleet (* marks selected servers)"},
        {"images", "List collected images"},
        {"discard", "Drop the images of removed servers"},
        {"actions", "Show which actions are currently enabled"},
        {"find", "Discover servers in the configured network"},
        {"add ADDRS", "Add servers, e.g. 192.168.0.2,192.168.0.10-192.168.0.12"},
        {"remove [ADDRS]", "Remove the selected servers, or the given ones"},
        {"select ADDRS|all|none", "Replace the selection"},
        {"toggle ADDR", "Toggle one server in the selection"},
        {"extend ADDR", "Select the range from the anchor to ADDR"},
        {"move top|up|down|bottom", "Move the selected servers"},
        {"identify", "Make the selected servers identify themselves"},
        {"configure RES RATE", "Apply resolution (WxH) and framerate (e.g. 30 or 30000/1001)"},
        {"reference", "Copy the selected server's settings to the rest of the fleet"},
        {"capture", "Capture an image on the selected servers"},
        {"copy", "Fetch the last image from the selected servers"},
        {"export", "Write collected images to the export path"},
        {"clear", "Clear images on the selected servers"},
        {"refresh", "Query the status of every server"},
        {"quit", "Leave the console"}
    };

    QString joinIds(const QList<QString>& ids) {
        return QStringList(ids).join(", ");
    }
}

FleetShell::FleetShell(CommandDispatcher* dispatcher, SettingsManager* settings, QIODevice* output, QObject* parent)
    : QObject(parent)
    , m_dispatcher(dispatcher)
    , m_settings(settings)
{
    Q_ASSERT(m_dispatcher);
    Q_ASSERT(m_settings);

    if (output) {
        m_out.setDevice(output);
    } else {
        if (!m_stdout.open(stdout, QIODevice::WriteOnly)) {
            qWarning() << "FleetShell: Cannot open standard output";
        }
        m_out.setDevice(&m_stdout);
    }

    if (m_settings) {
        m_addresses.setNetwork(m_settings->getNetwork());
        connect(m_settings, &SettingsManager::settingsChanged, this, &FleetShell::onSettingsChanged);
    }
    if (m_dispatcher) {
        connect(m_dispatcher, &CommandDispatcher::actionCompleted, this, &FleetShell::onActionCompleted);
        connect(m_dispatcher, &CommandDispatcher::actionFailed, this, &FleetShell::onActionFailed);
        connect(m_dispatcher, &CommandDispatcher::addRequested, this, &FleetShell::onAddRequested);
    }
}

FleetShell::~FleetShell() {
    m_out.flush();
}

void FleetShell::start() {
    // Unbuffered so that unread lines stay in the descriptor and keep the notifier firing
    if (!m_stdin.open(STDIN_FILENO, QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        qWarning() << "FleetShell: Cannot open standard input";
        return;
    }
    m_interactive = true;
    m_notifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &FleetShell::onInputReady);

    m_out << QCoreApplication::applicationName() << " - type \"help\" for the list of commands\n";
    printPrompt();
}

void FleetShell::onInputReady() {
    if (!consumeInput(&m_stdin)) {
        // End of input behaves like "quit"
        m_notifier->setEnabled(false);
        m_out << "\n";
        cmdInvoke(FleetAction::Quit);
        return;
    }
    printPrompt();
}

bool FleetShell::consumeInput(QIODevice* input) {
    do {
        const QByteArray bytes = input->readLine();
        if (bytes.isEmpty()) {
            return false;
        }
        processLine(QString::fromLocal8Bit(bytes));
    } while (input->canReadLine());
    return true;
}

bool FleetShell::processLine(const QString& line) {
    QStringList words = line.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return true;
    }
    const QString command = words.takeFirst().toLower();
    const bool ok = runCommand(command, words);
    m_out.flush();
    return ok;
}

bool FleetShell::runCommand(const QString& command, const QStringList& args) {
    if (command == "help") return cmdHelp();
    if (command == "config") return cmdConfig();
    if (command == "set") return cmdSet(args);
    if (command == "servers") return cmdServers();
    if (command == "images") return cmdImages();
    if (command == "discard") return cmdDiscard();
    if (command == "actions") return cmdActions();
    if (command == "add") return cmdAdd(args);
    if (command == "remove") return cmdRemove(args);
    if (command == "select") return cmdSelect(args);
    if (command == "toggle") return cmdToggle(args);
    if (command == "extend") return cmdExtend(args);
    if (command == "move") return cmdMove(args);
    if (command == "configure") return cmdConfigure(args);

    FleetAction action;
    if (fleetActionFromName(command, &action)) {
        return cmdInvoke(action);
    }
    printError(QString("Unknown command \"%1\"").arg(command));
    return false;
}

bool FleetShell::cmdHelp() {
    for (const auto& entry : COMMANDS) {
        m_out << QString("  %1").arg(QString::fromLatin1(entry.usage), -26) << entry.description << "\n";
    }
    return true;
}

bool FleetShell::cmdConfig() {
    const auto values = m_settings->describe();
    for (const auto& value : values) {
        m_out << QString("  %1").arg(value.first, -20) << value.second << "\n";
    }
    return true;
}

bool FleetShell::cmdSet(const QStringList& args) {
    if (args.size() != 2) {
        printError("Usage: set NAME VALUE");
        return false;
    }
    QString errorMessage;
    if (!m_settings->setValue(args.at(0), args.at(1), &errorMessage)) {
        printError(errorMessage);
        return false;
    }
    return true;
}

bool FleetShell::cmdServers() {
    const QList<ServerEntry> fleet = m_dispatcher->fleet();
    if (fleet.isEmpty()) {
        m_out << "  No servers\n";
        return true;
    }
    for (int i = 0; i < fleet.size(); ++i) {
        m_out << describeEntry(fleet.at(i), i) << "\n";
    }
    return true;
}

QString FleetShell::describeEntry(const ServerEntry& entry, int index) const {
    const bool selected = m_dispatcher->selection().contains(entry.getId());
    QString line = QString("%1 %2. %3")
                       .arg(selected ? QStringLiteral("*") : QStringLiteral(" "))
                       .arg(index + 1, 2)
                       .arg(entry.getDisplayText());
    const auto pending = m_dispatcher->inFlightAction(entry.getId());
    if (pending) {
        line += QString(" (%1 pending)").arg(fleetActionName(*pending).toLower());
    }
    return line;
}

bool FleetShell::cmdImages() {
    const QList<ImageRecord> images = m_dispatcher->images();
    if (images.isEmpty()) {
        m_out << "  No images\n";
        return true;
    }
    for (const auto& image : images) {
        m_out << "  " << image.exportFileName()
              << (image.orphaned ? " (server removed)" : "") << "\n";
    }
    return true;
}

bool FleetShell::cmdDiscard() {
    const int discarded = m_dispatcher->discardOrphanedImages();
    m_out << "Discarded " << discarded << " image(s)\n";
    return true;
}

bool FleetShell::cmdActions() {
    const ActionState state = m_dispatcher->actionState();
    QStringList enabled;
    QStringList disabled;
    for (FleetAction action : allFleetActions()) {
        (state.isEnabled(action) ? enabled : disabled).append(fleetActionName(action).toLower());
    }
    m_out << "  enabled:  " << enabled.join(' ') << "\n";
    m_out << "  disabled: " << disabled.join(' ') << "\n";
    return true;
}

bool FleetShell::cmdAdd(const QStringList& args) {
    if (args.isEmpty()) {
        return cmdInvoke(FleetAction::Add);
    }
    QList<QString> addresses;
    if (!parseAddresses(args, &addresses)) {
        return false;
    }
    bool allAdded = true;
    for (const QString& address : addresses) {
        const FleetError error = m_dispatcher->addServer(ServerEntry(address));
        if (error != FleetError::NoError) {
            printError(QString("%1: %2").arg(address, fleetErrorString(error)));
            allAdded = false;
        }
    }
    return allAdded;
}

bool FleetShell::cmdRemove(const QStringList& args) {
    if (args.isEmpty()) {
        return cmdInvoke(FleetAction::Remove);
    }
    QList<QString> addresses;
    if (!parseAddresses(args, &addresses)) {
        return false;
    }
    m_dispatcher->removeServers(addresses);
    return true;
}

bool FleetShell::cmdSelect(const QStringList& args) {
    if (args.size() == 1 && args.first().toLower() == "none") {
        m_dispatcher->clearSelection();
        return true;
    }
    if (args.size() == 1 && args.first().toLower() == "all") {
        m_dispatcher->select(serverIds(m_dispatcher->fleet()));
        return true;
    }
    QList<QString> addresses;
    if (!parseAddresses(args, &addresses)) {
        return false;
    }
    m_dispatcher->select(addresses);
    return true;
}

bool FleetShell::cmdToggle(const QStringList& args) {
    if (args.size() != 1) {
        printError("Usage: toggle ADDR");
        return false;
    }
    m_dispatcher->toggleSelection(args.first());
    return true;
}

bool FleetShell::cmdExtend(const QStringList& args) {
    if (args.size() != 1) {
        printError("Usage: extend ADDR");
        return false;
    }
    m_dispatcher->extendSelectionTo(args.first());
    return true;
}

bool FleetShell::cmdMove(const QStringList& args) {
    const QString where = args.size() == 1 ? args.first().toLower() : QString();
    if (where == "top") return cmdInvoke(FleetAction::MoveTop);
    if (where == "up") return cmdInvoke(FleetAction::MoveUp);
    if (where == "down") return cmdInvoke(FleetAction::MoveDown);
    if (where == "bottom") return cmdInvoke(FleetAction::MoveBottom);
    printError("Usage: move top|up|down|bottom");
    return false;
}

bool FleetShell::cmdConfigure(const QStringList& args) {
    if (args.size() != 2) {
        printError("Usage: configure RES RATE");
        return false;
    }
    CameraSettings settings;
    QString errorMessage;
    if (!CameraSettings::parseResolution(args.at(0), &settings.resolution, &errorMessage)
        || !CameraSettings::parseFramerate(args.at(1), &settings.framerate, &errorMessage)) {
        printError(errorMessage);
        return false;
    }
    return cmdInvoke(FleetAction::Configure, settings.toParameters());
}

bool FleetShell::cmdInvoke(FleetAction action, const QVariantMap& parameters) {
    const FleetError error = m_dispatcher->invoke(action, parameters);
    if (error != FleetError::NoError) {
        printError(QString("%1: %2").arg(fleetActionName(action), fleetErrorString(error)));
        return false;
    }
    return true;
}

bool FleetShell::parseAddresses(const QStringList& args, QList<QString>* addresses) {
    // "a, b" and "a,b" are the same list
    const QStringList items = args.join(',').split(',', Qt::SkipEmptyParts);
    QString errorMessage;
    if (!m_addresses.parse(items.join(','), addresses, &errorMessage)) {
        printError(errorMessage);
        return false;
    }
    return true;
}

void FleetShell::printError(const QString& message) {
    m_out << "error: " << message << "\n";
    m_out.flush();
}

void FleetShell::printPrompt() {
    if (!m_interactive) return;
    m_out << prompt();
    m_out.flush();
}

void FleetShell::onSettingsChanged() {
    QString errorMessage;
    if (!m_addresses.setNetwork(m_settings->getNetwork(), &errorMessage)) {
        qWarning() << "FleetShell: Keeping network" << m_addresses.network() << "-" << errorMessage;
    }
}

void FleetShell::onActionCompleted(FleetAction action, const QList<QString>& ids) {
    if (action == FleetAction::Export) {
        m_out << "\n" << QString("Exported %1 image(s) to %2").arg(ids.size()).arg(m_settings->getPath()) << "\n";
    } else {
        m_out << "\n" << fleetActionName(action) << " done: " << joinIds(ids) << "\n";
    }
    printPrompt();
    m_out.flush();
}

void FleetShell::onActionFailed(FleetAction action, const QString& serverId, const QString& reason) {
    m_out << "\n" << fleetActionName(action) << " failed";
    if (!serverId.isEmpty()) m_out << " on " << serverId;
    m_out << ": " << reason << "\n";
    printPrompt();
    m_out.flush();
}

void FleetShell::onAddRequested() {
    m_out << "Usage: add ADDRS (single address, A-B range or comma separated list)\n";
}
