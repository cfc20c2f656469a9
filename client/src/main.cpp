#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDebug>
#include "backend/controllers/CommandDispatcher.h"
#include "backend/files/MemoryImagePipeline.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/network/SimulatedActionExecutor.h"
#include "frontend/console/FleetShell.h"

namespace {
// Push the current settings into the collaborators that depend on them
void applySettings(const SettingsManager& settings, SimulatedActionExecutor& executor,
                   MemoryImagePipeline& pipeline, CommandDispatcher& dispatcher) {
    executor.setNetwork(settings.getNetwork());
    executor.setServerCount(settings.getSimulatedServers());
    executor.setTimeout(settings.getTimeout());
    executor.setPorts(settings.getClientPort(), settings.getServerPort());
    pipeline.setExportDirectory(settings.getPath());
    dispatcher.setStrictImageOwnership(settings.getStrictImageOwnership());
    dispatcher.setExportConsumesImages(settings.getExportConsumesImages());
}
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("FleetConsole");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("FleetConsole");

    QCommandLineParser parser;
    parser.setApplicationDescription("Console for a fleet of camera servers");
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Print debug output.");
    const QCommandLineOption profileOption("profile", "Use the settings of profile <name>.", "name");
    parser.addOption(verboseOption);
    parser.addOption(profileOption);
    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    const QString profile = parser.isSet(profileOption) ? parser.value(profileOption)
                                                        : SettingsManager::profileFromEnvironment();
    SettingsManager settings(profile);
    settings.loadSettings();

    SimulatedActionExecutor executor;
    MemoryImagePipeline pipeline;
    CommandDispatcher dispatcher(&executor, &pipeline);
    applySettings(settings, executor, pipeline, dispatcher);
    QObject::connect(&settings, &SettingsManager::settingsChanged, &dispatcher, [&]() {
        applySettings(settings, executor, pipeline, dispatcher);
    });

    FleetShell shell(&dispatcher, &settings);
    QObject::connect(&dispatcher, &CommandDispatcher::quitRequested, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);

    shell.start();
    return app.exec();
}
