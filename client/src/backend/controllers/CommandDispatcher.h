#ifndef COMMANDDISPATCHER_H
#define COMMANDDISPATCHER_H

#include <QObject>
#include <QList>
#include <QString>
#include <QVariantMap>
#include <QPointer>
#include <optional>
#include "shared/fleet/FleetTypes.h"
#include "backend/domain/models/ServerEntry.h"
#include "backend/domain/models/ImageRecord.h"
#include "backend/domain/fleet/EntityStore.h"
#include "backend/domain/fleet/SelectionTracker.h"
#include "backend/domain/fleet/InFlightTracker.h"
#include "backend/domain/fleet/ActionEnablement.h"

class IActionExecutor;
class IImagePipeline;

/**
 * @brief Command surface of the console
 *
 * CommandDispatcher is the single writer of the fleet, the selection and the
 * in-flight bookkeeping. Presentation intents, network events and pipeline
 * events all enter here, on the thread that owns this object; that is the
 * only synchronisation the domain classes rely on.
 *
 * After every mutation the action state is recomputed and a snapshot
 * notification is emitted for whatever changed.
 */
class CommandDispatcher : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Construct a CommandDispatcher
     * @param executor Network collaborator; results are consumed through its signals
     * @param pipeline Image collaborator owning captured bytes
     * @param parent Parent QObject for memory management
     */
    explicit CommandDispatcher(IActionExecutor* executor, IImagePipeline* pipeline, QObject* parent = nullptr);
    ~CommandDispatcher() override = default;

    // Fleet intents
    FleetError addServer(const ServerEntry& entry);
    void removeServers(const QList<QString>& ids);

    // Selection intents
    void select(const QList<QString>& ids);
    void toggleSelection(const QString& id);
    void extendSelectionTo(const QString& id);
    void clearSelection();

    // Reorder intents
    FleetError moveTop() { return applyMove(FleetAction::MoveTop); }
    FleetError moveUp() { return applyMove(FleetAction::MoveUp); }
    FleetError moveDown() { return applyMove(FleetAction::MoveDown); }
    FleetError moveBottom() { return applyMove(FleetAction::MoveBottom); }

    /**
     * @brief Run an action against the current selection
     * @param action Any FleetAction; moves are forwarded to the move intents
     * @param parameters Action specific values, e.g. "resolution" and "framerate" for Configure
     * @return ActionNotPermitted without any side effect when the action is disabled
     */
    FleetError invoke(FleetAction action, const QVariantMap& parameters = QVariantMap());

    FleetError addImage(const ImageRecord& record);

    /**
     * @brief Drop the images left behind by removed servers
     * @return Number of images released
     */
    int discardOrphanedImages();

    // Policies
    void setStrictImageOwnership(bool strict);
    void setExportConsumesImages(bool consume) { m_exportConsumesImages = consume; }
    bool exportConsumesImages() const { return m_exportConsumesImages; }

    // Snapshots
    QList<ServerEntry> fleet() const { return m_store.fleet(); }
    QList<QString> selection() const { return m_selection.orderedSelection(m_store.fleet()); }
    QList<ImageRecord> images() const { return m_store.images(); }
    ActionState actionState() const { return m_actionState; }
    std::optional<FleetAction> inFlightAction(const QString& id) const { return m_inFlight.actionFor(id); }
    int inFlightCount() const { return m_inFlight.size(); }
    bool isExportPending() const { return m_exportPending; }

public slots:
    void updateStatus(const QString& id, ServerStatus status);
    void onServerDiscovered(const ServerEntry& entry);
    void onActionFinished(quint64 dispatchId, FleetAction action, const QList<ActionOutcome>& outcomes);
    void onImageAvailable(const ImageRecord& record);
    void onExportFinished(const QList<QString>& imageIds, bool success, const QString& errorMessage);

signals:
    void fleetChanged(const QList<ServerEntry>& fleet);
    void selectionChanged(const QList<QString>& selection);
    void actionStateChanged(const ActionState& state);
    void imagesChanged(const QList<ImageRecord>& images);

    void actionDispatched(FleetAction action, const QList<QString>& targets);
    // Carries server identifiers, or image identifiers for Export
    void actionCompleted(FleetAction action, const QList<QString>& ids);
    // serverId is empty for failures that are not tied to one server (Export)
    void actionFailed(FleetAction action, const QString& serverId, const QString& reason);

    void addRequested();
    void quitRequested();

private:
    FleetError applyMove(FleetAction action);
    FleetError dispatchToServers(FleetAction action, const QVariantMap& parameters);
    FleetError dispatchExport();
    void releaseReferenceSourceIfDone();
    void releaseImagesOf(const QList<QString>& ownerIds);

    ActionState currentActionState() const;
    void recomputeActions();
    void publishFleet();
    void publishSelection();
    void publishImages();
    void assertOwnerThread() const;

    QPointer<IActionExecutor> m_executor;
    QPointer<IImagePipeline> m_pipeline;

    EntityStore m_store;
    SelectionTracker m_selection;
    InFlightTracker m_inFlight;
    ActionState m_actionState; // last published state, only used to detect changes

    std::optional<QString> m_referenceSource;
    quint64 m_referenceDispatchId = 0;
    quint64 m_lastDispatchId = 0;
    bool m_exportPending = false;
    bool m_exportConsumesImages = false;
};

#endif // COMMANDDISPATCHER_H
