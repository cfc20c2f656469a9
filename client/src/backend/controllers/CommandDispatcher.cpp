#include "backend/controllers/CommandDispatcher.h"
#include "backend/domain/fleet/ReorderEngine.h"
#include "shared/interfaces/IActionExecutor.h"
#include "shared/interfaces/IImagePipeline.h"
#include <QThread>
#include <QDebug>

CommandDispatcher::CommandDispatcher(IActionExecutor* executor, IImagePipeline* pipeline, QObject* parent)
    : QObject(parent)
    , m_executor(executor)
    , m_pipeline(pipeline)
{
    Q_ASSERT(m_executor);
    Q_ASSERT(m_pipeline);

    qRegisterMetaType<FleetAction>("FleetAction");
    qRegisterMetaType<ServerStatus>("ServerStatus");
    qRegisterMetaType<ServerEntry>("ServerEntry");
    qRegisterMetaType<ImageRecord>("ImageRecord");
    qRegisterMetaType<ActionOutcome>("ActionOutcome");
    qRegisterMetaType<ActionState>("ActionState");

    // Results may come from worker threads; AutoConnection queues them onto ours
    if (executor) {
        connect(executor, &IActionExecutor::serverDiscovered, this, &CommandDispatcher::onServerDiscovered);
        connect(executor, &IActionExecutor::statusReceived, this, &CommandDispatcher::updateStatus);
        connect(executor, &IActionExecutor::actionFinished, this, &CommandDispatcher::onActionFinished);
    }
    if (pipeline) {
        connect(pipeline, &IImagePipeline::imageAvailable, this, &CommandDispatcher::onImageAvailable);
        connect(pipeline, &IImagePipeline::exportFinished, this, &CommandDispatcher::onExportFinished);
    }

    m_actionState = currentActionState();
}

// ---------------------------------------------------------------------------
// Fleet intents

FleetError CommandDispatcher::addServer(const ServerEntry& entry) {
    assertOwnerThread();
    const int orphansBefore = m_store.orphanedImageCount();
    const FleetError error = m_store.add(entry);
    if (error != FleetError::NoError) {
        return error;
    }
    publishFleet();
    if (m_store.orphanedImageCount() != orphansBefore) {
        publishImages();
    }
    recomputeActions();
    return FleetError::NoError;
}

void CommandDispatcher::removeServers(const QList<QString>& ids) {
    assertOwnerThread();
    bool imagesOrphaned = false;
    const QList<QString> removed = m_store.remove(ids, &imagesOrphaned);
    if (removed.isEmpty()) {
        return;
    }

    // Pending commands keep running remotely; only our bookkeeping lets go
    m_inFlight.detach(removed);
    if (m_referenceSource && removed.contains(*m_referenceSource)) {
        m_referenceSource.reset();
    }
    releaseReferenceSourceIfDone();
    const bool selectionChanged = m_selection.prune(removed);

    publishFleet();
    if (selectionChanged) publishSelection();
    if (imagesOrphaned) publishImages();
    recomputeActions();
}

void CommandDispatcher::updateStatus(const QString& id, ServerStatus status) {
    assertOwnerThread();
    if (!m_store.updateStatus(id, status)) {
        qDebug() << "CommandDispatcher: Ignoring status for unknown server" << id;
        return;
    }
    publishFleet();
    recomputeActions();
}

void CommandDispatcher::onServerDiscovered(const ServerEntry& entry) {
    if (m_store.contains(entry.getId())) {
        qDebug() << "CommandDispatcher: Discovered server" << entry.getId() << "already known";
        return;
    }
    addServer(entry);
}

// ---------------------------------------------------------------------------
// Selection intents

void CommandDispatcher::select(const QList<QString>& ids) {
    assertOwnerThread();
    if (m_selection.setSelection(ids, m_store.fleet())) {
        publishSelection();
        recomputeActions();
    }
}

void CommandDispatcher::toggleSelection(const QString& id) {
    assertOwnerThread();
    if (m_selection.toggle(id, m_store.fleet())) {
        publishSelection();
        recomputeActions();
    }
}

void CommandDispatcher::extendSelectionTo(const QString& id) {
    assertOwnerThread();
    if (m_selection.extendRangeTo(id, m_store.fleet())) {
        publishSelection();
        recomputeActions();
    }
}

void CommandDispatcher::clearSelection() {
    assertOwnerThread();
    if (m_selection.clear()) {
        publishSelection();
        recomputeActions();
    }
}

// ---------------------------------------------------------------------------
// Actions

FleetError CommandDispatcher::applyMove(FleetAction action) {
    assertOwnerThread();
    if (!currentActionState().isEnabled(action)) {
        qWarning() << "CommandDispatcher:" << fleetActionName(action) << "is not permitted";
        return FleetError::ActionNotPermitted;
    }

    const QList<ServerEntry>& fleet = m_store.fleet();
    const QSet<QString>& selected = m_selection.selected();
    QList<ServerEntry> reordered;
    switch (action) {
        case FleetAction::MoveTop: reordered = ReorderEngine::moveTop(fleet, selected); break;
        case FleetAction::MoveUp: reordered = ReorderEngine::moveUp(fleet, selected); break;
        case FleetAction::MoveDown: reordered = ReorderEngine::moveDown(fleet, selected); break;
        case FleetAction::MoveBottom: reordered = ReorderEngine::moveBottom(fleet, selected); break;
        default:
            Q_ASSERT_X(false, "CommandDispatcher::applyMove", "not a move action");
            return FleetError::ActionNotPermitted;
    }

    m_store.applyOrder(reordered);
    qDebug() << "CommandDispatcher:" << fleetActionName(action) << "->" << serverIds(m_store.fleet());
    publishFleet();
    recomputeActions();
    return FleetError::NoError;
}

FleetError CommandDispatcher::invoke(FleetAction action, const QVariantMap& parameters) {
    assertOwnerThread();
    if (!currentActionState().isEnabled(action)) {
        qWarning() << "CommandDispatcher:" << fleetActionName(action) << "is not permitted";
        return FleetError::ActionNotPermitted;
    }

    switch (action) {
        case FleetAction::Find:
            qDebug() << "CommandDispatcher: Starting discovery";
            if (m_executor) m_executor->discover();
            return FleetError::NoError;
        case FleetAction::Add:
            emit addRequested();
            return FleetError::NoError;
        case FleetAction::Quit:
            emit quitRequested();
            return FleetError::NoError;
        case FleetAction::Refresh: {
            // Status queries do not conflict with anything, so nothing is marked in flight
            const QList<QString> ids = serverIds(m_store.fleet());
            emit actionDispatched(action, ids);
            if (m_executor && !ids.isEmpty()) m_executor->execute(++m_lastDispatchId, action, ids, parameters);
            return FleetError::NoError;
        }
        case FleetAction::MoveTop:
        case FleetAction::MoveUp:
        case FleetAction::MoveDown:
        case FleetAction::MoveBottom:
            return applyMove(action);
        case FleetAction::Remove:
            removeServers(selection());
            return FleetError::NoError;
        case FleetAction::Export:
            return dispatchExport();
        case FleetAction::Identify:
        case FleetAction::Configure:
        case FleetAction::Reference:
        case FleetAction::Capture:
        case FleetAction::Copy:
        case FleetAction::Clear:
            return dispatchToServers(action, parameters);
    }
    return FleetError::ActionNotPermitted;
}

FleetError CommandDispatcher::dispatchToServers(FleetAction action, const QVariantMap& parameters) {
    const QList<QString> targets = ActionEnablement::targetsOf(action, m_store.fleet(), m_selection.selected());
    Q_ASSERT(!targets.isEmpty());
    Q_ASSERT(!m_inFlight.overlaps(targets));

    const quint64 dispatchId = ++m_lastDispatchId;
    QVariantMap sent = parameters;
    QList<QString> executorTargets = targets;
    if (action == FleetAction::Reference) {
        const QString source = selection().constFirst();
        sent.insert("source", source);
        executorTargets.removeAll(source);
        m_referenceSource = source;
        m_referenceDispatchId = dispatchId;
    }

    m_inFlight.mark(targets, action, dispatchId);
    recomputeActions();

    qDebug() << "CommandDispatcher: Dispatching" << fleetActionName(action) << "#" << dispatchId
             << "to" << executorTargets << sent;
    emit actionDispatched(action, targets);
    if (m_executor) {
        m_executor->execute(dispatchId, action, executorTargets, sent);
    }
    return FleetError::NoError;
}

FleetError CommandDispatcher::dispatchExport() {
    const QList<ImageRecord> images = m_store.images();
    Q_ASSERT(!images.isEmpty());

    m_exportPending = true;
    recomputeActions();

    QList<QString> imageIds;
    for (const auto& image : images) imageIds.append(image.id);
    qDebug() << "CommandDispatcher: Exporting" << images.size() << "image(s)";
    emit actionDispatched(FleetAction::Export, imageIds);
    if (m_pipeline) {
        m_pipeline->exportImages(images);
    }
    return FleetError::NoError;
}

void CommandDispatcher::onActionFinished(quint64 dispatchId, FleetAction action, const QList<ActionOutcome>& outcomes) {
    assertOwnerThread();
    QList<QString> completed;
    QList<QString> cleared;

    for (const auto& outcome : outcomes) {
        const bool wasPending = m_inFlight.resolve(outcome.serverId, action, dispatchId);
        if (!m_store.contains(outcome.serverId)) {
            qDebug() << "CommandDispatcher:" << fleetActionName(action) << "finished for"
                     << outcome.serverId << "which is no longer in the fleet";
            continue;
        }
        if (!wasPending && isServerTargetedAction(action)) {
            // Also covers results of a dispatch detached before the server was added again
            qWarning() << "CommandDispatcher: Unexpected" << fleetActionName(action) << "#" << dispatchId
                       << "result from" << outcome.serverId;
            continue;
        }

        if (!outcome.success) {
            qWarning() << "CommandDispatcher:" << fleetActionName(action) << "failed on"
                       << outcome.serverId << ":" << outcome.failureReason;
            emit actionFailed(action, outcome.serverId, outcome.failureReason);
            continue;
        }

        completed.append(outcome.serverId);
        if (!outcome.payload.isEmpty() && m_pipeline) {
            m_pipeline->ingest(outcome.serverId, outcome.payload, outcome.timestamp);
        }
        if (action == FleetAction::Clear) {
            cleared.append(outcome.serverId);
        }
    }

    if (action == FleetAction::Reference) {
        releaseReferenceSourceIfDone();
    }

    if (!cleared.isEmpty()) {
        releaseImagesOf(cleared);
    }
    if (!completed.isEmpty()) {
        emit actionCompleted(action, completed);
    }
    recomputeActions();
}

// The reference source is not a target of the executor; it is released
// once no other server still has the same reference dispatch pending.
void CommandDispatcher::releaseReferenceSourceIfDone() {
    if (!m_referenceSource) {
        return;
    }
    const QHash<QString, InFlightTracker::PendingAction>& pending = m_inFlight.pending();
    for (auto it = pending.constBegin(); it != pending.constEnd(); ++it) {
        if (it.value().dispatchId == m_referenceDispatchId && it.key() != *m_referenceSource) {
            return;
        }
    }
    m_inFlight.resolve(*m_referenceSource, FleetAction::Reference, m_referenceDispatchId);
    m_referenceSource.reset();
}

void CommandDispatcher::releaseImagesOf(const QList<QString>& ownerIds) {
    QList<QString> imageIds;
    for (const auto& image : m_store.imagesOwnedBy(ownerIds)) {
        imageIds.append(image.id);
    }
    if (imageIds.isEmpty()) {
        return;
    }
    const QList<ImageRecord> removed = m_store.removeImages(imageIds);
    if (m_pipeline) {
        m_pipeline->clearImages(removed);
    }
    publishImages();
}

// ---------------------------------------------------------------------------
// Images

FleetError CommandDispatcher::addImage(const ImageRecord& record) {
    assertOwnerThread();
    const FleetError error = m_store.addImage(record);
    if (error != FleetError::NoError) {
        return error;
    }
    publishImages();
    recomputeActions();
    return FleetError::NoError;
}

int CommandDispatcher::discardOrphanedImages() {
    assertOwnerThread();
    QList<QString> imageIds;
    for (const auto& image : m_store.images()) {
        if (image.orphaned) imageIds.append(image.id);
    }
    if (imageIds.isEmpty()) {
        return 0;
    }
    const QList<ImageRecord> removed = m_store.removeImages(imageIds);
    qDebug() << "CommandDispatcher: Discarded" << removed.size() << "orphaned image(s)";
    if (m_pipeline) {
        m_pipeline->clearImages(removed);
    }
    publishImages();
    recomputeActions();
    return removed.size();
}

void CommandDispatcher::onImageAvailable(const ImageRecord& record) {
    if (addImage(record) == FleetError::UnknownOwner && m_pipeline) {
        m_pipeline->clearImages({record});
    }
}

void CommandDispatcher::onExportFinished(const QList<QString>& imageIds, bool success, const QString& errorMessage) {
    assertOwnerThread();
    m_exportPending = false;
    if (!success) {
        qWarning() << "CommandDispatcher: Export failed:" << errorMessage;
        emit actionFailed(FleetAction::Export, QString(), errorMessage);
    } else {
        qDebug() << "CommandDispatcher: Exported" << imageIds.size() << "image(s)";
        if (m_exportConsumesImages) {
            const QList<ImageRecord> removed = m_store.removeImages(imageIds);
            if (!removed.isEmpty()) {
                if (m_pipeline) m_pipeline->clearImages(removed);
                publishImages();
            }
        }
        emit actionCompleted(FleetAction::Export, imageIds);
    }
    recomputeActions();
}

void CommandDispatcher::setStrictImageOwnership(bool strict) {
    m_store.setStrictImageOwnership(strict);
}

// ---------------------------------------------------------------------------
// State publication

ActionState CommandDispatcher::currentActionState() const {
    EnablementInputs inputs;
    inputs.fleet = m_store.fleet();
    inputs.selection = m_selection.selected();
    inputs.inFlight = m_inFlight;
    inputs.imageCount = m_store.imageCount();
    inputs.exportPending = m_exportPending;
    return ActionEnablement::compute(inputs);
}

void CommandDispatcher::recomputeActions() {
    const ActionState state = currentActionState();
    if (state == m_actionState) {
        return;
    }
    m_actionState = state;
    emit actionStateChanged(m_actionState);
}

void CommandDispatcher::publishFleet() {
    emit fleetChanged(m_store.fleet());
}

void CommandDispatcher::publishSelection() {
    emit selectionChanged(selection());
}

void CommandDispatcher::publishImages() {
    emit imagesChanged(m_store.images());
}

void CommandDispatcher::assertOwnerThread() const {
    Q_ASSERT_X(QThread::currentThread() == thread(), "CommandDispatcher",
               "fleet state must only be mutated from the dispatcher's thread");
}
