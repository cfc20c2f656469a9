#include <QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "backend/files/MemoryImagePipeline.h"
#include "backend/network/SimulatedActionExecutor.h"
#include "backend/controllers/CommandDispatcher.h"

class TestLoopbackCollaborators : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void pipelineIngestAssignsHandles();
    void pipelineIgnoresEmptyPayload();
    void pipelineExportWritesFiles();
    void pipelineExportReportsMissingData();
    void pipelineClearReleasesBytes();

    void executorDiscoversServersInNetwork();
    void executorCapturesSyntheticFrames();
    void executorReportsConfiguredFailures();
    void executorUsesConnectionParameters();
    void executorRefreshReportsStatus();

    void endToEndCaptureAndExport();
};

void TestLoopbackCollaborators::initTestCase() {
    qRegisterMetaType<ImageRecord>("ImageRecord");
    qRegisterMetaType<ServerEntry>("ServerEntry");
    qRegisterMetaType<ServerStatus>("ServerStatus");
    qRegisterMetaType<FleetAction>("FleetAction");
    qRegisterMetaType<QList<ActionOutcome>>("QList<ActionOutcome>");
}

void TestLoopbackCollaborators::pipelineIngestAssignsHandles() {
    MemoryImagePipeline pipeline;
    QSignalSpy available(&pipeline, &IImagePipeline::imageAvailable);

    pipeline.ingest("192.168.0.1", QByteArray("abc"), QDateTime());
    pipeline.ingest("192.168.0.2", QByteArray("defg"), QDateTime());

    QCOMPARE(available.count(), 2);
    const ImageRecord first = available.at(0).first().value<ImageRecord>();
    const ImageRecord second = available.at(1).first().value<ImageRecord>();
    QCOMPARE(first.ownerId, QString("192.168.0.1"));
    QVERIFY(first.dataHandle != second.dataHandle);
    QCOMPARE(*pipeline.bytesFor(second.dataHandle), QByteArray("defg"));
    QCOMPARE(pipeline.storedImageCount(), 2);
    QCOMPARE(pipeline.totalStoredBytes(), qint64(7));
}

void TestLoopbackCollaborators::pipelineIgnoresEmptyPayload() {
    MemoryImagePipeline pipeline;
    QSignalSpy available(&pipeline, &IImagePipeline::imageAvailable);
    pipeline.ingest("192.168.0.1", QByteArray(), QDateTime());
    QCOMPARE(available.count(), 0);
    QCOMPARE(pipeline.storedImageCount(), 0);
}

void TestLoopbackCollaborators::pipelineExportWritesFiles() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    MemoryImagePipeline pipeline;
    pipeline.setExportDirectory(dir.filePath("nested/export"));

    QSignalSpy available(&pipeline, &IImagePipeline::imageAvailable);
    QSignalSpy finished(&pipeline, &IImagePipeline::exportFinished);
    pipeline.ingest("192.168.0.1", QByteArray("frame-1"), QDateTime::currentDateTimeUtc());
    const ImageRecord record = available.first().first().value<ImageRecord>();

    pipeline.exportImages({record});
    // Reported from the event loop
    QCOMPARE(finished.count(), 0);
    QTRY_COMPARE(finished.count(), 1);
    QVERIFY(finished.first().at(1).toBool());
    QCOMPARE(finished.first().at(0).value<QList<QString>>(), QList<QString>({record.id}));

    QFile file(QDir(pipeline.exportDirectory()).filePath(record.exportFileName()));
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("frame-1"));
}

void TestLoopbackCollaborators::pipelineExportReportsMissingData() {
    QTemporaryDir dir;
    MemoryImagePipeline pipeline;
    pipeline.setExportDirectory(dir.path());
    QSignalSpy finished(&pipeline, &IImagePipeline::exportFinished);

    pipeline.exportImages({ImageRecord::create("192.168.0.1", QDateTime(), 42)});
    QTRY_COMPARE(finished.count(), 1);
    QVERIFY(!finished.first().at(1).toBool());
    QVERIFY(finished.first().at(2).toString().startsWith("No data held for image"));
}

void TestLoopbackCollaborators::pipelineClearReleasesBytes() {
    MemoryImagePipeline pipeline;
    QSignalSpy available(&pipeline, &IImagePipeline::imageAvailable);
    pipeline.ingest("192.168.0.1", QByteArray("abc"), QDateTime());
    const ImageRecord record = available.first().first().value<ImageRecord>();

    pipeline.clearImages({record});
    QCOMPARE(pipeline.storedImageCount(), 0);
    QVERIFY(pipeline.bytesFor(record.dataHandle).isNull());
}

void TestLoopbackCollaborators::executorDiscoversServersInNetwork() {
    SimulatedActionExecutor executor;
    executor.setResponseDelay(0);
    executor.setNetwork("10.0.5.0/24");
    executor.setServerCount(3);
    QSignalSpy discovered(&executor, &IActionExecutor::serverDiscovered);

    executor.discover();
    QTRY_COMPARE(discovered.count(), 3);
    const ServerEntry last = discovered.last().first().value<ServerEntry>();
    QCOMPARE(last.getId(), QString("10.0.5.3"));
    QCOMPARE(last.getStatus(), ServerStatus::Online);
}

void TestLoopbackCollaborators::executorCapturesSyntheticFrames() {
    SimulatedActionExecutor executor;
    executor.setResponseDelay(0);
    QList<ActionOutcome> received;
    connect(&executor, &IActionExecutor::actionFinished, this,
            [&received](quint64, FleetAction, const QList<ActionOutcome>& outcomes) { received = outcomes; });

    QVariantMap parameters;
    parameters.insert("resolution", QSize(4, 2));
    executor.execute(1, FleetAction::Capture, {"192.168.0.1", "192.168.0.2"}, parameters);
    QTRY_COMPARE(received.size(), 2);

    const QByteArray header("P5\n4 2\n255\n");
    for (const ActionOutcome& outcome : received) {
        QVERIFY(outcome.success);
        QVERIFY(outcome.timestamp.isValid());
        QVERIFY(outcome.payload.startsWith(header));
        QCOMPARE(outcome.payload.size(), header.size() + 8);
    }
}

void TestLoopbackCollaborators::executorReportsConfiguredFailures() {
    SimulatedActionExecutor executor;
    executor.setResponseDelay(0);
    executor.setFailingServers({"192.168.0.2"});
    QList<ActionOutcome> received;
    connect(&executor, &IActionExecutor::actionFinished, this,
            [&received](quint64, FleetAction, const QList<ActionOutcome>& outcomes) { received = outcomes; });

    executor.execute(1, FleetAction::Identify, {"192.168.0.1", "192.168.0.2"}, QVariantMap());
    QTRY_COMPARE(received.size(), 2);
    QVERIFY(received.at(0).success);
    QVERIFY(!received.at(1).success);
    QVERIFY(received.at(1).payload.isEmpty());
    QVERIFY(!received.at(1).failureReason.isEmpty());
}

void TestLoopbackCollaborators::executorUsesConnectionParameters() {
    SimulatedActionExecutor executor;
    executor.setResponseDelay(0);
    executor.setTimeout(7);
    executor.setPorts(5647, 5648);
    QCOMPARE(executor.timeout(), 7);
    QCOMPARE(executor.clientPort(), 5647);
    QCOMPARE(executor.serverPort(), 5648);

    executor.setFailingServers({"192.168.0.1"});
    quint64 answeredDispatch = 0;
    QList<ActionOutcome> received;
    connect(&executor, &IActionExecutor::actionFinished, this,
            [&](quint64 dispatchId, FleetAction, const QList<ActionOutcome>& outcomes) {
                answeredDispatch = dispatchId;
                received = outcomes;
            });

    executor.execute(42, FleetAction::Identify, {"192.168.0.1"}, QVariantMap());
    QTRY_COMPARE(received.size(), 1);
    QCOMPARE(answeredDispatch, quint64(42));
    QCOMPARE(received.first().failureReason, QString("No answer from 192.168.0.1:5648 within 7 s"));
}

void TestLoopbackCollaborators::executorRefreshReportsStatus() {
    SimulatedActionExecutor executor;
    executor.setResponseDelay(0);
    executor.setFailingServers({"192.168.0.2"});
    QSignalSpy status(&executor, &IActionExecutor::statusReceived);

    executor.execute(1, FleetAction::Refresh, {"192.168.0.1", "192.168.0.2"}, QVariantMap());
    QTRY_COMPARE(status.count(), 2);
    QCOMPARE(status.at(0).at(1).value<ServerStatus>(), ServerStatus::Online);
    QCOMPARE(status.at(1).at(1).value<ServerStatus>(), ServerStatus::Unreachable);
}

void TestLoopbackCollaborators::endToEndCaptureAndExport() {
    QTemporaryDir dir;
    SimulatedActionExecutor executor;
    executor.setResponseDelay(0);
    executor.setServerCount(2);
    MemoryImagePipeline pipeline;
    pipeline.setExportDirectory(dir.path());
    CommandDispatcher dispatcher(&executor, &pipeline);

    QCOMPARE(dispatcher.invoke(FleetAction::Find), FleetError::NoError);
    QTRY_COMPARE(dispatcher.fleet().size(), 2);

    dispatcher.select(serverIds(dispatcher.fleet()));
    QCOMPARE(dispatcher.invoke(FleetAction::Capture), FleetError::NoError);
    QCOMPARE(dispatcher.inFlightCount(), 2);
    QTRY_COMPARE(dispatcher.images().size(), 2);
    QCOMPARE(dispatcher.inFlightCount(), 0);

    QSignalSpy completed(&dispatcher, &CommandDispatcher::actionCompleted);
    QCOMPARE(dispatcher.invoke(FleetAction::Export), FleetError::NoError);
    QTRY_COMPARE(completed.count(), 1);
    QCOMPARE(QDir(dir.path()).entryList(QDir::Files).size(), 2);

    QCOMPARE(dispatcher.invoke(FleetAction::Clear), FleetError::NoError);
    QTRY_VERIFY(dispatcher.images().isEmpty());
    QCOMPARE(pipeline.storedImageCount(), 0);
}

QTEST_GUILESS_MAIN(TestLoopbackCollaborators)
#include "tst_LoopbackCollaborators.moc"
