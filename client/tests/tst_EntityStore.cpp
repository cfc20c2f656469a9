#include <QtTest>
#include "backend/domain/fleet/EntityStore.h"
#include "backend/domain/fleet/InFlightTracker.h"
#include "TestHelpers.h"

using namespace TestHelpers;

class TestEntityStore : public QObject {
    Q_OBJECT

private slots:
    void addAppendsInOrder();
    void duplicateAddIsRejected();
    void addWithoutIdentifierIsRejected();
    void removeIgnoresUnknownIds();
    void removeOrphansImages();
    void readdedServerAdoptsItsImages();
    void updateStatus();
    void strictModeRejectsUnknownOwner();
    void permissiveModeStoresOrphan();
    void removeImagesAndOwnerLookup();

    void inFlightMarkAndResolve();
    void inFlightDetach();
};

void TestEntityStore::addAppendsInOrder() {
    EntityStore store;
    QCOMPARE(store.add(ServerEntry("S1")), FleetError::NoError);
    QCOMPARE(store.add(ServerEntry("S2")), FleetError::NoError);
    QCOMPARE(store.add(ServerEntry("S3")), FleetError::NoError);
    QCOMPARE(idsOf(store.fleet()), QStringList({"S1", "S2", "S3"}));
    QCOMPARE(store.indexOf("S3"), 2);
    QVERIFY(store.find("S2"));
    QVERIFY(!store.find("S9"));
}

void TestEntityStore::duplicateAddIsRejected() {
    EntityStore store;
    store.add(ServerEntry("S1"));
    store.add(ServerEntry("S2"));
    QCOMPARE(store.add(ServerEntry("S1", "other label")), FleetError::DuplicateIdentifier);
    QCOMPARE(store.size(), 2);
    QCOMPARE(store.find("S1")->getLabel(), QString("S1"));
}

void TestEntityStore::addWithoutIdentifierIsRejected() {
    EntityStore store;
    QCOMPARE(store.add(ServerEntry()), FleetError::DuplicateIdentifier);
    QCOMPARE(store.size(), 0);
}

void TestEntityStore::removeIgnoresUnknownIds() {
    EntityStore store;
    store.add(ServerEntry("S1"));
    store.add(ServerEntry("S2"));
    store.add(ServerEntry("S3"));

    QCOMPARE(store.remove({"S3", "nope", "S1"}), QList<QString>({"S1", "S3"}));
    QCOMPARE(idsOf(store.fleet()), QStringList({"S2"}));
    QVERIFY(store.remove({"S1"}).isEmpty());
    QVERIFY(!store.contains("S1"));
}

void TestEntityStore::removeOrphansImages() {
    EntityStore store;
    store.add(ServerEntry("S1"));
    store.add(ServerEntry("S2"));
    store.addImage(ImageRecord::create("S1", QDateTime::currentDateTimeUtc(), 1));
    store.addImage(ImageRecord::create("S2", QDateTime::currentDateTimeUtc(), 2));

    bool orphaned = false;
    store.remove({"S1"}, &orphaned);
    QVERIFY(orphaned);
    QCOMPARE(store.imageCount(), 2);
    QCOMPARE(store.orphanedImageCount(), 1);
    QVERIFY(store.images().at(0).orphaned);
    QVERIFY(!store.images().at(1).orphaned);

    // Nothing left to orphan
    store.remove({"S1"}, &orphaned);
    QVERIFY(!orphaned);
}

void TestEntityStore::readdedServerAdoptsItsImages() {
    EntityStore store;
    store.add(ServerEntry("S1"));
    store.addImage(ImageRecord::create("S1", QDateTime::currentDateTimeUtc(), 1));
    store.remove({"S1"});
    QCOMPARE(store.orphanedImageCount(), 1);

    store.add(ServerEntry("S1"));
    QCOMPARE(store.orphanedImageCount(), 0);
}

void TestEntityStore::updateStatus() {
    EntityStore store;
    store.add(ServerEntry("S1"));
    QVERIFY(store.updateStatus("S1", ServerStatus::Busy));
    QCOMPARE(store.find("S1")->getStatus(), ServerStatus::Busy);
    QVERIFY(!store.updateStatus("S2", ServerStatus::Online));
}

void TestEntityStore::strictModeRejectsUnknownOwner() {
    EntityStore store;
    store.setStrictImageOwnership(true);
    store.add(ServerEntry("S1"));
    QCOMPARE(store.addImage(ImageRecord::create("S9", QDateTime(), 1)), FleetError::UnknownOwner);
    QCOMPARE(store.imageCount(), 0);
    QCOMPARE(store.addImage(ImageRecord::create("S1", QDateTime(), 2)), FleetError::NoError);
    QCOMPARE(store.imageCount(), 1);
}

void TestEntityStore::permissiveModeStoresOrphan() {
    EntityStore store;
    QCOMPARE(store.addImage(ImageRecord::create("S9", QDateTime(), 1)), FleetError::NoError);
    QCOMPARE(store.orphanedImageCount(), 1);
    QVERIFY(store.images().first().timestamp.isValid());
}

void TestEntityStore::removeImagesAndOwnerLookup() {
    EntityStore store;
    store.add(ServerEntry("S1"));
    store.add(ServerEntry("S2"));
    const ImageRecord first = ImageRecord::create("S1", QDateTime(), 1);
    const ImageRecord second = ImageRecord::create("S2", QDateTime(), 2);
    const ImageRecord third = ImageRecord::create("S1", QDateTime(), 3);
    store.addImage(first);
    store.addImage(second);
    store.addImage(third);

    QCOMPARE(store.imagesOwnedBy({"S1"}).size(), 2);
    const QList<ImageRecord> removed = store.removeImages({first.id, "unknown"});
    QCOMPARE(removed.size(), 1);
    QCOMPARE(removed.first().id, first.id);
    QCOMPARE(store.imageCount(), 2);
}

void TestEntityStore::inFlightMarkAndResolve() {
    InFlightTracker tracker;
    tracker.mark({"S1", "S2"}, FleetAction::Capture, 7);
    QVERIFY(tracker.overlaps({"S3", "S2"}));
    QVERIFY(!tracker.overlaps({"S3"}));
    QCOMPARE(tracker.actionFor("S1").value_or(FleetAction::Quit), FleetAction::Capture);

    // A result for another action or another dispatch does not clear the record
    QVERIFY(!tracker.resolve("S1", FleetAction::Copy, 7));
    QVERIFY(!tracker.resolve("S1", FleetAction::Capture, 6));
    QVERIFY(tracker.resolve("S1", FleetAction::Capture, 7));
    QVERIFY(!tracker.resolve("S1", FleetAction::Capture, 7));
    QCOMPARE(tracker.size(), 1);
    QCOMPARE(tracker.pending().value("S2").dispatchId, quint64(7));
}

void TestEntityStore::inFlightDetach() {
    InFlightTracker tracker;
    tracker.mark({"S1", "S2"}, FleetAction::Identify);
    QCOMPARE(tracker.detach({"S2", "S3"}), QList<QString>({"S2"}));
    QVERIFY(!tracker.contains("S2"));
    QVERIFY(!tracker.actionFor("S2").has_value());
    tracker.detach({"S1"});
    QVERIFY(tracker.isEmpty());
}

QTEST_APPLESS_MAIN(TestEntityStore)
#include "tst_EntityStore.moc"
