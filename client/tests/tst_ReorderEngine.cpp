#include <QtTest>
#include "backend/domain/fleet/ReorderEngine.h"
#include "TestHelpers.h"

using namespace TestHelpers;

class TestReorderEngine : public QObject {
    Q_OBJECT

private slots:
    void moveTop_data();
    void moveTop();
    void moveBottom_data();
    void moveBottom();
    void moveUp_data();
    void moveUp();
    void moveDown_data();
    void moveDown();
    void moveTopThenBottomKeepsComplementOrder();
    void moveTopIsIdempotent();
    void disabledMovesReturnFleetUnchanged();
    void canMove_data();
    void canMove();
};

void TestReorderEngine::moveTop_data() {
    QTest::addColumn<QStringList>("fleet");
    QTest::addColumn<QStringList>("selected");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("scattered") << QStringList{"S1", "S2", "S3", "S4"} << QStringList{"S2", "S4"}
                               << QStringList{"S2", "S4", "S1", "S3"};
    QTest::newRow("single last") << QStringList{"A", "B", "C"} << QStringList{"C"}
                                 << QStringList{"C", "A", "B"};
    QTest::newRow("already on top") << QStringList{"A", "B", "C"} << QStringList{"A", "B"}
                                    << QStringList{"A", "B", "C"};
    QTest::newRow("everything") << QStringList{"A", "B"} << QStringList{"B", "A"}
                                << QStringList{"A", "B"};
}

void TestReorderEngine::moveTop() {
    QFETCH(QStringList, fleet);
    QFETCH(QStringList, selected);
    QFETCH(QStringList, expected);
    QCOMPARE(idsOf(ReorderEngine::moveTop(fleetOf(fleet), setOf(selected))), expected);
}

void TestReorderEngine::moveBottom_data() {
    QTest::addColumn<QStringList>("fleet");
    QTest::addColumn<QStringList>("selected");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("scattered") << QStringList{"S1", "S2", "S3", "S4"} << QStringList{"S1", "S3"}
                               << QStringList{"S2", "S4", "S1", "S3"};
    QTest::newRow("single first") << QStringList{"A", "B", "C"} << QStringList{"A"}
                                  << QStringList{"B", "C", "A"};
    QTest::newRow("already at bottom") << QStringList{"A", "B", "C"} << QStringList{"C"}
                                       << QStringList{"A", "B", "C"};
}

void TestReorderEngine::moveBottom() {
    QFETCH(QStringList, fleet);
    QFETCH(QStringList, selected);
    QFETCH(QStringList, expected);
    QCOMPARE(idsOf(ReorderEngine::moveBottom(fleetOf(fleet), setOf(selected))), expected);
}

void TestReorderEngine::moveUp_data() {
    QTest::addColumn<QStringList>("fleet");
    QTest::addColumn<QStringList>("selected");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("run at top stays") << QStringList{"A", "B", "C"} << QStringList{"A", "B"}
                                      << QStringList{"A", "B", "C"};
    QTest::newRow("single") << QStringList{"A", "B", "C"} << QStringList{"C"}
                            << QStringList{"A", "C", "B"};
    QTest::newRow("run steps over one entry") << QStringList{"A", "B", "C", "D"} << QStringList{"C", "D"}
                                              << QStringList{"A", "C", "D", "B"};
    QTest::newRow("two runs") << QStringList{"A", "B", "C", "D", "E"} << QStringList{"B", "D", "E"}
                              << QStringList{"B", "A", "D", "E", "C"};
    QTest::newRow("top run blocked, lower run moves") << QStringList{"A", "B", "C", "D"} << QStringList{"A", "C"}
                                                      << QStringList{"A", "C", "B", "D"};
}

void TestReorderEngine::moveUp() {
    QFETCH(QStringList, fleet);
    QFETCH(QStringList, selected);
    QFETCH(QStringList, expected);
    QCOMPARE(idsOf(ReorderEngine::moveUp(fleetOf(fleet), setOf(selected))), expected);
}

void TestReorderEngine::moveDown_data() {
    QTest::addColumn<QStringList>("fleet");
    QTest::addColumn<QStringList>("selected");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("run at bottom stays") << QStringList{"A", "B", "C"} << QStringList{"B", "C"}
                                         << QStringList{"A", "B", "C"};
    QTest::newRow("single") << QStringList{"A", "B", "C"} << QStringList{"A"}
                            << QStringList{"B", "A", "C"};
    QTest::newRow("two runs") << QStringList{"A", "B", "C", "D", "E"} << QStringList{"A", "B", "D"}
                              << QStringList{"C", "A", "B", "E", "D"};
    QTest::newRow("bottom run blocked, upper run moves") << QStringList{"A", "B", "C", "D"} << QStringList{"B", "D"}
                                                         << QStringList{"A", "C", "B", "D"};
}

void TestReorderEngine::moveDown() {
    QFETCH(QStringList, fleet);
    QFETCH(QStringList, selected);
    QFETCH(QStringList, expected);
    QCOMPARE(idsOf(ReorderEngine::moveDown(fleetOf(fleet), setOf(selected))), expected);
}

void TestReorderEngine::moveTopThenBottomKeepsComplementOrder() {
    const QStringList ids{"A", "B", "C", "D", "E", "F"};
    const QList<ServerEntry> fleet = fleetOf(ids);

    // Every subset of a six entry fleet
    for (int mask = 0; mask < (1 << ids.size()); ++mask) {
        QSet<QString> selected;
        QStringList complement;
        QStringList selectedInOrder;
        for (int i = 0; i < ids.size(); ++i) {
            if (mask & (1 << i)) {
                selected.insert(ids.at(i));
                selectedInOrder.append(ids.at(i));
            } else {
                complement.append(ids.at(i));
            }
        }

        const QStringList top = idsOf(ReorderEngine::moveTop(fleet, selected));
        QCOMPARE(top.mid(0, selectedInOrder.size()), selectedInOrder);
        QCOMPARE(top.mid(selectedInOrder.size()), complement);

        const QStringList bottom = idsOf(ReorderEngine::moveBottom(fleetOf(top), selected));
        QCOMPARE(bottom.mid(0, complement.size()), complement);
        QCOMPARE(bottom.mid(complement.size()), selectedInOrder);
    }
}

void TestReorderEngine::moveTopIsIdempotent() {
    const QList<ServerEntry> fleet = fleetOf({"A", "B", "C", "D", "E"});
    const QSet<QString> selected = setOf({"B", "E"});
    const QList<ServerEntry> once = ReorderEngine::moveTop(fleet, selected);
    QCOMPARE(idsOf(ReorderEngine::moveTop(once, selected)), idsOf(once));
}

void TestReorderEngine::disabledMovesReturnFleetUnchanged() {
    const QList<ServerEntry> fleet = fleetOf({"A", "B", "C"});
    QCOMPARE(ReorderEngine::moveUp(fleet, {}), fleet);
    QCOMPARE(ReorderEngine::moveDown(fleet, {}), fleet);
    QCOMPARE(ReorderEngine::moveTop(fleet, setOf({"X"})), fleet);
    QCOMPARE(ReorderEngine::moveBottom(fleet, setOf({"A", "B", "C"})), fleet);
    QCOMPARE(ReorderEngine::moveUp(QList<ServerEntry>(), setOf({"A"})), QList<ServerEntry>());
}

void TestReorderEngine::canMove_data() {
    QTest::addColumn<QStringList>("selected");
    QTest::addColumn<bool>("up");
    QTest::addColumn<bool>("down");

    QTest::newRow("empty") << QStringList{} << false << false;
    QTest::newRow("top block") << QStringList{"A", "B"} << false << true;
    QTest::newRow("bottom block") << QStringList{"C", "D"} << true << false;
    QTest::newRow("middle") << QStringList{"B"} << true << true;
    QTest::newRow("all") << QStringList{"A", "B", "C", "D"} << false << false;
    QTest::newRow("top and bottom") << QStringList{"A", "D"} << true << true;
}

void TestReorderEngine::canMove() {
    QFETCH(QStringList, selected);
    QFETCH(bool, up);
    QFETCH(bool, down);
    const QList<ServerEntry> fleet = fleetOf({"A", "B", "C", "D"});
    QCOMPARE(ReorderEngine::canMoveUp(fleet, setOf(selected)), up);
    QCOMPARE(ReorderEngine::canMoveDown(fleet, setOf(selected)), down);
}

QTEST_APPLESS_MAIN(TestReorderEngine)
#include "tst_ReorderEngine.moc"
