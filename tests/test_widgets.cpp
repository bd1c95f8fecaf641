#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include <QApplication>
#include <QHeaderView>
#include "controller.h"
#include "tableview.h"
#include "treecanvas.h"

using namespace hfl;

static Row makeRow(const QString& id, const QString& parent, double spark) {
    Row r;
    r.id = id;
    r.parentId = parent;
    r.label = id;
    r.value = spark * 1000;
    r.sparkline = spark;
    r.identity = id;
    return r;
}

class TestWidgets : public QObject {
    Q_OBJECT
private:
    HierController* m_ctrl  = nullptr;
    TableView*      m_table = nullptr;

private slots:
    void init() {
        m_ctrl = new HierController;
        m_table = new TableView(m_ctrl);
        m_table->resize(500, 300);
        m_ctrl->setRows({makeRow("A", "", 0), makeRow("B", "A", 5), makeRow("C", "B", 10)});
        m_ctrl->setViewMode(ViewMode::Table);
    }

    void cleanup() {
        delete m_table;
        delete m_ctrl;
        m_table = nullptr;
        m_ctrl = nullptr;
    }

    void table_columnsAndRows() {
        QCOMPARE(m_table->columnCount(), 3);
        QCOMPARE(m_table->horizontalHeaderItem(0)->text(), QString("Fields"));
        QCOMPARE(m_table->horizontalHeaderItem(1)->text(), QString("Value"));
        QCOMPARE(m_table->horizontalHeaderItem(2)->text(), QString("Sparkline"));
        QCOMPARE(m_table->rowCount(), 3);
        QCOMPARE(m_table->item(2, 0)->data(TableView::DepthRole).toInt(), 2);
        QCOMPARE(m_table->item(1, 2)->data(TableView::FractionRole).toDouble(), 0.5);
        QVERIFY(m_table->item(0, 0)->text().endsWith("A"));
    }

    void table_followsCollapse() {
        m_ctrl->toggleCollapse("B");
        QCOMPARE(m_table->rowCount(), 2);
        QVERIFY(m_table->item(1, 0)->text().startsWith("+"));
    }

    void table_markerGeometry() {
        const QRect cell = m_table->visualItemRect(m_table->item(1, 0));
        const int left = cell.left() + fmt::indentPx(1);
        QVERIFY(m_table->markerHit(1, left + 4));
        QVERIFY(!m_table->markerHit(1, left + 40));
        QVERIFY(!m_table->markerHit(2, cell.left() + fmt::indentPx(2) + 4));   // leaf
    }

    void table_clickSelectsRow() {
        m_table->show();
        QVERIFY(QTest::qWaitForWindowExposed(m_table));
        QSignalSpy spy(m_ctrl, &HierController::selectionChanged);
        const QRect valueCell = m_table->visualItemRect(m_table->item(2, 1));
        QTest::mouseClick(m_table->viewport(), Qt::LeftButton, Qt::NoModifier, valueCell.center());
        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_ctrl->state().selectedIds, QSet<QString>{"C"});
    }

    void table_headerFollowsSettings() {
        Settings s;
        s.table.showHeader = false;
        s.controls.defaultView = ViewMode::Table;
        m_ctrl->setSettings(s);
        QVERIFY(m_table->horizontalHeader()->isHidden());
    }

    void canvas_resizeSetsViewport() {
        m_ctrl->setViewMode(ViewMode::Tree);
        TreeCanvas canvas(m_ctrl);
        canvas.resize(640, 480);
        canvas.show();
        QVERIFY(QTest::qWaitForWindowExposed(&canvas));
        QCOMPARE(m_ctrl->viewport(), QSizeF(640, 480));
        QVERIFY(m_ctrl->transform().scale >= kMinScale);
    }
};

QTEST_MAIN(TestWidgets)
#include "test_widgets.moc"
