#include <QtTest/QTest>
#include <QtTest/QSignalSpy>
#include "controller.h"

using namespace hfl;

static Row makeRow(const QString& id, const QString& parent) {
    Row r;
    r.id = id;
    r.parentId = parent;
    r.label = id;
    r.identity = QStringLiteral("sel:") + id;
    return r;
}

// A
// ├── B
// │   └── D
// └── C
static QVector<Row> sampleRows() {
    return {makeRow("A", ""), makeRow("B", "A"), makeRow("C", "A"), makeRow("D", "B")};
}

class TestController : public QObject {
    Q_OBJECT
private:
    HierController* m_ctrl = nullptr;

    QPointF screenOf(const QString& id) const {
        const LayoutNode* n = m_ctrl->scene().graph.find(id);
        return n ? m_ctrl->transform().toScreen(n->pos()) : QPointF(-1e6, -1e6);
    }

    QPointF toggleOf(const QString& id) const {
        for (const ToggleRect& tr : m_ctrl->scene().hits.toggleRects) {
            if (tr.id == id) return m_ctrl->transform().toScreen(tr.rect.center());
        }
        return QPointF(-1e6, -1e6);
    }

    QStringList nodeIds() const {
        QStringList out;
        for (const LayoutNode& n : m_ctrl->scene().graph.nodes) out.append(n.id);
        return out;
    }

private slots:
    void init() {
        m_ctrl = new HierController;
        m_ctrl->setViewport(QSizeF(800, 600));
        m_ctrl->setRows(sampleRows());
    }

    void cleanup() {
        delete m_ctrl;
        m_ctrl = nullptr;
    }

    // ── Data ──

    void setRows_buildsSceneAndFits() {
        QVERIFY(m_ctrl->scene().hasNodes());
        QCOMPARE(nodeIds(), (QStringList{"A", "B", "D", "C"}));
        ViewTransform expected = view::fit(ViewTransform{}, m_ctrl->scene().graph,
                                           m_ctrl->settings().layout, QSizeF(800, 600));
        QCOMPARE(m_ctrl->transform().scale, expected.scale);
        QCOMPARE(m_ctrl->transform().tx, expected.tx);
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
    }

    void setRows_emptyIsMissingInput() {
        QSignalSpy spy(m_ctrl, &HierController::sceneChanged);
        m_ctrl->setRows({});
        QCOMPARE(spy.count(), 1);
        QVERIFY(m_ctrl->scene().outcome == Outcome::MissingInput);
    }

    void setRows_drillReusesCache() {
        IngestResult res = m_ctrl->setRows({makeRow("D", "B")}, true);
        QVERIFY(res.reusedCache);
        QCOMPARE(nodeIds(), (QStringList{"A", "B", "D", "C"}));
    }

    void setRows_resetsVanishedFilterSelection() {
        m_ctrl->setHierarchyFilter("D");
        QCOMPARE(nodeIds(), (QStringList{"A", "B", "D"}));
        QSignalSpy spy(m_ctrl, &HierController::filtersChanged);
        m_ctrl->setRows({makeRow("A", ""), makeRow("B", "A")});
        QVERIFY(spy.count() >= 1);
        QVERIFY(m_ctrl->state().filters.hierarchyFilter.isEmpty());
        QCOMPARE(nodeIds(), (QStringList{"A", "B"}));
    }

    // ── Filters ──

    void search_noMatches() {
        m_ctrl->setSearchQuery("  zzz ");
        QCOMPARE(m_ctrl->state().filters.searchQuery, QString("zzz"));
        QVERIFY(m_ctrl->scene().outcome == Outcome::EmptyResult);
        QVERIFY(m_ctrl->scene().noMatches);
        m_ctrl->clearFilters();
        QVERIFY(m_ctrl->scene().hasNodes());
    }

    void hiddenControlClearsFilter() {
        m_ctrl->setSearchQuery("D");
        QCOMPARE(nodeIds().size(), 3);
        Settings s;
        s.controls.showSearch = false;
        m_ctrl->setSettings(s);
        QVERIFY(m_ctrl->state().filters.searchQuery.isEmpty());
        QCOMPARE(nodeIds().size(), 4);
    }

    void dropdownClearedWithoutTags() {
        m_ctrl->setDropdownFilter("red");
        Settings s;
        m_ctrl->setSettings(s);     // no row carries a tag
        QVERIFY(m_ctrl->state().filters.dropdownFilter.isEmpty());
    }

    // ── Collapse ──

    void toggleCollapse_keepsNodeStationary() {
        const QPointF before = screenOf("B");
        m_ctrl->toggleCollapse("B");
        QVERIFY(m_ctrl->state().collapsed.contains("B"));
        QCOMPARE(nodeIds(), (QStringList{"A", "B", "C"}));
        const QPointF after = screenOf("B");
        QVERIFY(qAbs(after.x() - before.x()) < 1e-6);
        QVERIFY(qAbs(after.y() - before.y()) < 1e-6);

        m_ctrl->toggleCollapse("B");
        QVERIFY(!m_ctrl->state().collapsed.contains("B"));
        QCOMPARE(nodeIds().size(), 4);
    }

    void toggleCollapse_leafIsNoop() {
        QSignalSpy spy(m_ctrl, &HierController::sceneChanged);
        m_ctrl->toggleCollapse("D");
        QCOMPARE(spy.count(), 0);
        QVERIFY(m_ctrl->state().collapsed.isEmpty());
    }

    void collapseAllExpandAll() {
        m_ctrl->collapseAll();
        QCOMPARE(m_ctrl->state().collapsed, (QSet<QString>{"A", "B"}));
        QCOMPARE(nodeIds(), QStringList{"A"});
        m_ctrl->expandAll();
        QVERIFY(m_ctrl->state().collapsed.isEmpty());
        QCOMPARE(nodeIds().size(), 4);
    }

    // ── Pointer ──

    void click_selectsAndEmitsIdentity() {
        QSignalSpy spy(m_ctrl, &HierController::selectionChanged);
        m_ctrl->handleClick(screenOf("C"), Qt::NoModifier);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toList(), (QVariantList{QString("sel:C")}));
        QCOMPARE(m_ctrl->state().focusedId, QString("C"));

        m_ctrl->handleClick(screenOf("B"), Qt::ControlModifier);
        QCOMPARE(m_ctrl->state().selectedIds, (QSet<QString>{"B", "C"}));
        m_ctrl->handleClick(screenOf("C"), Qt::ControlModifier);
        QCOMPARE(m_ctrl->state().selectedIds, QSet<QString>{"B"});
        m_ctrl->handleClick(screenOf("D"), Qt::NoModifier);
        QCOMPARE(m_ctrl->state().selectedIds, QSet<QString>{"D"});
    }

    void click_emptyClearsSelectionAndFocus() {
        m_ctrl->handleClick(screenOf("C"), Qt::NoModifier);
        QSignalSpy spy(m_ctrl, &HierController::selectionChanged);
        m_ctrl->handleClick(QPointF(1, 1), Qt::NoModifier);
        QCOMPARE(spy.count(), 1);
        QVERIFY(m_ctrl->state().selectedIds.isEmpty());
        QVERIFY(m_ctrl->state().focusedId.isEmpty());
    }

    void click_toggleCollapsesWithoutSelecting() {
        m_ctrl->handleClick(toggleOf("B"), Qt::NoModifier);
        QVERIFY(m_ctrl->state().collapsed.contains("B"));
        QVERIFY(m_ctrl->state().selectedIds.isEmpty());
        QCOMPARE(m_ctrl->state().focusedId, QString("B"));
    }

    void doubleClick_zoomsToNode() {
        const double before = m_ctrl->transform().scale;
        m_ctrl->handleDoubleClick(screenOf("D"));
        const double expected = qBound(kMinScale, before * 1.3, kMaxScale);
        QCOMPARE(m_ctrl->transform().scale, expected);
        const QPointF centre = screenOf("D");
        QVERIFY(qAbs(centre.x() - 400) < 1e-6);
        QVERIFY(qAbs(centre.y() - 300) < 1e-6);
    }

    void doubleClick_onToggleIgnored() {
        const ViewTransform before = m_ctrl->transform();
        m_ctrl->handleDoubleClick(toggleOf("A"));
        QCOMPARE(m_ctrl->transform().scale, before.scale);
        QCOMPARE(m_ctrl->transform().tx, before.tx);
    }

    void hover() {
        QSignalSpy spy(m_ctrl, &HierController::hoverChanged);
        m_ctrl->setHoveredId("B");
        m_ctrl->setHoveredId("B");
        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_ctrl->state().hoveredId, QString("B"));
    }

    // ── Zoom ──

    void wheelZoom_anchorsAtCursor() {
        const QPointF at(123, 234);
        const QPointF layout = m_ctrl->transform().toLayout(at);
        const double before = m_ctrl->transform().scale;
        m_ctrl->wheelZoom(at, 120);
        QCOMPARE(m_ctrl->transform().scale, qBound(kMinScale, before * 1.1, kMaxScale));
        const QPointF back = m_ctrl->transform().toScreen(layout);
        QVERIFY(qAbs(back.x() - at.x()) < 1e-6);
        QVERIFY(qAbs(back.y() - at.y()) < 1e-6);
    }

    void zoomText() {
        const ViewTransform before = m_ctrl->transform();
        QSignalSpy spy(m_ctrl, &HierController::transformChanged);
        QVERIFY(!m_ctrl->commitZoomText("big"));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_ctrl->transform().tx, before.tx);

        QVERIFY(m_ctrl->commitZoomText("150%"));
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("150%"));
        QVERIFY(m_ctrl->commitZoomText("9000"));
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("400%"));
    }

    void zoomButtons() {
        m_ctrl->commitZoomText("100");
        m_ctrl->zoomIn();
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("110%"));
        m_ctrl->commitZoomText("100");
        m_ctrl->zoomOut();
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("90%"));
    }

    void zoomTo_anchorsAtViewportCenter() {
        const QPointF center(400, 300);
        const QPointF layoutPt = m_ctrl->transform().toLayout(center);
        m_ctrl->zoomTo(250);
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("250%"));
        const QPointF back = m_ctrl->transform().toScreen(layoutPt);
        QVERIFY(qAbs(back.x() - center.x()) < 1e-6);
        QVERIFY(qAbs(back.y() - center.y()) < 1e-6);

        m_ctrl->zoomBy(2.0);
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("400%"));
        m_ctrl->zoomBy(0);
        QCOMPARE(m_ctrl->transform().zoomLabel(), QString("400%"));
    }

    void pan_onlyInTreeMode() {
        const double tx = m_ctrl->transform().tx;
        m_ctrl->panBy(10, 0);
        QCOMPARE(m_ctrl->transform().tx, tx + 10);

        m_ctrl->setViewMode(ViewMode::Table);
        m_ctrl->panBy(10, 0);
        QCOMPARE(m_ctrl->transform().tx, tx + 10);
    }

    // ── Keyboard ──

    void keyboardNavigation() {
        QCOMPARE(m_ctrl->focusOrder(), (QStringList{"A", "B", "D", "C"}));
        QVERIFY(m_ctrl->handleKey(Qt::Key_Down));
        QCOMPARE(m_ctrl->state().focusedId, QString("B"));
        m_ctrl->handleKey(Qt::Key_Right);
        QCOMPARE(m_ctrl->state().focusedId, QString("D"));
        m_ctrl->handleKey(Qt::Key_End);
        QCOMPARE(m_ctrl->state().focusedId, QString("C"));
        m_ctrl->handleKey(Qt::Key_Down);
        QCOMPARE(m_ctrl->state().focusedId, QString("C"));
        m_ctrl->handleKey(Qt::Key_Home);
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
        m_ctrl->handleKey(Qt::Key_Up);
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
        QVERIFY(!m_ctrl->handleKey(Qt::Key_F5));
    }

    void keyboardSelectAndCollapse() {
        QSignalSpy spy(m_ctrl, &HierController::selectionChanged);
        m_ctrl->handleKey(Qt::Key_Down);          // B
        m_ctrl->handleKey(Qt::Key_Return);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_ctrl->state().selectedIds, QSet<QString>{"B"});

        m_ctrl->handleKey(Qt::Key_Minus);
        QVERIFY(m_ctrl->state().collapsed.contains("B"));
        m_ctrl->handleKey(Qt::Key_Minus);          // already collapsed
        QVERIFY(m_ctrl->state().collapsed.contains("B"));
        m_ctrl->handleKey(Qt::Key_Equal);
        QVERIFY(!m_ctrl->state().collapsed.contains("B"));
    }

    void focusFallsBackToFirst() {
        m_ctrl->handleClick(screenOf("D"), Qt::NoModifier);
        QCOMPARE(m_ctrl->state().focusedId, QString("D"));
        QSignalSpy spy(m_ctrl, &HierController::focusChanged);
        m_ctrl->collapseAll();                     // D is gone
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
        QCOMPARE(spy.count(), 1);
        QVERIFY(m_ctrl->focusOrder().contains(m_ctrl->state().focusedId));
        m_ctrl->handleKey(Qt::Key_Space);
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
        QCOMPARE(m_ctrl->state().selectedIds, QSet<QString>{"A"});
    }

    void focusKeptWhenStillVisible() {
        m_ctrl->handleClick(screenOf("D"), Qt::NoModifier);
        m_ctrl->setSearchQuery("D");
        QCOMPARE(m_ctrl->state().focusedId, QString("D"));
        m_ctrl->toggleCollapse("C");               // leaf, no-op
        QCOMPARE(m_ctrl->state().focusedId, QString("D"));
    }

    void focusFollowsFilterAndCollapse() {
        m_ctrl->handleClick(screenOf("D"), Qt::NoModifier);
        m_ctrl->setHierarchyFilter("C");           // A, C
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));

        m_ctrl->clearFilters();
        m_ctrl->handleClick(screenOf("D"), Qt::NoModifier);
        m_ctrl->toggleCollapse("B");
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
    }

    void focusClearedWhenNothingMatches() {
        QSignalSpy spy(m_ctrl, &HierController::focusChanged);
        m_ctrl->setSearchQuery("zzz");
        QVERIFY(m_ctrl->scene().outcome == Outcome::EmptyResult);
        QVERIFY(m_ctrl->state().focusedId.isEmpty());
        QCOMPARE(spy.count(), 1);
        QVERIFY(!m_ctrl->handleKey(Qt::Key_Down));

        m_ctrl->setSearchQuery(QString());
        QCOMPARE(m_ctrl->state().focusedId, QString("A"));
    }

    // ── View mode ──

    void viewMode_followsSettingsUntilUserChooses() {
        QSignalSpy spy(m_ctrl, &HierController::viewModeChanged);
        Settings s;
        s.controls.defaultView = ViewMode::Table;
        m_ctrl->setSettings(s);
        QVERIFY(m_ctrl->viewMode() == ViewMode::Table);
        QCOMPARE(spy.count(), 1);

        m_ctrl->setViewMode(ViewMode::Tree);
        m_ctrl->setSettings(s);
        QVERIFY(m_ctrl->viewMode() == ViewMode::Tree);

        s.controls.showViewToggle = false;
        m_ctrl->setSettings(s);
        QVERIFY(m_ctrl->viewMode() == ViewMode::Table);
    }

    void tableFocusOrderMatchesRows() {
        m_ctrl->setViewMode(ViewMode::Table);
        QStringList ids;
        for (const TableRow& r : m_ctrl->scene().table) ids.append(r.id);
        QCOMPARE(m_ctrl->focusOrder(), ids);
    }
};

QTEST_GUILESS_MAIN(TestController)
#include "test_controller.moc"
