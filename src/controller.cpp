#include "controller.h"
#include <algorithm>

namespace hfl {

HierController::HierController(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<hfl::ViewMode>("hfl::ViewMode");
    m_state.mode = m_settings.controls.defaultView;
}

// ── Host input ──

IngestResult HierController::setRows(const QVector<Row>& rows, bool filterApplied) {
    const QVector<Row> normalized = normalizeRows(rows);
    IngestResult res;
    if (normalized.isEmpty()) {
        m_store.clear();
        res.incoming = rows.size();
    } else {
        res = m_store.ingest(normalized, filterApplied);
    }

    m_spark   = sparklineRange(m_store.rows);
    m_options = filter::options(m_store.fullRows);
    FilterState f = filter::reconcile(m_state.filters, m_options);
    if (f != m_state.filters) {
        m_state.filters = f;
        emit filtersChanged();
    }
    applyControlVisibility();

    refresh(true);
    return res;
}

void HierController::setSettings(const Settings& s) {
    m_settings = s;
    if (!m_userSetView || !s.controls.showViewToggle) {
        if (m_state.mode != s.controls.defaultView) {
            m_state.mode = s.controls.defaultView;
            emit viewModeChanged(m_state.mode);
        }
    }
    applyControlVisibility();
    refresh(true);
}

void HierController::setViewport(const QSizeF& size) {
    if (size == m_viewport) return;
    m_viewport = size;
    fitToViewport();
}

// Filters whose control is hidden are cleared.
void HierController::applyControlVisibility() {
    const ControlSettings& c = m_settings.controls;
    FilterState f = m_state.filters;
    if (!c.showControls || !c.showSearch)          f.searchQuery.clear();
    if (!c.showControls || !c.showHierarchyFilter) f.hierarchyFilter.clear();
    if (!c.showControls || !c.showParentFilter)    f.parentFilter.clear();
    if (!c.showControls || !c.showDropdownFilter || !m_options.hasTags())
        f.dropdownFilter.clear();
    if (f != m_state.filters) {
        m_state.filters = f;
        emit filtersChanged();
    }
}

// ── Recomputation ──

void HierController::refresh(bool refit) {
    m_scene = recompute(m_store, m_state, m_settings.layout);
    if (refit && m_scene.hasNodes()
        && m_viewport.width() > 0 && m_viewport.height() > 0) {
        m_state.transform = view::fit(m_state.transform, m_scene.graph,
                                      m_settings.layout, m_viewport);
        emit transformChanged();
    }
    ensureFocus();
    emit sceneChanged();
}

// ── Filters ──

void HierController::setFilters(const FilterState& f) {
    if (f == m_state.filters) return;
    m_state.filters = f;
    emit filtersChanged();
    refresh(true);
}

void HierController::setSearchQuery(const QString& query) {
    FilterState f = m_state.filters;
    f.searchQuery = query.trimmed();
    setFilters(f);
}

void HierController::setHierarchyFilter(const QString& nodeId) {
    FilterState f = m_state.filters;
    f.hierarchyFilter = nodeId;
    setFilters(f);
}

void HierController::setParentFilter(const QString& parentId) {
    FilterState f = m_state.filters;
    f.parentFilter = parentId;
    setFilters(f);
}

void HierController::setDropdownFilter(const QString& tag) {
    FilterState f = m_state.filters;
    f.dropdownFilter = tag;
    setFilters(f);
}

void HierController::clearFilters() {
    setFilters(FilterState{});
}

// ── Collapse ──

// Keeps the toggled node under the pointer instead of refitting.
void HierController::toggleCollapse(const QString& nodeId) {
    if (!m_store.hasChildren(nodeId)) return;

    const LayoutNode* before = m_scene.graph.find(nodeId);
    const bool anchored = before != nullptr;
    const QPointF screenBefore = anchored ? m_state.transform.toScreen(before->pos()) : QPointF();

    if (m_state.collapsed.contains(nodeId))
        m_state.collapsed.remove(nodeId);
    else
        m_state.collapsed.insert(nodeId);

    refresh(false);

    if (anchored) {
        if (const LayoutNode* after = m_scene.graph.find(nodeId))
            setTransform(view::keepStationary(m_state.transform, screenBefore, after->pos()));
    }
}

void HierController::collapseAll() {
    QSet<QString> all;
    for (auto it = m_store.index.constBegin(); it != m_store.index.constEnd(); ++it) {
        if (!it.value().isEmpty()) all.insert(it.key());
    }
    m_state.collapsed = all;
    refresh(true);
}

void HierController::expandAll() {
    m_state.collapsed.clear();
    refresh(true);
}

// ── Transform ──

bool HierController::treeInteractive() const {
    return m_state.mode == ViewMode::Tree && m_scene.hasNodes();
}

QPointF HierController::viewportCenter() const {
    return QPointF(m_viewport.width() / 2, m_viewport.height() / 2);
}

void HierController::setTransform(const ViewTransform& t) {
    m_state.transform = t;
    emit transformChanged();
}

void HierController::panBy(double dx, double dy) {
    if (!treeInteractive()) return;
    setTransform(view::panBy(m_state.transform, dx, dy));
}

void HierController::zoomBy(double factor) {
    if (!treeInteractive() || !(factor > 0)) return;
    setTransform(view::zoomBy(m_state.transform, factor, viewportCenter()));
}

void HierController::zoomTo(double percent) {
    if (!treeInteractive()) return;
    setTransform(view::zoomToPercent(m_state.transform, percent, viewportCenter()));
}

void HierController::zoomIn()  { zoomBy(kWheelZoomIn); }
void HierController::zoomOut() { zoomBy(kWheelZoomOut); }

void HierController::wheelZoom(const QPointF& at, int delta) {
    if (!treeInteractive() || delta == 0) return;
    const double factor = delta > 0 ? kWheelZoomIn : kWheelZoomOut;
    setTransform(view::zoomBy(m_state.transform, factor, at));
}

// Unparsable text leaves the transform alone; the signal still fires so the
// zoom field can fall back to the current label.
bool HierController::commitZoomText(const QString& text) {
    double percent = 0;
    if (!treeInteractive() || !view::parsePercent(text, &percent)) {
        emit transformChanged();
        return false;
    }
    zoomTo(percent);
    return true;
}

void HierController::fitToViewport() {
    if (!m_scene.hasNodes() || m_viewport.width() <= 0 || m_viewport.height() <= 0)
        return;
    setTransform(view::fit(m_state.transform, m_scene.graph, m_settings.layout, m_viewport));
}

// ── Pointer and keyboard ──

Hit HierController::hitTest(const QPointF& screen) const {
    if (!m_scene.hasNodes()) return Hit{};
    return hfl::hitTest(m_scene.hits, m_scene.graph, m_state.transform, screen);
}

void HierController::handleClick(const QPointF& screen, Qt::KeyboardModifiers mods) {
    const Hit hit = hitTest(screen);
    if (!hit.isValid()) {
        clearSelection();
        setFocus(QString());
        return;
    }
    if (hit.toggleHit) {
        setFocus(hit.nodeId);
        toggleCollapse(hit.nodeId);
        return;
    }
    selectNode(hit.nodeId, mods);
}

void HierController::handleDoubleClick(const QPointF& screen) {
    if (!treeInteractive()) return;
    const Hit hit = hitTest(screen);
    if (!hit.isValid() || hit.toggleHit) return;
    const LayoutNode& n = m_scene.graph.nodes[hit.nodeIdx];
    setTransform(view::zoomToNode(m_state.transform, n.pos(),
                                  m_settings.controls.doubleClickZoomPercent, m_viewport));
}

void HierController::setHoveredId(const QString& nodeId) {
    if (nodeId == m_state.hoveredId) return;
    m_state.hoveredId = nodeId;
    emit hoverChanged(nodeId);
}

void HierController::selectNode(const QString& nodeId, Qt::KeyboardModifiers mods) {
    const bool multi = mods & (Qt::ControlModifier | Qt::MetaModifier);
    if (multi) {
        if (m_state.selectedIds.contains(nodeId))
            m_state.selectedIds.remove(nodeId);
        else
            m_state.selectedIds.insert(nodeId);
    } else {
        m_state.selectedIds.clear();
        m_state.selectedIds.insert(nodeId);
    }
    setFocus(nodeId);
    emit selectionChanged(selectedIdentities());
}

void HierController::clearSelection() {
    if (m_state.selectedIds.isEmpty()) return;
    m_state.selectedIds.clear();
    emit selectionChanged({});
}

QStringList HierController::focusOrder() const {
    QStringList out;
    if (m_state.mode == ViewMode::Table) {
        for (const TableRow& r : m_scene.table) out.append(r.id);
    } else {
        for (const LayoutNode& n : m_scene.graph.nodes) out.append(n.id);
    }
    return out;
}

void HierController::setFocus(const QString& nodeId) {
    if (nodeId == m_state.focusedId) return;
    m_state.focusedId = nodeId;
    emit focusChanged(nodeId);
}

// Focus always names a node in the focus order, or nothing when it is empty.
void HierController::ensureFocus() {
    const QStringList order = focusOrder();
    if (order.isEmpty()) {
        setFocus(QString());
        return;
    }
    if (!order.contains(m_state.focusedId))
        setFocus(order.first());
}

bool HierController::handleKey(int key) {
    const QStringList order = focusOrder();
    if (order.isEmpty()) return false;
    ensureFocus();

    const QString focused = m_state.focusedId;
    const int idx = std::max(0, order.indexOf(focused));
    switch (key) {
    case Qt::Key_Down:
    case Qt::Key_Right:
        setFocus(order[std::min(idx + 1, int(order.size()) - 1)]);
        return true;
    case Qt::Key_Up:
    case Qt::Key_Left:
        setFocus(order[std::max(idx - 1, 0)]);
        return true;
    case Qt::Key_Home:
        setFocus(order.first());
        return true;
    case Qt::Key_End:
        setFocus(order.last());
        return true;
    case Qt::Key_Return:
    case Qt::Key_Enter:
    case Qt::Key_Space:
        selectNode(focused, Qt::NoModifier);
        return true;
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        if (m_state.collapsed.contains(focused)) toggleCollapse(focused);
        return true;
    case Qt::Key_Minus:
    case Qt::Key_Underscore:
        if (m_store.hasChildren(focused) && !m_state.collapsed.contains(focused))
            toggleCollapse(focused);
        return true;
    default:
        return false;
    }
}

// Host identities of the selection, in row order.
QVariantList HierController::selectedIdentities() const {
    QVariantList out;
    if (m_state.selectedIds.isEmpty()) return out;
    for (const Row& r : m_store.rows) {
        if (m_state.selectedIds.contains(r.id)) out.append(r.identity);
    }
    return out;
}

// ── View mode ──

void HierController::setViewMode(ViewMode mode) {
    m_userSetView = true;
    if (mode == m_state.mode) return;
    m_state.mode = mode;
    emit viewModeChanged(mode);
    ensureFocus();
    if (mode == ViewMode::Tree) fitToViewport();
}

} // namespace hfl
