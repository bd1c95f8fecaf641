#include "core.h"
#include <QDebug>

namespace hfl {

static const QString kNoMatchesMessage =
    QStringLiteral("No matches.");
static const QString kInvalidHierarchyMessage =
    QStringLiteral("Invalid hierarchy: duplicates, cycles, or missing parents.");

// Table rows follow the hierarchy's pre-order, which is also the layout's
// draw order, so both views list nodes in the same sequence.
static QVector<TableRow> buildTableRows(const LayoutGraph& graph, const RowStore& store,
                                        const QSet<QString>& collapsed) {
    QVector<TableRow> out;
    out.reserve(graph.nodes.size());
    for (const LayoutNode& n : graph.nodes) {
        TableRow t;
        t.id          = n.id;
        t.label       = n.label;
        t.value       = n.value;
        t.sparkline   = n.sparkline;
        t.depth       = n.depth;
        t.hasChildren = store.hasChildren(n.id);
        t.collapsed   = t.hasChildren && collapsed.contains(n.id);
        out.append(t);
    }
    return out;
}

static Scene structuralFailure(const HierarchyResult& hr) {
    qWarning() << "Pipeline: rejected hierarchy," << structuralErrorName(hr.error)
               << hr.offendingId << "-" << hr.reason;
    Scene scene;
    scene.outcome = Outcome::StructuralError;
    scene.error   = hr.error;
    scene.message = kInvalidHierarchyMessage;
    return scene;
}

Scene recompute(const RowStore& store, const ViewState& state, const LayoutSettings& s) {
    Scene scene;
    if (store.isEmpty()) {
        scene.outcome = Outcome::MissingInput;
        return scene;
    }

    const QVector<Row> filtered = filter::apply(store.rows, store.index, state.filters);

    // Rows on a parent cycle are unreachable from any root, so the filtered
    // set is validated before visibility can drop them.
    HierarchyResult check = buildHierarchy(filtered);
    if (!check.ok) return structuralFailure(check);

    const QVector<Row> visible = computeVisibleRows(filtered, store.index, state.collapsed);
    if (visible.isEmpty()) {
        scene.outcome   = Outcome::EmptyResult;
        scene.noMatches = state.filters.isActive();
        if (scene.noMatches) scene.message = kNoMatchesMessage;
        return scene;
    }

    HierarchyResult hr = buildHierarchy(visible);
    if (!hr.ok) return structuralFailure(hr);

    scene.outcome = Outcome::Success;
    scene.graph   = layoutTree(hr.tree, visible, s);
    scene.table   = buildTableRows(scene.graph, store, state.collapsed);
    scene.hits    = buildHitMap(scene.graph, s, store.index);
    return scene;
}

} // namespace hfl
