#include "core.h"
#include <algorithm>

namespace hfl {

namespace {

// ── Closure helpers ──
//
// Every filter keeps a matched node together with its full ancestor chain
// and all of its descendants, so the surviving rows always form connected
// sub-trees. Walks are restricted to rows present in the current set.

struct RowSet {
    const QVector<Row>&  rows;
    QHash<QString, int>  byId;

    explicit RowSet(const QVector<Row>& r) : rows(r) {
        byId.reserve(r.size());
        for (int i = 0; i < r.size(); i++)
            byId.insert(r[i].id, i);
    }

    bool contains(const QString& id) const { return byId.contains(id); }

    QString parentOf(const QString& id) const {
        int idx = byId.value(id, -1);
        return idx < 0 ? QString() : rows[idx].parentId;
    }
};

void addAncestors(QSet<QString>& include, const RowSet& set, const QString& startId) {
    QString cur = startId;
    QSet<QString> seen;
    while (!cur.isEmpty() && set.contains(cur) && !seen.contains(cur)) {
        seen.insert(cur);
        include.insert(cur);
        cur = set.parentOf(cur);
    }
}

void addDescendants(QSet<QString>& include, const RowSet& set,
                    const ChildrenIndex& index, const QString& startId) {
    QVector<QString> stack;
    stack.append(startId);
    while (!stack.isEmpty()) {
        QString id = stack.takeLast();
        auto it = index.constFind(id);
        if (it == index.constEnd()) continue;
        for (const QString& c : it.value()) {
            if (!set.contains(c) || include.contains(c)) continue;
            include.insert(c);
            stack.append(c);
        }
    }
}

QVector<Row> keep(const QVector<Row>& rows, const QSet<QString>& include) {
    QVector<Row> out;
    out.reserve(include.size());
    for (const Row& r : rows) {
        if (include.contains(r.id)) out.append(r);
    }
    return out;
}

QStringList sortedLocale(const QSet<QString>& values) {
    QStringList out(values.begin(), values.end());
    std::sort(out.begin(), out.end(), [](const QString& a, const QString& b) {
        return QString::localeAwareCompare(a, b) < 0;
    });
    return out;
}

} // anonymous namespace

namespace filter {

QVector<Row> byHierarchy(const QVector<Row>& rows, const ChildrenIndex& index,
                         const QString& nodeId) {
    RowSet set(rows);
    if (!set.contains(nodeId)) return rows;

    QSet<QString> include;
    addAncestors(include, set, nodeId);
    addDescendants(include, set, index, nodeId);
    return keep(rows, include);
}

QVector<Row> byParent(const QVector<Row>& rows, const ChildrenIndex& index,
                      const QString& parentId) {
    QVector<QString> children;
    for (const Row& r : rows) {
        if (r.parentId == parentId) children.append(r.id);
    }
    // Option lists come from parent ids, so an empty branch must not blank the view
    if (children.isEmpty()) return rows;

    RowSet set(rows);
    QSet<QString> include;
    addAncestors(include, set, parentId);
    for (const QString& c : children) {
        include.insert(c);
        addDescendants(include, set, index, c);
    }
    return keep(rows, include);
}

// Matches are anchored at their parent, so siblings of a match stay visible.
QVector<Row> byTag(const QVector<Row>& rows, const ChildrenIndex& index,
                   const QString& value) {
    RowSet set(rows);
    QVector<QString> anchors;
    QSet<QString> anchorSet;
    for (const Row& r : rows) {
        bool match = r.dropdownTag.trimmed() == value || r.label == value || r.id == value;
        if (!match) continue;
        QString anchor = (r.hasParent() && set.contains(r.parentId)) ? r.parentId : r.id;
        if (!anchorSet.contains(anchor)) {
            anchorSet.insert(anchor);
            anchors.append(anchor);
        }
    }
    if (anchors.isEmpty()) return {};

    QSet<QString> include;
    for (const QString& a : anchors) {
        addAncestors(include, set, a);
        addDescendants(include, set, index, a);
    }
    return keep(rows, include);
}

QVector<Row> bySearch(const QVector<Row>& rows, const ChildrenIndex& index,
                      const QString& query) {
    const QString q = query.trimmed();
    if (q.isEmpty()) return rows;

    RowSet set(rows);
    QSet<QString> include;
    bool any = false;
    for (const Row& r : rows) {
        if (!r.label.contains(q, Qt::CaseInsensitive)) continue;
        any = true;
        addAncestors(include, set, r.id);
        addDescendants(include, set, index, r.id);
    }
    if (!any) return {};
    return keep(rows, include);
}

QVector<Row> apply(const QVector<Row>& rows, const ChildrenIndex& index,
                   const FilterState& state) {
    QVector<Row> result = rows;
    if (!state.hierarchyFilter.isEmpty())
        result = byHierarchy(result, index, state.hierarchyFilter);
    if (!state.parentFilter.isEmpty())
        result = byParent(result, index, state.parentFilter);
    if (!state.dropdownFilter.isEmpty())
        result = byTag(result, index, state.dropdownFilter);
    return bySearch(result, index, state.searchQuery);
}

// ── Option lists ──

FilterOptions options(const QVector<Row>& rows) {
    QSet<QString> ids, parentIds, tags;
    for (const Row& r : rows) {
        ids.insert(r.id);
        if (r.hasParent()) parentIds.insert(r.parentId);
        if (!r.dropdownTag.isEmpty()) tags.insert(r.dropdownTag);
    }
    FilterOptions o;
    o.ids       = sortedLocale(ids);
    o.parentIds = sortedLocale(parentIds);
    o.tags      = sortedLocale(tags);
    return o;
}

FilterState reconcile(const FilterState& state, const FilterOptions& opts) {
    FilterState out = state;
    if (!out.hierarchyFilter.isEmpty() && !opts.ids.contains(out.hierarchyFilter))
        out.hierarchyFilter.clear();
    if (!out.parentFilter.isEmpty() && !opts.parentIds.contains(out.parentFilter))
        out.parentFilter.clear();
    if (!out.dropdownFilter.isEmpty() && !opts.tags.contains(out.dropdownFilter))
        out.dropdownFilter.clear();
    return out;
}

} // namespace filter

} // namespace hfl
