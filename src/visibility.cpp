#include "core.h"

namespace hfl {

// Collapse-aware reachability. A collapsed node stays visible itself but its
// children are never pushed, even when they match a filter on their own.
QVector<Row> computeVisibleRows(const QVector<Row>& filtered, const ChildrenIndex& index,
                                const QSet<QString>& collapsed) {
    QSet<QString> present;
    present.reserve(filtered.size());
    for (const Row& r : filtered) present.insert(r.id);

    QVector<QString> stack;
    for (const Row& r : filtered) {
        if (!r.hasParent() || !present.contains(r.parentId))
            stack.append(r.id);
    }

    QSet<QString> visible;
    visible.reserve(filtered.size());
    while (!stack.isEmpty()) {
        QString id = stack.takeLast();
        if (visible.contains(id)) continue;
        visible.insert(id);
        if (collapsed.contains(id)) continue;

        auto it = index.constFind(id);
        if (it == index.constEnd()) continue;
        for (const QString& c : it.value()) {
            if (present.contains(c)) stack.append(c);
        }
    }

    // Keep input row order for stable rendering
    QVector<Row> out;
    out.reserve(visible.size());
    for (const Row& r : filtered) {
        if (visible.contains(r.id)) out.append(r);
    }
    return out;
}

} // namespace hfl
