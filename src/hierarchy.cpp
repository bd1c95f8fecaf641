#include "core.h"

namespace hfl {

const char* structuralErrorName(StructuralError e) {
    switch (e) {
    case StructuralError::None:          return "none";
    case StructuralError::DuplicateId:   return "duplicate id";
    case StructuralError::MissingParent: return "missing parent";
    case StructuralError::Cycle:         return "cycle";
    }
    return "unknown";
}

namespace {

HierarchyResult failure(StructuralError e, const QString& id, const QString& reason) {
    HierarchyResult r;
    r.ok          = false;
    r.error       = e;
    r.offendingId = id;
    r.reason      = reason;
    return r;
}

} // anonymous namespace

// Builds a single-rooted tree over the visible rows. Roots are recomputed
// here because collapse and filtering can cut a row off from its parent.
// More or fewer than one root gets a synthetic parent entry.
HierarchyResult buildHierarchy(const QVector<Row>& visible) {
    QHash<QString, int> byId;
    byId.reserve(visible.size());
    for (int i = 0; i < visible.size(); i++) {
        const QString& id = visible[i].id;
        if (byId.contains(id))
            return failure(StructuralError::DuplicateId, id,
                           QStringLiteral("duplicate id '%1'").arg(id));
        byId.insert(id, i);
    }

    QVector<int> roots;
    for (int i = 0; i < visible.size(); i++) {
        const Row& r = visible[i];
        if (!r.hasParent() || !byId.contains(r.parentId))
            roots.append(i);
    }

    HierarchyResult res;
    Hierarchy& tree = res.tree;
    tree.entries.resize(visible.size());
    for (int i = 0; i < visible.size(); i++)
        tree.entries[i].row = i;

    if (roots.size() == 1) {
        tree.root = roots.first();
    } else {
        HierarchyEntry synth;
        synth.synthetic = true;
        synth.depth     = -1;
        tree.entries.append(synth);
        tree.root = tree.entries.size() - 1;
    }

    QSet<int> rootSet(roots.begin(), roots.end());
    for (int i = 0; i < visible.size(); i++) {
        int parent;
        if (rootSet.contains(i)) {
            if (i == tree.root) continue;
            parent = tree.root;
        } else {
            parent = byId.value(visible[i].parentId, -1);
            if (parent < 0)
                return failure(StructuralError::MissingParent, visible[i].id,
                               QStringLiteral("parent '%1' of '%2' not found")
                                   .arg(visible[i].parentId, visible[i].id));
        }
        tree.entries[i].parent = parent;
        tree.entries[parent].children.append(i);
    }

    // Anything unreachable from the root sits on a parent cycle
    int reached = 0;
    QVector<int> stack;
    stack.append(tree.root);
    QVector<bool> seen(tree.entries.size(), false);
    while (!stack.isEmpty()) {
        int e = stack.takeLast();
        if (seen[e]) continue;
        seen[e] = true;
        reached++;
        for (int c : tree.entries[e].children) {
            tree.entries[c].depth = tree.entries[e].depth + 1;
            stack.append(c);
        }
    }
    if (reached != tree.entries.size()) {
        for (int i = 0; i < visible.size(); i++) {
            if (!seen[i])
                return failure(StructuralError::Cycle, visible[i].id,
                               QStringLiteral("'%1' is its own ancestor").arg(visible[i].id));
        }
    }

    res.ok = true;
    return res;
}

} // namespace hfl
