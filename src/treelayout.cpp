#include "core.h"
#include <QDebug>
#include <utility>

namespace hfl {

namespace {

// ── Tidy tree (Reingold–Tilford with Walker's linear-time refinements) ──
//
// Works in sibling units: adjacent siblings are 1 apart, adjacent cousins 2.
// Results are scaled by the node footprint afterwards. Each walk node mirrors
// a Hierarchy entry; index `n` is a virtual parent above the root.

struct WalkNode {
    int          parent   = -1;
    QVector<int> children;
    int          ancestor = -1;   // A: default ancestor for the next subtree
    int          a        = -1;   // ancestor pointer used by apportion
    int          thread   = -1;   // t
    int          number   = 0;    // i: index among siblings
    double       prelim   = 0;    // z
    double       mod      = 0;    // m
    double       change   = 0;    // c
    double       shift    = 0;    // s
    double       x        = 0;
};

class TidyTree {
public:
    explicit TidyTree(const Hierarchy& h) : m_h(h) {
        const int n = h.entries.size();
        m_nodes.resize(n + 1);
        m_virtual = n;
        for (int i = 0; i < n; i++) {
            m_nodes[i].a = i;
            m_nodes[i].parent = h.entries[i].parent;
            m_nodes[i].children = h.entries[i].children;
            for (int k = 0; k < m_nodes[i].children.size(); k++)
                m_nodes[m_nodes[i].children[k]].number = k;
        }
        m_nodes[m_virtual].a = m_virtual;
        m_nodes[m_virtual].children.append(h.root);
        m_nodes[h.root].parent = m_virtual;
        m_nodes[h.root].number = 0;
    }

    QVector<double> run() {
        // Post-order, children left to right
        QVector<int> order;
        QVector<int> stack;
        stack.append(m_h.root);
        while (!stack.isEmpty()) {
            int v = stack.takeLast();
            order.append(v);
            for (int c : m_nodes[v].children) stack.append(c);
        }
        for (int i = order.size() - 1; i >= 0; i--)
            firstWalk(order[i]);

        m_nodes[m_virtual].mod = -m_nodes[m_h.root].prelim;

        // Pre-order: parents before children
        stack.append(m_h.root);
        while (!stack.isEmpty()) {
            int v = stack.takeLast();
            secondWalk(v);
            const auto& kids = m_nodes[v].children;
            for (int k = kids.size() - 1; k >= 0; k--) stack.append(kids[k]);
        }

        QVector<double> xs(m_h.entries.size());
        for (int i = 0; i < xs.size(); i++) xs[i] = m_nodes[i].x;
        return xs;
    }

private:
    const Hierarchy&  m_h;
    QVector<WalkNode> m_nodes;
    int               m_virtual = -1;

    double separation(int a, int b) const {
        return m_nodes[a].parent == m_nodes[b].parent ? 1.0 : 2.0;
    }

    int nextLeft(int v) const {
        const auto& n = m_nodes[v];
        return n.children.isEmpty() ? n.thread : n.children.first();
    }
    int nextRight(int v) const {
        const auto& n = m_nodes[v];
        return n.children.isEmpty() ? n.thread : n.children.last();
    }

    void moveSubtree(int wm, int wp, double shift) {
        double change = shift / (m_nodes[wp].number - m_nodes[wm].number);
        m_nodes[wp].change -= change;
        m_nodes[wp].shift  += shift;
        m_nodes[wm].change += change;
        m_nodes[wp].prelim += shift;
        m_nodes[wp].mod    += shift;
    }

    void executeShifts(int v) {
        double shift = 0, change = 0;
        const auto& kids = m_nodes[v].children;
        for (int k = kids.size() - 1; k >= 0; k--) {
            WalkNode& w = m_nodes[kids[k]];
            w.prelim += shift;
            w.mod    += shift;
            change   += w.change;
            shift    += w.shift + change;
        }
    }

    int nextAncestor(int vim, int v, int ancestor) const {
        int a = m_nodes[vim].a;
        return m_nodes[a].parent == m_nodes[v].parent ? a : ancestor;
    }

    void firstWalk(int v) {
        WalkNode& node = m_nodes[v];
        const auto& siblings = m_nodes[node.parent].children;
        int w = node.number > 0 ? siblings[node.number - 1] : -1;

        if (!node.children.isEmpty()) {
            executeShifts(v);
            double midpoint = (m_nodes[node.children.first()].prelim
                             + m_nodes[node.children.last()].prelim) / 2;
            if (w >= 0) {
                node.prelim = m_nodes[w].prelim + separation(v, w);
                node.mod = node.prelim - midpoint;
            } else {
                node.prelim = midpoint;
            }
        } else if (w >= 0) {
            node.prelim = m_nodes[w].prelim + separation(v, w);
        }

        WalkNode& parent = m_nodes[node.parent];
        int start = parent.ancestor >= 0 ? parent.ancestor : siblings.first();
        parent.ancestor = apportion(v, w, start);
    }

    void secondWalk(int v) {
        WalkNode& node = m_nodes[v];
        const WalkNode& parent = m_nodes[node.parent];
        node.x = node.prelim + parent.mod;
        node.mod += parent.mod;
    }

    int apportion(int v, int w, int ancestor) {
        if (w < 0) return ancestor;

        int vip = v, vop = v, vim = w;
        int vom = m_nodes[m_nodes[vip].parent].children.first();
        double sip = m_nodes[vip].mod, sop = m_nodes[vop].mod;
        double sim = m_nodes[vim].mod, som = m_nodes[vom].mod;

        vim = nextRight(vim);
        vip = nextLeft(vip);
        while (vim >= 0 && vip >= 0) {
            vom = nextLeft(vom);
            vop = nextRight(vop);
            m_nodes[vop].a = v;
            double shift = m_nodes[vim].prelim + sim - m_nodes[vip].prelim - sip
                         + separation(vim, vip);
            if (shift > 0) {
                moveSubtree(nextAncestor(vim, v, ancestor), v, shift);
                sip += shift;
                sop += shift;
            }
            sim += m_nodes[vim].mod;
            sip += m_nodes[vip].mod;
            som += m_nodes[vom].mod;
            sop += m_nodes[vop].mod;
            vim = nextRight(vim);
            vip = nextLeft(vip);
        }
        if (vim >= 0 && nextRight(vop) < 0) {
            m_nodes[vop].thread = vim;
            m_nodes[vop].mod += sim - sop;
        }
        if (vip >= 0 && nextLeft(vom) < 0) {
            m_nodes[vom].thread = vip;
            m_nodes[vom].mod += sip - som;
            ancestor = v;
        }
        return ancestor;
    }
};

} // anonymous namespace

// Positions every visible node. The synthetic root takes part in the walk but
// is dropped from nodes, links and adjacency; real roots report depth 0.
LayoutGraph layoutTree(const Hierarchy& tree, const QVector<Row>& rows,
                       const LayoutSettings& s) {
    LayoutGraph g;
    if (tree.root < 0 || tree.entries.isEmpty()) return g;

    TidyTree tidy(tree);
    const QVector<double> xs = tidy.run();
    const QSizeF step = s.footprint();

    QVector<int> nodeOf(tree.entries.size(), -1);
    QVector<int> stack;
    stack.append(tree.root);
    while (!stack.isEmpty()) {
        int e = stack.takeLast();
        const HierarchyEntry& he = tree.entries[e];
        const auto& kids = he.children;
        for (int k = kids.size() - 1; k >= 0; k--) stack.append(kids[k]);
        if (he.synthetic) continue;

        const Row& r = rows[he.row];
        LayoutNode ln;
        ln.id        = r.id;
        ln.label     = r.label;
        ln.value     = r.value;
        ln.sparkline = r.sparkline;
        ln.tooltip   = r.tooltip;
        ln.identity  = r.identity;
        ln.depth     = he.depth;
        ln.x         = xs[e] * step.width();
        ln.y         = he.depth * step.height();
        if (he.parent >= 0 && !tree.entries[he.parent].synthetic)
            ln.parentId = rows[tree.entries[he.parent].row].id;
        if (s.orientation == Orientation::LeftRight)
            std::swap(ln.x, ln.y);

        nodeOf[e] = g.nodes.size();
        g.indexOf.insert(ln.id, g.nodes.size());
        g.nodes.append(ln);
    }

    for (int e = 0; e < tree.entries.size(); e++) {
        if (nodeOf[e] < 0) continue;
        QVector<QString>& adj = g.children[g.nodes[nodeOf[e]].id];
        for (int c : tree.entries[e].children) {
            g.links.append({nodeOf[e], nodeOf[c]});
            adj.append(g.nodes[nodeOf[c]].id);
        }
    }

    qDebug() << "[Layout]" << g.nodes.size() << "nodes," << g.links.size() << "links"
             << (tree.hasSyntheticRoot() ? "(synthetic root)" : "");
    return g;
}

} // namespace hfl
