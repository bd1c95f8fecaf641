#include "core.h"

namespace hfl {

// Card rectangles in draw order plus a toggle square in the top-right corner
// of every card whose row has children in the index.
HitMap buildHitMap(const LayoutGraph& graph, const LayoutSettings& s,
                   const ChildrenIndex& index) {
    HitMap map;
    map.nodeRects.reserve(graph.nodes.size());
    for (const LayoutNode& n : graph.nodes) {
        QRectF card(n.x - s.cardWidth / 2, n.y - s.cardHeight / 2,
                    s.cardWidth, s.cardHeight);
        map.nodeRects.append(card);

        auto it = index.constFind(n.id);
        if (it == index.constEnd() || it.value().isEmpty()) continue;
        QRectF toggle(card.left() + card.width() - kToggleSize - kToggleInset,
                      card.top() + kToggleInset, kToggleSize, kToggleSize);
        map.toggleRects.append({n.id, toggle});
    }
    return map;
}

static bool containsInclusive(const QRectF& r, const QPointF& p) {
    return p.x() >= r.left() && p.x() <= r.left() + r.width()
        && p.y() >= r.top()  && p.y() <= r.top() + r.height();
}

Hit hitTest(const HitMap& map, const LayoutGraph& graph,
            const ViewTransform& t, const QPointF& screen) {
    Hit hit;
    const QPointF p = t.toLayout(screen);

    // Topmost card wins
    for (int i = map.nodeRects.size() - 1; i >= 0; i--) {
        const QRectF& r = map.nodeRects[i];
        if (!containsInclusive(r, p)) continue;
        hit.nodeIdx   = i;
        hit.nodeId    = graph.nodes[i].id;
        hit.layoutPos = p;
        hit.local     = p - r.topLeft();
        break;
    }

    // A toggle square under the pointer takes precedence over the card below it
    for (int i = map.toggleRects.size() - 1; i >= 0; i--) {
        const ToggleRect& tr = map.toggleRects[i];
        if (!containsInclusive(tr.rect, p)) continue;
        int idx = graph.indexOf.value(tr.id, -1);
        if (idx < 0) continue;
        if (hit.isValid() && idx < hit.nodeIdx) continue;   // covered by a card drawn later
        hit.nodeIdx   = idx;
        hit.nodeId    = tr.id;
        hit.layoutPos = p;
        hit.local     = p - map.nodeRects[idx].topLeft();
        hit.toggleHit = true;
        break;
    }
    return hit;
}

} // namespace hfl
