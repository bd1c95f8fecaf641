#include "core.h"
#include <QtMath>
#include <algorithm>
#include <limits>

namespace hfl {

int ViewTransform::zoomPercent() const {
    return qRound(scale * 100);
}

QString ViewTransform::zoomLabel() const {
    return QStringLiteral("%1%").arg(zoomPercent());
}

namespace view {

// Centers the bounding box of all cards; scale is capped at 2x so a lone
// node does not fill the whole viewport.
ViewTransform fit(const ViewTransform& t, const LayoutGraph& graph,
                  const LayoutSettings& s, const QSizeF& viewport) {
    if (graph.nodes.isEmpty() || viewport.width() <= 0 || viewport.height() <= 0)
        return t;

    double minX = std::numeric_limits<double>::infinity();
    double minY = minX;
    double maxX = -minX;
    double maxY = -minX;
    for (const LayoutNode& n : graph.nodes) {
        minX = std::min(minX, n.x - s.cardWidth / 2);
        minY = std::min(minY, n.y - s.cardHeight / 2);
        maxX = std::max(maxX, n.x + s.cardWidth / 2);
        maxY = std::max(maxY, n.y + s.cardHeight / 2);
    }

    const double contentW = maxX - minX;
    const double contentH = maxY - minY;
    const double availW = std::max(1.0, viewport.width()  - kFitPadding * 2);
    const double availH = std::max(1.0, viewport.height() - kFitPadding * 2);

    const double sx = availW / std::max(1.0, contentW);
    const double sy = availH / std::max(1.0, contentH);

    ViewTransform out;
    out.scale = qBound(kMinScale, std::min(sx, sy), kMaxFitScale);
    const double cx = (minX + maxX) / 2;
    const double cy = (minY + maxY) / 2;
    out.tx = viewport.width()  / 2 - cx * out.scale;
    out.ty = viewport.height() / 2 - cy * out.scale;
    return out;
}

ViewTransform panBy(const ViewTransform& t, double dx, double dy) {
    ViewTransform out = t;
    out.tx += dx;
    out.ty += dy;
    return out;
}

// translate' = anchor - (anchor - translate) * (s1 / s0)
ViewTransform zoomAt(const ViewTransform& t, double newScale, const QPointF& anchor) {
    const double next = qBound(kMinScale, newScale, kMaxScale);
    const double ratio = next / t.scale;
    ViewTransform out;
    out.scale = next;
    out.tx = anchor.x() - (anchor.x() - t.tx) * ratio;
    out.ty = anchor.y() - (anchor.y() - t.ty) * ratio;
    return out;
}

ViewTransform zoomBy(const ViewTransform& t, double factor, const QPointF& anchor) {
    return zoomAt(t, t.scale * factor, anchor);
}

ViewTransform zoomToPercent(const ViewTransform& t, double percent, const QPointF& anchor) {
    const double clamped = qBound(kMinScale * 100, percent, kMaxScale * 100);
    const double next = clamped / 100;
    if (qFuzzyCompare(next, t.scale)) return t;
    return zoomAt(t, next, anchor);
}

ViewTransform zoomToNode(const ViewTransform& t, const QPointF& nodePos,
                         double percent, const QSizeF& viewport) {
    const double factor = std::max(10.0, percent) / 100;
    ViewTransform out;
    out.scale = qBound(kMinScale, t.scale * factor, kMaxScale);
    out.tx = viewport.width()  / 2 - nodePos.x() * out.scale;
    out.ty = viewport.height() / 2 - nodePos.y() * out.scale;
    return out;
}

ViewTransform keepStationary(const ViewTransform& t, const QPointF& screenPoint,
                             const QPointF& layoutPoint) {
    ViewTransform out = t;
    out.tx = screenPoint.x() - layoutPoint.x() * t.scale;
    out.ty = screenPoint.y() - layoutPoint.y() * t.scale;
    return out;
}

// Accepts "150", "150%", " 75.5 % "
bool parsePercent(const QString& text, double* percent) {
    QString raw = text.trimmed();
    raw.remove(QLatin1Char('%'));
    bool ok = false;
    double v = raw.trimmed().toDouble(&ok);
    if (!ok || !qIsFinite(v)) return false;
    if (percent) *percent = v;
    return true;
}

} // namespace view

} // namespace hfl
