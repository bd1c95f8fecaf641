#include "treecanvas.h"
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QWheelEvent>
#include <algorithm>

namespace hfl {

static const QColor kToggleFill   (0xf9, 0xfa, 0xfb);
static const QColor kToggleStroke (0xd1, 0xd5, 0xdb);
static const QColor kToggleText   (0x37, 0x41, 0x51);
static const QColor kMessageText  (0x6b, 0x72, 0x80);

static constexpr int kTextPad   = 6;
static constexpr int kSparkPad  = 8;
static constexpr int kMaxLabel  = 40;

static QPointF eventPos(const QMouseEvent* e) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    return e->position();
#else
    return e->localPos();
#endif
}

TreeCanvas::TreeCanvas(HierController* ctrl, QWidget* parent)
    : QWidget(parent), m_ctrl(ctrl)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setMinimumSize(200, 150);

    connect(m_ctrl, &HierController::sceneChanged,     this, qOverload<>(&QWidget::update));
    connect(m_ctrl, &HierController::transformChanged, this, qOverload<>(&QWidget::update));
    connect(m_ctrl, &HierController::selectionChanged, this, [this]() { update(); });
    connect(m_ctrl, &HierController::focusChanged,     this, [this]() { update(); });
    connect(m_ctrl, &HierController::hoverChanged,     this, [this]() { update(); });
}

// ── Painting ──

void TreeCanvas::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);

    const AppearanceSettings& app = m_ctrl->settings().appearance;
    p.fillRect(rect(), app.useBackground ? app.background : palette().color(QPalette::Base));

    const Scene& scene = m_ctrl->scene();
    switch (scene.outcome) {
    case Outcome::MissingInput:
        paintMessage(p, tr("Open a rows file with an id and a parent id per row "
                           "to draw the hierarchy."));
        return;
    case Outcome::EmptyResult:
    case Outcome::StructuralError:
        paintMessage(p, scene.message);
        return;
    case Outcome::Success:
        break;
    }

    const ViewTransform& t = m_ctrl->transform();
    p.save();
    p.translate(t.tx, t.ty);
    p.scale(t.scale, t.scale);
    paintLinks(p);
    for (const LayoutNode& n : scene.graph.nodes)
        paintCard(p, n);
    p.restore();
}

// Elbow connectors from the parent's edge to the child's edge
void TreeCanvas::paintLinks(QPainter& p) {
    const AppearanceSettings& app = m_ctrl->settings().appearance;
    const LayoutSettings& s = m_ctrl->settings().layout;
    if (app.lineWidth <= 0) return;

    const LayoutGraph& g = m_ctrl->scene().graph;
    const QString& hovered = m_ctrl->state().hoveredId;
    const double w = app.lineWidth / m_ctrl->transform().scale;

    for (const Link& l : g.links) {
        const LayoutNode& a = g.nodes[l.source];
        const LayoutNode& b = g.nodes[l.target];
        const bool active = !hovered.isEmpty() && (a.id == hovered || b.id == hovered);
        p.setPen(QPen(active ? app.activeLineColor : app.lineColor, w));

        QPainterPath path;
        if (s.orientation == Orientation::TopDown) {
            const double y1 = a.y + s.cardHeight / 2;
            const double y2 = b.y - s.cardHeight / 2;
            const double mid = (y1 + y2) / 2;
            path.moveTo(a.x, y1);
            path.lineTo(a.x, mid);
            path.lineTo(b.x, mid);
            path.lineTo(b.x, y2);
        } else {
            const double x1 = a.x + s.cardWidth / 2;
            const double x2 = b.x - s.cardWidth / 2;
            const double mid = (x1 + x2) / 2;
            path.moveTo(x1, a.y);
            path.lineTo(mid, a.y);
            path.lineTo(mid, b.y);
            path.lineTo(x2, b.y);
        }
        p.drawPath(path);
    }
}

void TreeCanvas::paintCard(QPainter& p, const LayoutNode& n) {
    const AppearanceSettings& app = m_ctrl->settings().appearance;
    const LayoutSettings& s = m_ctrl->settings().layout;
    const ViewState& st = m_ctrl->state();
    const double inv = 1.0 / m_ctrl->transform().scale;

    const QRectF card(n.x - s.cardWidth / 2, n.y - s.cardHeight / 2, s.cardWidth, s.cardHeight);
    const bool hovered  = st.hoveredId == n.id;
    const bool selected = st.selectedIds.contains(n.id);
    const bool hasKids  = m_ctrl->store().hasChildren(n.id);
    const double radius = std::min(app.cornerRadius, std::min(card.width(), card.height()) / 2);

    p.setBrush(selected ? app.accentSoft : app.nodeFill);
    QColor stroke = selected ? app.accent : (hovered ? app.activeLineColor : app.nodeStroke);
    if (app.strokeWidth > 0) p.setPen(QPen(stroke, app.strokeWidth * inv));
    else p.setPen(Qt::NoPen);
    p.drawRoundedRect(card, radius, radius);

    if (st.focusedId == n.id) {
        QPen focus(app.activeLineColor, 1.5 * inv, Qt::DashLine);
        p.setPen(focus);
        p.setBrush(Qt::NoBrush);
        p.drawRoundedRect(card, radius, radius);
    }

    // Title
    const double rightPad = hasKids ? kToggleSize + 10 : kTextPad;
    QRectF titleRect(card.left() + kTextPad, card.top() + kTextPad,
                     std::max(0.0, card.width() - kTextPad - rightPad), card.height() / 2);
    QFont f = font();
    f.setBold(true);
    p.setFont(f);
    p.setPen(app.titleColor);
    const QString label = p.fontMetrics().elidedText(fmt::elide(n.label, kMaxLabel),
                                                     Qt::ElideRight, int(titleRect.width()));
    p.drawText(titleRect, Qt::AlignHCenter | Qt::AlignTop, label);

    // Value line
    const QString valueText = fmt::value(n.value);
    if (!valueText.isEmpty()) {
        p.setFont(font());
        p.setPen(app.valueColor);
        QRectF valueRect(card.left(), card.top(), card.width(), card.height() - kTextPad);
        p.drawText(valueRect, Qt::AlignHCenter | Qt::AlignBottom, valueText);
    }

    // Sparkline bar
    double frac = 0;
    if (m_ctrl->sparkRange().fraction(n.sparkline, &frac)) {
        const double y = valueText.isEmpty() ? card.bottom() - 8 : card.bottom() - 14;
        const double len = (card.width() - 2 * kSparkPad) * frac;
        p.setPen(QPen(app.accent, 2 * inv));
        p.drawLine(QPointF(card.left() + kSparkPad, y), QPointF(card.left() + kSparkPad + len, y));
    }

    // Collapse toggle
    if (hasKids) {
        QRectF tr(card.right() - kToggleSize - kToggleInset, card.top() + kToggleInset,
                  kToggleSize, kToggleSize);
        p.setBrush(kToggleFill);
        p.setPen(QPen(kToggleStroke, inv));
        p.drawRoundedRect(tr, 3, 3);
        p.setPen(kToggleText);
        p.drawText(tr, Qt::AlignCenter,
                   st.collapsed.contains(n.id) ? QStringLiteral("+") : QString(QChar(0x2013)));
    }
}

void TreeCanvas::paintMessage(QPainter& p, const QString& text) {
    if (text.isEmpty()) return;
    p.setPen(kMessageText);
    p.setFont(font());
    p.drawText(rect().adjusted(24, 24, -24, -24), Qt::AlignCenter | Qt::TextWordWrap, text);
}

// ── Input ──

void TreeCanvas::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    m_ctrl->setViewport(QSizeF(size()));
}

void TreeCanvas::mousePressEvent(QMouseEvent* event) {
    setFocus();
    m_lastPos = eventPos(event);
    m_panning = event->button() == Qt::MiddleButton
        || (event->button() == Qt::LeftButton && (event->modifiers() & Qt::ShiftModifier));
    if (m_panning) setCursor(Qt::ClosedHandCursor);
}

void TreeCanvas::mouseMoveEvent(QMouseEvent* event) {
    const QPointF pos = eventPos(event);
    if (m_panning) {
        const QPointF d = pos - m_lastPos;
        m_lastPos = pos;
        m_ctrl->panBy(d.x(), d.y());
        return;
    }

    const Hit hit = m_ctrl->hitTest(pos);
    m_ctrl->setHoveredId(hit.nodeId);
    setCursor(hit.isValid() ? Qt::PointingHandCursor : Qt::ArrowCursor);

    QString tip;
    if (hit.isValid() && !hit.toggleHit) {
        const LayoutNode& n = m_ctrl->scene().graph.nodes[hit.nodeIdx];
        tip = n.tooltip.isValid() ? fmt::value(n.tooltip) : n.label;
    }
    setToolTip(tip);
}

void TreeCanvas::mouseReleaseEvent(QMouseEvent* event) {
    if (m_panning) {
        m_panning = false;
        unsetCursor();
        return;
    }
    if (event->button() == Qt::LeftButton)
        m_ctrl->handleClick(eventPos(event), event->modifiers());
}

void TreeCanvas::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton)
        m_ctrl->handleDoubleClick(eventPos(event));
}

void TreeCanvas::wheelEvent(QWheelEvent* event) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    const QPointF at = event->position();
#else
    const QPointF at = event->posF();
#endif
    m_ctrl->wheelZoom(at, event->angleDelta().y());
    event->accept();
}

void TreeCanvas::keyPressEvent(QKeyEvent* event) {
    if (!m_ctrl->handleKey(event->key()))
        QWidget::keyPressEvent(event);
}

void TreeCanvas::leaveEvent(QEvent* event) {
    m_ctrl->setHoveredId(QString());
    QWidget::leaveEvent(event);
}

} // namespace hfl
