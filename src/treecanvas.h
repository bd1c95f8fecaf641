#pragma once
#include "controller.h"
#include <QWidget>

namespace hfl {

// Paints the laid-out tree with the controller's transform and forwards
// pointer, wheel and key input back to it.
class TreeCanvas : public QWidget {
    Q_OBJECT
public:
    explicit TreeCanvas(HierController* ctrl, QWidget* parent = nullptr);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    HierController* m_ctrl;
    bool            m_panning = false;
    QPointF         m_lastPos;

    void paintLinks(QPainter& p);
    void paintCard(QPainter& p, const LayoutNode& n);
    void paintMessage(QPainter& p, const QString& text);
};

} // namespace hfl
