#pragma once
#include "controller.h"
#include <QTableWidget>

namespace hfl {

// Indented Fields / Value / Sparkline listing of the visible nodes.
class TableView : public QTableWidget {
    Q_OBJECT
public:
    enum Column { ColFields = 0, ColValue, ColSparkline, ColCount };
    enum Role { DepthRole = Qt::UserRole + 1, IdRole, ParentRole, FractionRole };

    explicit TableView(HierController* ctrl, QWidget* parent = nullptr);

    void rebuild();

    // True when x (viewport coordinates) falls on the collapse marker of row
    bool markerHit(int row, int x) const;

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    HierController* m_ctrl;

    void applySettings();
    void restyleRows();
};

} // namespace hfl
