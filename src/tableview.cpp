#include "tableview.h"
#include <QHeaderView>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QStyledItemDelegate>

namespace hfl {

static constexpr int kMarkerWidth = 14;

namespace {

// Indents the Fields column by depth and draws sparkline bars.
class TableDelegate : public QStyledItemDelegate {
public:
    TableDelegate(const HierController* ctrl, QObject* parent)
        : QStyledItemDelegate(parent), m_ctrl(ctrl) {}

    void paint(QPainter* p, const QStyleOptionViewItem& option,
               const QModelIndex& index) const override {
        if (index.column() == TableView::ColFields) {
            QStyleOptionViewItem opt(option);
            opt.rect.adjust(fmt::indentPx(index.data(TableView::DepthRole).toInt()), 0, 0, 0);
            p->fillRect(option.rect, index.data(Qt::BackgroundRole).value<QBrush>());
            QStyledItemDelegate::paint(p, opt, index);
            return;
        }
        if (index.column() == TableView::ColSparkline) {
            QStyledItemDelegate::paint(p, option, index);
            const QVariant frac = index.data(TableView::FractionRole);
            if (!frac.isValid()) return;
            const QRectF r = QRectF(option.rect).adjusted(8, 0, -8, 0);
            const double y = r.center().y();
            p->save();
            p->setRenderHint(QPainter::Antialiasing);
            p->setPen(QPen(m_ctrl->settings().appearance.accent, 2));
            p->drawLine(QPointF(r.left(), y), QPointF(r.left() + r.width() * frac.toDouble(), y));
            p->restore();
            return;
        }
        QStyledItemDelegate::paint(p, option, index);
    }

private:
    const HierController* m_ctrl;
};

} // anonymous namespace

TableView::TableView(HierController* ctrl, QWidget* parent)
    : QTableWidget(parent), m_ctrl(ctrl)
{
    setColumnCount(ColCount);
    setHorizontalHeaderLabels({tr("Fields"), tr("Value"), tr("Sparkline")});
    setEditTriggers(QAbstractItemView::NoEditTriggers);
    setSelectionMode(QAbstractItemView::NoSelection);
    setFocusPolicy(Qt::StrongFocus);
    setShowGrid(false);
    verticalHeader()->hide();
    horizontalHeader()->setSectionResizeMode(ColFields, QHeaderView::Stretch);
    setItemDelegate(new TableDelegate(m_ctrl, this));

    connect(m_ctrl, &HierController::sceneChanged,     this, &TableView::rebuild);
    connect(m_ctrl, &HierController::selectionChanged, this, [this]() { restyleRows(); });
    connect(m_ctrl, &HierController::focusChanged,     this, [this]() { restyleRows(); });
}

void TableView::applySettings() {
    const TableSettings& t = m_ctrl->settings().table;
    horizontalHeader()->setVisible(t.showHeader);
    verticalHeader()->setDefaultSectionSize(t.rowHeight);
}

void TableView::rebuild() {
    applySettings();
    const QVector<TableRow>& rows = m_ctrl->scene().table;
    const SparklineRange& spark = m_ctrl->sparkRange();

    setRowCount(0);
    setRowCount(rows.size());
    for (int i = 0; i < rows.size(); i++) {
        const TableRow& r = rows[i];

        QString marker = QStringLiteral("  ");
        if (r.hasChildren)
            marker = r.collapsed ? QStringLiteral("+ ") : QString(QChar(0x2013)) + QLatin1Char(' ');
        auto* name = new QTableWidgetItem(marker + r.label);
        name->setData(DepthRole, r.depth);
        name->setData(IdRole, r.id);
        name->setData(ParentRole, r.hasChildren);
        name->setToolTip(r.label);
        setItem(i, ColFields, name);

        auto* value = new QTableWidgetItem(fmt::value(r.value));
        value->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
        setItem(i, ColValue, value);

        auto* sparkItem = new QTableWidgetItem;
        double frac = 0;
        if (spark.fraction(r.sparkline, &frac)) sparkItem->setData(FractionRole, frac);
        setItem(i, ColSparkline, sparkItem);
    }
    restyleRows();
}

void TableView::restyleRows() {
    const AppearanceSettings& app = m_ctrl->settings().appearance;
    const ViewState& st = m_ctrl->state();
    const bool zebra = m_ctrl->settings().table.zebra;
    const QColor stripe = app.nodeStroke.lighter(108);

    for (int i = 0; i < rowCount(); i++) {
        QTableWidgetItem* head = item(i, ColFields);
        if (!head) continue;
        const QString id = head->data(IdRole).toString();

        QBrush bg;
        if (st.selectedIds.contains(id))  bg = app.accentSoft;
        else if (zebra && (i % 2) == 1)   bg = stripe;
        else                              bg = app.nodeFill;

        for (int c = 0; c < ColCount; c++) {
            if (QTableWidgetItem* it = item(i, c)) {
                it->setBackground(bg);
                it->setForeground(c == ColFields ? app.titleColor : app.valueColor);
            }
        }
        QFont f = font();
        f.setUnderline(st.focusedId == id);
        head->setFont(f);
        if (st.focusedId == id) scrollToItem(head);
    }
}

bool TableView::markerHit(int row, int x) const {
    QTableWidgetItem* head = item(row, ColFields);
    if (!head || !head->data(ParentRole).toBool()) return false;
    const QRect cell = visualItemRect(head);
    const int left = cell.left() + fmt::indentPx(head->data(DepthRole).toInt());
    return x >= left && x <= left + kMarkerWidth;
}

void TableView::mousePressEvent(QMouseEvent* event) {
    setFocus();
    const QPoint pos = event->pos();
    const QModelIndex idx = indexAt(pos);
    if (!idx.isValid()) {
        m_ctrl->clearSelection();
        return;
    }
    const QString id = item(idx.row(), ColFields)->data(IdRole).toString();
    if (idx.column() == ColFields && markerHit(idx.row(), pos.x()))
        m_ctrl->toggleCollapse(id);
    else
        m_ctrl->selectNode(id, event->modifiers());
}

void TableView::keyPressEvent(QKeyEvent* event) {
    if (!m_ctrl->handleKey(event->key()))
        QTableWidget::keyPressEvent(event);
}

} // namespace hfl
