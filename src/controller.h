#pragma once
#include "core.h"
#include "settings.h"
#include <QObject>
#include <QVariantList>

namespace hfl {

// ── Controller ──
//
// Owns the row store, settings and view state, reruns the pipeline after
// every mutation and tells the widgets what changed. All pointer positions
// are in viewport (screen) coordinates.

class HierController : public QObject {
    Q_OBJECT
public:
    explicit HierController(QObject* parent = nullptr);

    // Host input
    IngestResult setRows(const QVector<Row>& rows, bool filterApplied = false);
    void setSettings(const Settings& s);
    void setViewport(const QSizeF& size);

    // Filters
    void setSearchQuery(const QString& query);
    void setHierarchyFilter(const QString& nodeId);
    void setParentFilter(const QString& parentId);
    void setDropdownFilter(const QString& tag);
    void clearFilters();

    // Collapse
    void toggleCollapse(const QString& nodeId);
    void collapseAll();
    void expandAll();

    // Transform (tree mode only)
    void panBy(double dx, double dy);
    void zoomBy(double factor);
    void zoomTo(double percent);
    void zoomIn();
    void zoomOut();
    void wheelZoom(const QPointF& at, int delta);
    bool commitZoomText(const QString& text);
    void fitToViewport();

    // Pointer and keyboard
    Hit  hitTest(const QPointF& screen) const;
    void handleClick(const QPointF& screen, Qt::KeyboardModifiers mods);
    void handleDoubleClick(const QPointF& screen);
    void setHoveredId(const QString& nodeId);
    bool handleKey(int key);
    void selectNode(const QString& nodeId, Qt::KeyboardModifiers mods);
    void clearSelection();

    // View mode
    void setViewMode(ViewMode mode);
    ViewMode viewMode() const { return m_state.mode; }

    const Scene&          scene() const { return m_scene; }
    const ViewState&      state() const { return m_state; }
    const Settings&       settings() const { return m_settings; }
    const RowStore&       store() const { return m_store; }
    const FilterOptions&  filterOptions() const { return m_options; }
    const SparklineRange& sparkRange() const { return m_spark; }
    const ViewTransform&  transform() const { return m_state.transform; }
    QSizeF                viewport() const { return m_viewport; }

    QStringList  focusOrder() const;
    QVariantList selectedIdentities() const;

signals:
    void sceneChanged();
    void transformChanged();
    void filtersChanged();
    void selectionChanged(const QVariantList& identities);
    void focusChanged(const QString& nodeId);
    void hoverChanged(const QString& nodeId);
    void viewModeChanged(hfl::ViewMode mode);

private:
    RowStore       m_store;
    Settings       m_settings;
    ViewState      m_state;
    Scene          m_scene;
    FilterOptions  m_options;
    SparklineRange m_spark;
    QSizeF         m_viewport;
    bool           m_userSetView = false;

    void refresh(bool refit);
    void setFilters(const FilterState& f);
    void applyControlVisibility();
    void ensureFocus();
    void setFocus(const QString& nodeId);
    void setTransform(const ViewTransform& t);
    QPointF viewportCenter() const;
    bool treeInteractive() const;
};

} // namespace hfl

Q_DECLARE_METATYPE(hfl::ViewMode)
