#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QSet>
#include <QVariant>
#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include <QJsonObject>
#include <QJsonArray>
#include <QMetaType>
#include <QLocale>
#include <cstdint>

namespace hfl {

// ── Row ──

struct Row {
    QString  id;
    QString  parentId;      // empty = root candidate
    QString  label;
    QVariant value;         // number or string, invalid = none
    QVariant sparkline;
    QVariant tooltip;
    QString  dropdownTag;   // empty = no tag
    QVariant identity;      // opaque host token, only handed back on selection

    bool hasParent() const { return !parentId.isEmpty(); }

    QJsonObject toJson() const;
    static Row fromJson(const QJsonObject& o);
};

// parent id → ordered child ids, inverse of Row::parentId
using ChildrenIndex = QHash<QString, QVector<QString>>;

inline bool isNumeric(const QVariant& v) {
    switch (static_cast<QMetaType::Type>(v.userType())) {
    case QMetaType::Int:      case QMetaType::UInt:
    case QMetaType::LongLong: case QMetaType::ULongLong:
    case QMetaType::Float:    case QMetaType::Double:
        return true;
    default:
        return false;
    }
}

// ── RowStore ──
//
// Holds the full (cached) row set and the working row set the filter pipeline
// runs on. The two differ only after a drill refresh, where the host delivered
// a strict subset of the cached ids and the working set is expanded back out.

struct IngestResult {
    bool reusedCache = false;
    int  incoming    = 0;
    int  working     = 0;
};

struct RowStore {
    QVector<Row>   fullRows;
    ChildrenIndex  fullIndex;
    QVector<Row>   rows;        // working set
    ChildrenIndex  index;       // always the full index once cached

    IngestResult ingest(const QVector<Row>& incoming, bool filterApplied = false);
    void clear();

    bool isEmpty() const { return rows.isEmpty(); }
    bool hasChildren(const QString& id) const {
        auto it = index.constFind(id);
        return it != index.constEnd() && !it.value().isEmpty();
    }
    bool canReuseCache(const QVector<Row>& incoming, bool filterApplied) const;
};

ChildrenIndex buildChildrenIndex(const QVector<Row>& rows);
QVector<Row>  normalizeRows(const QVector<Row>& raw);

// ── Row files ──
//
// Either a bare array of row objects or {"rows": [...], "filtered": bool}.

struct RowFileResult {
    bool         ok       = false;
    QVector<Row> rows;              // normalised
    bool         filtered = false;  // host-side filtered refresh
    QString      error;
};

RowFileResult parseRows(const QByteArray& json);
RowFileResult loadRowsFile(const QString& path);

// ── Filter state ──

struct FilterState {
    QString searchQuery;        // trimmed; empty = inactive
    QString hierarchyFilter;    // node id
    QString parentFilter;       // parent id
    QString dropdownFilter;     // tag value

    bool isActive() const {
        return !searchQuery.isEmpty() || !hierarchyFilter.isEmpty()
            || !parentFilter.isEmpty() || !dropdownFilter.isEmpty();
    }
    bool operator==(const FilterState& o) const {
        return searchQuery == o.searchQuery && hierarchyFilter == o.hierarchyFilter
            && parentFilter == o.parentFilter && dropdownFilter == o.dropdownFilter;
    }
    bool operator!=(const FilterState& o) const { return !(*this == o); }
};

struct FilterOptions {
    QStringList ids;
    QStringList parentIds;
    QStringList tags;

    bool hasTags() const { return !tags.isEmpty(); }
};

// ── Layout settings ──

enum class Orientation : uint8_t { TopDown, LeftRight };

struct LayoutSettings {
    Orientation orientation    = Orientation::TopDown;
    double      levelSpacing   = 70;
    double      siblingSpacing = 18;
    double      cardWidth      = 120;
    double      cardHeight     = 40;

    QSizeF footprint() const {
        return QSizeF(cardWidth + siblingSpacing, cardHeight + levelSpacing);
    }
};

// ── Hierarchy ──
//
// Arena of visible rows plus one optional synthetic root. Entries address
// rows by index into the visible row vector; the synthetic entry has
// row == -1 and never carries an id.

enum class StructuralError : uint8_t {
    None, DuplicateId, MissingParent, Cycle
};

const char* structuralErrorName(StructuralError e);

struct HierarchyEntry {
    int          row       = -1;
    int          parent    = -1;
    QVector<int> children;
    int          depth     = 0;     // 0 = real root
    bool         synthetic = false;
};

struct Hierarchy {
    QVector<HierarchyEntry> entries;
    int                     root = -1;

    bool hasSyntheticRoot() const {
        return root >= 0 && entries[root].synthetic;
    }
};

struct HierarchyResult {
    bool            ok    = false;
    StructuralError error = StructuralError::None;
    QString         reason;
    QString         offendingId;
    Hierarchy       tree;
};

// ── Layout output ──

struct LayoutNode {
    QString  id;
    QString  parentId;      // visible parent, empty for roots
    QString  label;
    QVariant value;
    QVariant sparkline;
    QVariant tooltip;
    QVariant identity;
    double   x     = 0;
    double   y     = 0;
    int      depth = 0;

    QPointF pos() const { return QPointF(x, y); }
};

struct Link {
    int source = -1;        // index into LayoutGraph::nodes
    int target = -1;
};

struct LayoutGraph {
    QVector<LayoutNode>            nodes;      // draw order (pre-order)
    QVector<Link>                  links;
    QHash<QString, int>            indexOf;
    QHash<QString, QVector<QString>> children; // visible adjacency

    bool isEmpty() const { return nodes.isEmpty(); }
    const LayoutNode* find(const QString& id) const {
        int i = indexOf.value(id, -1);
        return i >= 0 ? &nodes[i] : nullptr;
    }
};

struct TableRow {
    QString  id;
    QString  label;
    QVariant value;
    QVariant sparkline;
    int      depth       = 0;
    bool     hasChildren = false;
    bool     collapsed   = false;
};

// ── View transform ──

inline constexpr double kMinScale      = 0.2;
inline constexpr double kMaxScale      = 4.0;
inline constexpr double kMaxFitScale   = 2.0;
inline constexpr double kFitPadding    = 24.0;
inline constexpr double kWheelZoomIn   = 1.1;
inline constexpr double kWheelZoomOut  = 0.9;
inline constexpr double kToggleSize    = 14.0;
inline constexpr double kToggleInset   = 6.0;

struct ViewTransform {
    double tx    = 20;
    double ty    = 20;
    double scale = 1;

    QPointF toScreen(const QPointF& p) const {
        return QPointF(p.x() * scale + tx, p.y() * scale + ty);
    }
    QPointF toLayout(const QPointF& s) const {
        return QPointF((s.x() - tx) / scale, (s.y() - ty) / scale);
    }
    int zoomPercent() const;
    QString zoomLabel() const;
};

// ── Hit testing ──

struct ToggleRect {
    QString id;
    QRectF  rect;
};

struct HitMap {
    QVector<QRectF>     nodeRects;    // parallel to LayoutGraph::nodes
    QVector<ToggleRect> toggleRects;
};

struct Hit {
    int     nodeIdx   = -1;
    QString nodeId;
    QPointF layoutPos;
    QPointF local;
    bool    toggleHit = false;

    bool isValid() const { return nodeIdx >= 0; }
};

// ── ViewState ──

enum class ViewMode : uint8_t { Tree, Table };

struct ViewState {
    FilterState    filters;
    QSet<QString>  collapsed;
    ViewTransform  transform;
    QString        focusedId;
    QSet<QString>  selectedIds;
    QString        hoveredId;
    ViewMode       mode = ViewMode::Tree;
};

// ── Scene (output of one recomputation) ──

enum class Outcome : uint8_t {
    Success,            // at least one visible node
    EmptyResult,        // rows exist but nothing visible
    MissingInput,       // no rows at all
    StructuralError     // duplicate id, cycle or dangling parent
};

struct Scene {
    Outcome             outcome = Outcome::MissingInput;
    bool                noMatches = false;  // EmptyResult while a filter is active
    StructuralError     error   = StructuralError::None;
    QString             message;
    LayoutGraph         graph;
    QVector<TableRow>   table;
    HitMap              hits;

    bool hasNodes() const { return outcome == Outcome::Success; }
};

// ── Pipeline stages ──

namespace filter {
    QVector<Row> byHierarchy(const QVector<Row>& rows, const ChildrenIndex& index,
                             const QString& nodeId);
    QVector<Row> byParent(const QVector<Row>& rows, const ChildrenIndex& index,
                          const QString& parentId);
    QVector<Row> byTag(const QVector<Row>& rows, const ChildrenIndex& index,
                       const QString& value);
    QVector<Row> bySearch(const QVector<Row>& rows, const ChildrenIndex& index,
                          const QString& query);
    QVector<Row> apply(const QVector<Row>& rows, const ChildrenIndex& index,
                       const FilterState& state);
    FilterOptions options(const QVector<Row>& rows);
    FilterState reconcile(const FilterState& state, const FilterOptions& opts);
} // namespace filter

QVector<Row> computeVisibleRows(const QVector<Row>& filtered, const ChildrenIndex& index,
                                const QSet<QString>& collapsed);

HierarchyResult buildHierarchy(const QVector<Row>& visible);

LayoutGraph layoutTree(const Hierarchy& tree, const QVector<Row>& rows,
                       const LayoutSettings& s);

namespace view {
    ViewTransform fit(const ViewTransform& t, const LayoutGraph& graph,
                      const LayoutSettings& s, const QSizeF& viewport);
    ViewTransform panBy(const ViewTransform& t, double dx, double dy);
    ViewTransform zoomAt(const ViewTransform& t, double newScale, const QPointF& anchor);
    ViewTransform zoomBy(const ViewTransform& t, double factor, const QPointF& anchor);
    ViewTransform zoomToPercent(const ViewTransform& t, double percent, const QPointF& anchor);
    ViewTransform zoomToNode(const ViewTransform& t, const QPointF& nodePos,
                             double percent, const QSizeF& viewport);
    ViewTransform keepStationary(const ViewTransform& t, const QPointF& screenPoint,
                                 const QPointF& layoutPoint);
    bool parsePercent(const QString& text, double* percent);
} // namespace view

// ── Recomputation entry point ──
//
// Never fails by exception: every snapshot ends in exactly one Outcome.
Scene recompute(const RowStore& store, const ViewState& state, const LayoutSettings& s);

HitMap buildHitMap(const LayoutGraph& graph, const LayoutSettings& s,
                   const ChildrenIndex& index);
Hit hitTest(const HitMap& map, const LayoutGraph& graph,
            const ViewTransform& t, const QPointF& screen);

// ── Sparkline range ──

struct SparklineRange {
    bool   valid = false;
    double min   = 0;
    double max   = 0;

    // Bar fill in [0,1]; false when the value is not numeric or no range exists
    bool fraction(const QVariant& v, double* out) const;
};

SparklineRange sparklineRange(const QVector<Row>& rows);

// ── Format functions ──

namespace fmt {
    QString value(const QVariant& v, const QLocale& locale = QLocale());
    QString elide(const QString& text, int maxChars);
    int     indentPx(int depth);    // table label indent
} // namespace fmt

} // namespace hfl
