#pragma once
#include "core.h"
#include <QColor>
#include <QJsonObject>

namespace hfl {

struct ControlSettings {
    bool     showControls           = true;
    bool     showSearch             = true;
    bool     showHierarchyFilter    = true;
    bool     showParentFilter       = true;
    bool     showDropdownFilter     = true;
    bool     showZoom               = true;
    bool     showViewToggle         = true;
    bool     showCollapseExpand     = true;
    ViewMode defaultView            = ViewMode::Tree;
    double   doubleClickZoomPercent = 130;
};

struct TableSettings {
    bool showHeader = true;
    int  rowHeight  = 28;
    bool zebra      = true;
};

struct AppearanceSettings {
    bool   useBackground   = true;
    QColor background      {0xff, 0xff, 0xff};
    QColor lineColor       {0xf3, 0xb2, 0x7a};
    QColor activeLineColor {0xf0, 0x8b, 0x2e};
    double lineWidth       = 1;
    QColor nodeFill        {0xff, 0xff, 0xff};
    QColor nodeStroke      {0xe5, 0xe7, 0xeb};
    double strokeWidth     = 1;
    double cornerRadius    = 6;
    QColor titleColor      {0x11, 0x18, 0x27};
    QColor valueColor      {0x6b, 0x72, 0x80};
    QColor accent          {0xf0, 0x8b, 0x2e};
    QColor accentSoft      {0xff, 0xf4, 0xe6};
};

// Read-only per recomputation; built by the host from a JSON object where
// every missing or ill-typed key keeps its default.
struct Settings {
    LayoutSettings     layout;
    AppearanceSettings appearance;
    ControlSettings    controls;
    TableSettings      table;

    QJsonObject toJson() const;
    static Settings fromJson(const QJsonObject& o);
};

QString orientationToString(Orientation o);
QString viewModeToString(ViewMode m);

} // namespace hfl
