#include "settings.h"
#include <QDebug>
#include <QtMath>

namespace hfl {

namespace {

// ── Field metadata (serialization) ──

struct NumberField  { const char* key; double LayoutSettings::*ptr; };
struct ToggleField  { const char* key; bool ControlSettings::*ptr; };
struct ColorField   { const char* key; QColor AppearanceSettings::*ptr; };

constexpr double kMinRowHeight = 12;
constexpr double kMaxRowHeight = 400;

const NumberField kLayoutFields[] = {
    {"levelSpacing",   &LayoutSettings::levelSpacing},
    {"siblingSpacing", &LayoutSettings::siblingSpacing},
    {"cardWidth",      &LayoutSettings::cardWidth},
    {"cardHeight",     &LayoutSettings::cardHeight},
};

const ToggleField kControlFields[] = {
    {"showControls",        &ControlSettings::showControls},
    {"showSearch",          &ControlSettings::showSearch},
    {"showHierarchyFilter", &ControlSettings::showHierarchyFilter},
    {"showParentFilter",    &ControlSettings::showParentFilter},
    {"showDropdownFilter",  &ControlSettings::showDropdownFilter},
    {"showZoom",            &ControlSettings::showZoom},
    {"showViewToggle",      &ControlSettings::showViewToggle},
    {"showCollapseExpand",  &ControlSettings::showCollapseExpand},
};

const ColorField kColorFields[] = {
    {"backgroundColor", &AppearanceSettings::background},
    {"lineColor",       &AppearanceSettings::lineColor},
    {"activeLineColor", &AppearanceSettings::activeLineColor},
    {"fillColor",       &AppearanceSettings::nodeFill},
    {"strokeColor",     &AppearanceSettings::nodeStroke},
    {"titleColor",      &AppearanceSettings::titleColor},
    {"valueColor",      &AppearanceSettings::valueColor},
    {"accentColor",     &AppearanceSettings::accent},
};

double toNumber(const QJsonValue& v, double fallback, const char* key) {
    if (v.isUndefined()) return fallback;
    if (v.isDouble() && qIsFinite(v.toDouble())) return v.toDouble();
    if (v.isString()) {
        bool ok = false;
        double d = v.toString().toDouble(&ok);
        if (ok && qIsFinite(d)) return d;
    }
    qWarning() << "Settings: ignoring non-numeric value for" << key;
    return fallback;
}

bool toBool(const QJsonValue& v, bool fallback) {
    return v.isBool() ? v.toBool() : fallback;
}

QColor toColor(const QJsonValue& v, const QColor& fallback, const char* key) {
    if (v.isUndefined() || v.isNull()) return fallback;
    QColor c(v.toString());
    if (!c.isValid()) {
        qWarning() << "Settings: invalid color for" << key << v.toString();
        return fallback;
    }
    return c;
}

} // anonymous namespace

QString orientationToString(Orientation o) {
    return o == Orientation::LeftRight ? QStringLiteral("LR") : QStringLiteral("TD");
}

QString viewModeToString(ViewMode m) {
    return m == ViewMode::Table ? QStringLiteral("table") : QStringLiteral("tree");
}

QJsonObject Settings::toJson() const {
    QJsonObject lay;
    lay["orientation"] = orientationToString(layout.orientation);
    for (const auto& f : kLayoutFields)
        lay[f.key] = layout.*f.ptr;

    QJsonObject app;
    app["useBackground"] = appearance.useBackground;
    app["lineWidth"]     = appearance.lineWidth;
    app["strokeWidth"]   = appearance.strokeWidth;
    app["cornerRadius"]  = appearance.cornerRadius;
    for (const auto& f : kColorFields)
        app[f.key] = (appearance.*f.ptr).name();

    QJsonObject ctl;
    for (const auto& f : kControlFields)
        ctl[f.key] = controls.*f.ptr;
    ctl["defaultView"] = viewModeToString(controls.defaultView);
    ctl["doubleClickZoomPercent"] = controls.doubleClickZoomPercent;

    QJsonObject tbl;
    tbl["showHeader"] = table.showHeader;
    tbl["rowHeight"]  = table.rowHeight;
    tbl["zebra"]      = table.zebra;

    QJsonObject o;
    o["layout"]     = lay;
    o["appearance"] = app;
    o["controls"]   = ctl;
    o["table"]      = tbl;
    return o;
}

Settings Settings::fromJson(const QJsonObject& o) {
    Settings s;

    const QJsonObject lay = o["layout"].toObject();
    const QString orient = lay["orientation"].toString();
    if (orient == QLatin1String("LR"))      s.layout.orientation = Orientation::LeftRight;
    else if (orient == QLatin1String("TD")) s.layout.orientation = Orientation::TopDown;
    for (const auto& f : kLayoutFields)
        s.layout.*f.ptr = toNumber(lay[f.key], s.layout.*f.ptr, f.key);

    const QJsonObject app = o["appearance"].toObject();
    s.appearance.useBackground = toBool(app["useBackground"], s.appearance.useBackground);
    s.appearance.lineWidth     = toNumber(app["lineWidth"], s.appearance.lineWidth, "lineWidth");
    s.appearance.strokeWidth   = toNumber(app["strokeWidth"], s.appearance.strokeWidth, "strokeWidth");
    s.appearance.cornerRadius  = toNumber(app["cornerRadius"], s.appearance.cornerRadius, "cornerRadius");
    for (const auto& f : kColorFields)
        s.appearance.*f.ptr = toColor(app[f.key], s.appearance.*f.ptr, f.key);

    const QJsonObject ctl = o["controls"].toObject();
    for (const auto& f : kControlFields)
        s.controls.*f.ptr = toBool(ctl[f.key], s.controls.*f.ptr);
    const QString view = ctl["defaultView"].toString();
    if (view == QLatin1String("table"))     s.controls.defaultView = ViewMode::Table;
    else if (view == QLatin1String("tree")) s.controls.defaultView = ViewMode::Tree;
    s.controls.doubleClickZoomPercent = toNumber(ctl["doubleClickZoomPercent"],
                                                 s.controls.doubleClickZoomPercent,
                                                 "doubleClickZoomPercent");

    const QJsonObject tbl = o["table"].toObject();
    s.table.showHeader = toBool(tbl["showHeader"], s.table.showHeader);
    s.table.rowHeight  = qRound(qBound(kMinRowHeight,
                                       toNumber(tbl["rowHeight"], s.table.rowHeight, "rowHeight"),
                                       kMaxRowHeight));
    s.table.zebra      = toBool(tbl["zebra"], s.table.zebra);
    return s;
}

} // namespace hfl
