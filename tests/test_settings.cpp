#include <QtTest/QTest>
#include <QJsonDocument>
#include "settings.h"

using namespace hfl;

class TestSettings : public QObject {
    Q_OBJECT
private slots:
    void defaults() {
        Settings s;
        QVERIFY(s.layout.orientation == Orientation::TopDown);
        QCOMPARE(s.layout.levelSpacing, 70.0);
        QCOMPARE(s.layout.siblingSpacing, 18.0);
        QCOMPARE(s.layout.cardWidth, 120.0);
        QCOMPARE(s.layout.cardHeight, 40.0);
        QVERIFY(s.controls.showControls);
        QVERIFY(s.controls.defaultView == ViewMode::Tree);
        QCOMPARE(s.controls.doubleClickZoomPercent, 130.0);
        QVERIFY(s.table.showHeader);
        QCOMPARE(s.table.rowHeight, 28);
    }

    void fromJson_emptyKeepsDefaults() {
        Settings s = Settings::fromJson(QJsonObject());
        QCOMPARE(s.layout.cardWidth, 120.0);
        QCOMPARE(s.appearance.lineColor, QColor(0xf3, 0xb2, 0x7a));
    }

    void fromJson_partial() {
        QJsonObject o = QJsonDocument::fromJson(R"({
            "layout":   {"orientation": "LR", "cardWidth": 150, "levelSpacing": "90"},
            "controls": {"showSearch": false, "defaultView": "table",
                         "doubleClickZoomPercent": 200},
            "appearance": {"lineColor": "#112233"},
            "table": {"zebra": false, "rowHeight": 32.4}
        })").object();
        Settings s = Settings::fromJson(o);
        QVERIFY(s.layout.orientation == Orientation::LeftRight);
        QCOMPARE(s.layout.cardWidth, 150.0);
        QCOMPARE(s.layout.levelSpacing, 90.0);
        QCOMPARE(s.layout.cardHeight, 40.0);
        QVERIFY(!s.controls.showSearch);
        QVERIFY(s.controls.showParentFilter);
        QVERIFY(s.controls.defaultView == ViewMode::Table);
        QCOMPARE(s.controls.doubleClickZoomPercent, 200.0);
        QCOMPARE(s.appearance.lineColor, QColor(0x11, 0x22, 0x33));
        QVERIFY(!s.table.zebra);
        QCOMPARE(s.table.rowHeight, 32);
        QCOMPARE(s.layout.footprint(), QSizeF(168, 130));
    }

    void fromJson_illTypedFallsBack() {
        QJsonObject o = QJsonDocument::fromJson(R"({
            "layout":   {"orientation": "diagonal", "cardWidth": "wide", "cardHeight": true},
            "controls": {"showZoom": "no", "defaultView": "grid"},
            "appearance": {"titleColor": "not-a-color"}
        })").object();
        Settings s = Settings::fromJson(o);
        QVERIFY(s.layout.orientation == Orientation::TopDown);
        QCOMPARE(s.layout.cardWidth, 120.0);
        QCOMPARE(s.layout.cardHeight, 40.0);
        QVERIFY(s.controls.showZoom);
        QVERIFY(s.controls.defaultView == ViewMode::Tree);
        QCOMPARE(s.appearance.titleColor, QColor(0x11, 0x18, 0x27));
    }

    void fromJson_rowHeightClamped() {
        QJsonObject o = QJsonDocument::fromJson(R"({"table": {"rowHeight": 1e300}})").object();
        QCOMPARE(Settings::fromJson(o).table.rowHeight, 400);
        o = QJsonDocument::fromJson(R"({"table": {"rowHeight": -5}})").object();
        QCOMPARE(Settings::fromJson(o).table.rowHeight, 12);
        o = QJsonDocument::fromJson(R"({"table": {"rowHeight": 31.6}})").object();
        QCOMPARE(Settings::fromJson(o).table.rowHeight, 32);
    }

    void toJson_roundTrip() {
        Settings s;
        s.layout.orientation = Orientation::LeftRight;
        s.layout.siblingSpacing = 30;
        s.controls.showDropdownFilter = false;
        s.controls.defaultView = ViewMode::Table;
        s.appearance.accent = QColor("#00ff00");
        s.table.rowHeight = 40;

        Settings back = Settings::fromJson(s.toJson());
        QVERIFY(back.layout.orientation == Orientation::LeftRight);
        QCOMPARE(back.layout.siblingSpacing, 30.0);
        QVERIFY(!back.controls.showDropdownFilter);
        QVERIFY(back.controls.defaultView == ViewMode::Table);
        QCOMPARE(back.appearance.accent, QColor("#00ff00"));
        QCOMPARE(back.table.rowHeight, 40);
    }

    void enumStrings() {
        QCOMPARE(orientationToString(Orientation::LeftRight), QString("LR"));
        QCOMPARE(orientationToString(Orientation::TopDown), QString("TD"));
        QCOMPARE(viewModeToString(ViewMode::Table), QString("table"));
    }
};

QTEST_GUILESS_MAIN(TestSettings)
#include "test_settings.moc"
