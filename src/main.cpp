#include "mainwindow.h"
#include "settings.h"
#include "tableview.h"
#include "treecanvas.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMenuBar>
#include <QMessageBox>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QDebug>

namespace hfl {

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle("HierFlow");
    resize(1200, 800);

    m_ctrl = new HierController(this);

    m_stack  = new QStackedWidget(this);
    m_canvas = new TreeCanvas(m_ctrl, m_stack);
    m_table  = new TableView(m_ctrl, m_stack);
    m_stack->addWidget(m_canvas);
    m_stack->addWidget(m_table);
    setCentralWidget(m_stack);

    createMenus();
    createToolBar();
    createStatusBar();

    connect(m_ctrl, &HierController::sceneChanged, this, [this]() {
        syncFilterOptions();
        updateStatus();
    });
    connect(m_ctrl, &HierController::filtersChanged, this, &MainWindow::syncFilterOptions);
    connect(m_ctrl, &HierController::transformChanged, this, &MainWindow::syncZoomField);
    connect(m_ctrl, &HierController::viewModeChanged, this, &MainWindow::syncViewMode);
    connect(m_ctrl, &HierController::selectionChanged, this,
            [this](const QVariantList&) { updateStatus(); });

    applyControlSettings();
    syncViewMode();
    syncZoomField();
    updateStatus();
}

// ── Menus and toolbar ──

void MainWindow::createMenus() {
    auto* file = menuBar()->addMenu("&File");
    file->addAction("&Open Rows...", this, &MainWindow::openFile)->setShortcut(QKeySequence::Open);
    file->addAction("Open &Settings...", this, &MainWindow::openSettingsFile);
    file->addAction("&Reload", this, &MainWindow::reloadFile)->setShortcut(QKeySequence::Refresh);
    file->addSeparator();
    file->addAction("E&xit", this, &QWidget::close)->setShortcut(QKeySequence::Quit);

    auto* help = menuBar()->addMenu("&Help");
    help->addAction("&About HierFlow", this, &MainWindow::about);
}

void MainWindow::createToolBar() {
    m_toolBar = addToolBar("Controls");
    m_toolBar->setMovable(false);

    m_search = new QLineEdit(m_toolBar);
    m_search->setPlaceholderText("Search");
    m_search->setClearButtonEnabled(true);
    m_search->setMaximumWidth(220);
    connect(m_search, &QLineEdit::textChanged, m_ctrl, &HierController::setSearchQuery);
    m_searchAct = m_toolBar->addWidget(m_search);

    auto makeCombo = [this](QAction** act, void (HierController::*setter)(const QString&)) {
        auto* combo = new QComboBox(m_toolBar);
        combo->setSizeAdjustPolicy(QComboBox::AdjustToContents);
        connect(combo, qOverload<int>(&QComboBox::currentIndexChanged), this,
                [this, combo, setter](int) {
            (m_ctrl->*setter)(combo->currentData().toString());
        });
        *act = m_toolBar->addWidget(combo);
        return combo;
    };
    m_hierarchyCombo = makeCombo(&m_hierarchyAct, &HierController::setHierarchyFilter);
    m_parentCombo    = makeCombo(&m_parentAct,    &HierController::setParentFilter);
    m_dropdownCombo  = makeCombo(&m_dropdownAct,  &HierController::setDropdownFilter);

    m_toolBar->addSeparator();
    m_zoomOutAct = m_toolBar->addAction(QString(QChar(0x2212)), m_ctrl, &HierController::zoomOut);
    m_zoomOutAct->setToolTip("Zoom out");
    m_zoomField = new QLineEdit(m_toolBar);
    m_zoomField->setFixedWidth(56);
    m_zoomField->setAlignment(Qt::AlignCenter);
    connect(m_zoomField, &QLineEdit::editingFinished, this, [this]() {
        m_ctrl->commitZoomText(m_zoomField->text());
    });
    m_zoomFieldAct = m_toolBar->addWidget(m_zoomField);
    m_zoomInAct = m_toolBar->addAction("+", m_ctrl, &HierController::zoomIn);
    m_zoomInAct->setToolTip("Zoom in");
    m_fitAct = m_toolBar->addAction("Fit", m_ctrl, &HierController::fitToViewport);

    m_toolBar->addSeparator();
    m_viewAct = m_toolBar->addAction("Table", this, [this]() {
        m_ctrl->setViewMode(m_ctrl->viewMode() == ViewMode::Tree ? ViewMode::Table
                                                                 : ViewMode::Tree);
    });
    m_collapseAct = m_toolBar->addAction("Collapse all", m_ctrl, &HierController::collapseAll);
    m_expandAct   = m_toolBar->addAction("Expand all",   m_ctrl, &HierController::expandAll);
}

void MainWindow::createStatusBar() {
    m_statusLabel = new QLabel("Ready", this);
    statusBar()->addWidget(m_statusLabel, 1);
}

// ── Sync from controller ──

void MainWindow::applyControlSettings() {
    const ControlSettings& c = m_ctrl->settings().controls;
    const bool on = c.showControls;
    m_toolBar->setVisible(on);
    m_searchAct->setVisible(on && c.showSearch);
    m_hierarchyAct->setVisible(on && c.showHierarchyFilter);
    m_parentAct->setVisible(on && c.showParentFilter);
    m_dropdownAct->setVisible(on && c.showDropdownFilter && m_ctrl->filterOptions().hasTags());
    const bool zoom = on && c.showZoom && m_ctrl->viewMode() == ViewMode::Tree;
    m_zoomOutAct->setVisible(zoom);
    m_zoomFieldAct->setVisible(zoom);
    m_zoomInAct->setVisible(zoom);
    m_fitAct->setVisible(zoom);
    m_viewAct->setVisible(on && c.showViewToggle);
    m_collapseAct->setVisible(on && c.showCollapseExpand);
    m_expandAct->setVisible(on && c.showCollapseExpand);
}

void MainWindow::fillCombo(QComboBox* combo, const QString& noneText,
                           const QStringList& items, const QString& current) {
    QSignalBlocker block(combo);
    combo->clear();
    combo->addItem(noneText, QString());
    for (const QString& s : items)
        combo->addItem(s, s);
    int idx = combo->findData(current);
    combo->setCurrentIndex(idx < 0 ? 0 : idx);
}

void MainWindow::syncFilterOptions() {
    const FilterOptions& o = m_ctrl->filterOptions();
    const FilterState& f = m_ctrl->state().filters;
    fillCombo(m_hierarchyCombo, "All nodes",   o.ids,       f.hierarchyFilter);
    fillCombo(m_parentCombo,    "All parents", o.parentIds, f.parentFilter);
    fillCombo(m_dropdownCombo,  "All tags",    o.tags,      f.dropdownFilter);
    if (m_search->text().trimmed() != f.searchQuery) {
        QSignalBlocker block(m_search);
        m_search->setText(f.searchQuery);
    }
    applyControlSettings();
}

void MainWindow::syncZoomField() {
    m_zoomField->setText(m_ctrl->transform().zoomLabel());
}

void MainWindow::syncViewMode() {
    const bool tree = m_ctrl->viewMode() == ViewMode::Tree;
    m_stack->setCurrentWidget(tree ? static_cast<QWidget*>(m_canvas) : m_table);
    m_viewAct->setText(tree ? "Table" : "Tree");
    m_stack->currentWidget()->setFocus();
    applyControlSettings();
}

void MainWindow::updateStatus() {
    const Scene& s = m_ctrl->scene();
    QString text;
    switch (s.outcome) {
    case Outcome::MissingInput:    text = "No rows loaded"; break;
    case Outcome::EmptyResult:     text = s.noMatches ? s.message : QStringLiteral("Nothing visible"); break;
    case Outcome::StructuralError: text = s.message; break;
    case Outcome::Success:
        text = QStringLiteral("%1 of %2 nodes visible, %3 selected")
                   .arg(s.graph.nodes.size())
                   .arg(m_ctrl->store().rows.size())
                   .arg(m_ctrl->state().selectedIds.size());
        break;
    }
    m_statusLabel->setText(text);
}

// ── File actions ──

bool MainWindow::openRows(const QString& path) {
    RowFileResult res = loadRowsFile(path);
    if (!res.ok) {
        QMessageBox::warning(this, "HierFlow", QStringLiteral("Could not load rows:\n%1").arg(res.error));
        return false;
    }
    m_rowsPath = path;
    m_ctrl->setRows(res.rows, res.filtered);
    setWindowTitle(QStringLiteral("%1 - HierFlow").arg(QFileInfo(path).fileName()));
    return true;
}

bool MainWindow::openSettings(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Settings: cannot open" << path << file.errorString();
        return false;
    }
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Settings:" << path << "is not a JSON object," << err.errorString();
        return false;
    }
    m_ctrl->setSettings(Settings::fromJson(doc.object()));
    applyControlSettings();
    return true;
}

void MainWindow::openFile() {
    QString path = QFileDialog::getOpenFileName(this, "Open Rows", {},
        "Row files (*.json);;All files (*)");
    if (!path.isEmpty()) openRows(path);
}

void MainWindow::openSettingsFile() {
    QString path = QFileDialog::getOpenFileName(this, "Open Settings", {},
        "Settings (*.json);;All files (*)");
    if (!path.isEmpty() && !openSettings(path))
        QMessageBox::warning(this, "HierFlow", "Could not load settings from\n" + path);
}

void MainWindow::reloadFile() {
    if (!m_rowsPath.isEmpty()) openRows(m_rowsPath);
}

void MainWindow::about() {
    QMessageBox::about(this, "About HierFlow",
        "HierFlow\n\nDraws parent/child rows as a collapsible tidy tree or an indented table.");
}

} // namespace hfl

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("HierFlow");
    app.setOrganizationName("HierFlow");
    app.setStyle("Fusion");

    QCommandLineParser parser;
    parser.setApplicationDescription("Hierarchy viewer for parent/child row data");
    parser.addHelpOption();
    parser.addPositionalArgument("rows", "Row file (JSON) to open.", "[rows.json]");
    QCommandLineOption settingsOpt("settings", "Settings file (JSON).", "file");
    QCommandLineOption viewOpt("view", "Initial view: tree or table.", "mode");
    parser.addOption(settingsOpt);
    parser.addOption(viewOpt);
    parser.process(app);

    hfl::MainWindow window;
    window.show();

    if (parser.isSet(settingsOpt) && !window.openSettings(parser.value(settingsOpt)))
        qWarning() << "Continuing with default settings";

    if (parser.isSet(viewOpt)) {
        const QString mode = parser.value(viewOpt);
        if (mode == QLatin1String("table"))     window.controller()->setViewMode(hfl::ViewMode::Table);
        else if (mode == QLatin1String("tree")) window.controller()->setViewMode(hfl::ViewMode::Tree);
        else qWarning() << "Unknown view mode" << mode;
    }

    const QStringList args = parser.positionalArguments();
    if (!args.isEmpty()) window.openRows(args.first());

    return app.exec();
}
