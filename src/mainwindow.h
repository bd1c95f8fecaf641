#pragma once
#include "controller.h"
#include <QMainWindow>
#include <QLabel>
#include <QLineEdit>
#include <QComboBox>
#include <QToolBar>
#include <QToolButton>
#include <QStackedWidget>

namespace hfl {

class TreeCanvas;
class TableView;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);

    HierController* controller() const { return m_ctrl; }

    bool openRows(const QString& path);
    bool openSettings(const QString& path);

private slots:
    void openFile();
    void openSettingsFile();
    void reloadFile();
    void about();

private:
    HierController* m_ctrl;
    QString         m_rowsPath;

    QStackedWidget* m_stack     = nullptr;
    TreeCanvas*     m_canvas    = nullptr;
    TableView*      m_table     = nullptr;
    QLabel*         m_statusLabel = nullptr;

    // Toolbar
    QToolBar*    m_toolBar        = nullptr;
    QLineEdit*   m_search         = nullptr;
    QComboBox*   m_hierarchyCombo = nullptr;
    QComboBox*   m_parentCombo    = nullptr;
    QComboBox*   m_dropdownCombo  = nullptr;
    QLineEdit*   m_zoomField      = nullptr;
    QAction*     m_searchAct      = nullptr;
    QAction*     m_hierarchyAct   = nullptr;
    QAction*     m_parentAct      = nullptr;
    QAction*     m_dropdownAct    = nullptr;
    QAction*     m_zoomOutAct     = nullptr;
    QAction*     m_zoomFieldAct   = nullptr;
    QAction*     m_zoomInAct      = nullptr;
    QAction*     m_fitAct         = nullptr;
    QAction*     m_viewAct        = nullptr;
    QAction*     m_collapseAct    = nullptr;
    QAction*     m_expandAct      = nullptr;

    void createMenus();
    void createToolBar();
    void createStatusBar();
    void applyControlSettings();
    void syncFilterOptions();
    void syncZoomField();
    void syncViewMode();
    void updateStatus();
    void fillCombo(QComboBox* combo, const QString& noneText,
                   const QStringList& items, const QString& current);
};

} // namespace hfl
