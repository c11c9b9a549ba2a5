#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>

#include "core/BoardState.h"

class AnnotationCanvas;
class AnnotationSidebar;
class ProofPanel;
class ProjectManager;
class QCloseEvent;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    /**
     * @brief Construct the main window.
     *
     * Layout: AnnotationSidebar | AnnotationCanvas | ProofPanel.
     * The window owns the BoardState every panel is attached to.
     */
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    BoardState* boardState() { return &m_state; }

    /**
     * @brief Load a project file and resolve its image.
     * @return False (after showing "Load Error") if anything fails; the
     *         current session is left untouched in that case.
     */
    bool openProjectFile(const QString& path);

public slots:
    void importDiagram();
    void saveProject();
    void openProject();
    void clearAllAnnotations();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUi();
    void connectCanvas();
    void applyTheme(bool dark);
    void updateWindowTitle();

    QString lastDirectory(const QString& key) const;
    void rememberDirectory(const QString& key, const QString& filePath);

    BoardState m_state;
    ProjectManager* m_projectManager = nullptr;

    AnnotationSidebar* m_sidebar = nullptr;
    AnnotationCanvas* m_canvas = nullptr;
    ProofPanel* m_proofPanel = nullptr;

    QString m_projectPath;  ///< Last saved/opened project (empty for a new session)
};

#endif // MAINWINDOW_H
