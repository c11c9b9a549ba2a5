#include "MainWindow.h"

#include "core/ProjectManager.h"
#include "viewport/AnnotationCanvas.h"
#include "ui/sidebars/AnnotationSidebar.h"
#include "ui/ProofPanel.h"
#include "ui/ThemeColors.h"

#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QSettings>

namespace {
const char* KEY_LAST_IMAGE_DIR = "lastImageDir";
const char* KEY_LAST_PROJECT_DIR = "lastProjectDir";
const char* KEY_GEOMETRY = "mainWindow/geometry";
}

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_projectManager(new ProjectManager(this))
{
    setupUi();
    connectCanvas();

    connect(&m_state, &BoardState::darkModeChanged, this, &MainWindow::applyTheme);
    connect(m_projectManager, &ProjectManager::projectSaved, this, [this](const QString& path) {
        m_projectPath = path;
        updateWindowTitle();
    });

    applyTheme(m_state.isDarkMode());
    updateWindowTitle();

    QSettings settings;
    if (!restoreGeometry(settings.value(KEY_GEOMETRY).toByteArray())) {
        resize(1400, 860);
    }
}

MainWindow::~MainWindow()
{
    // Detach before m_state is destroyed; the panels are deleted later by QObject
    m_canvas->setBoardState(nullptr);
    m_sidebar->setBoardState(nullptr);
    m_proofPanel->setProofSteps(nullptr);
}

void MainWindow::setupUi()
{
    QWidget* central = new QWidget(this);
    QHBoxLayout* layout = new QHBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_sidebar = new AnnotationSidebar(central);
    m_canvas = new AnnotationCanvas(central);
    m_proofPanel = new ProofPanel(central);

    layout->addWidget(m_sidebar);
    layout->addWidget(m_canvas, 1);
    layout->addWidget(m_proofPanel);
    setCentralWidget(central);

    m_sidebar->setBoardState(&m_state);
    m_canvas->setBoardState(&m_state);
    m_proofPanel->setProofSteps(m_state.proofSteps());

    connect(m_sidebar, &AnnotationSidebar::importRequested, this, &MainWindow::importDiagram);
    connect(m_sidebar, &AnnotationSidebar::saveRequested, this, &MainWindow::saveProject);
    connect(m_sidebar, &AnnotationSidebar::openRequested, this, &MainWindow::openProject);
    connect(m_sidebar, &AnnotationSidebar::clearRequested, this, &MainWindow::clearAllAnnotations);
}

void MainWindow::connectCanvas()
{
    // Direct connections: each renderer event is applied before the next one
    connect(m_canvas, &AnnotationCanvas::canvasClicked, this, [this](QPointF pos) {
        m_state.placePendingToken(pos);
    });
    connect(m_canvas, &AnnotationCanvas::annotationClicked,
            &m_state, &BoardState::handleAnnotationClicked);
    connect(m_canvas, &AnnotationCanvas::backgroundPressed,
            &m_state, &BoardState::handleBackgroundPressed);
    connect(m_canvas, &AnnotationCanvas::annotationDragEnded,
            &m_state, &BoardState::handleDragEnd);
    connect(m_canvas, &AnnotationCanvas::viewportResized,
            &m_state, &BoardState::setViewportSize);
}

// ============================================================================
// Import
// ============================================================================

void MainWindow::importDiagram()
{
    const QString filePath = QFileDialog::getOpenFileName(
        this,
        tr("Import Diagram"),
        lastDirectory(KEY_LAST_IMAGE_DIR),
        ProjectManager::imageFilter()
    );

    if (filePath.isEmpty()) {
        // User cancelled
        return;
    }

    const QImage image = m_projectManager->loadImage(filePath);
    if (image.isNull()) {
        QMessageBox::critical(this, tr("Import Failed"),
            tr("Failed to load image:\n%1\n\n%2").arg(filePath, m_projectManager->lastError()));
        return;
    }

    rememberDirectory(KEY_LAST_IMAGE_DIR, filePath);
    m_state.setImage(filePath, image.size());
    m_canvas->setBackgroundImage(image);

    qDebug() << "MainWindow::importDiagram: imported" << filePath << image.size();
}

// ============================================================================
// Save / Open
// ============================================================================

void MainWindow::saveProject()
{
    QString defaultPath = m_projectPath;
    if (defaultPath.isEmpty()) {
        const QString baseName = m_state.hasImage()
            ? QFileInfo(m_state.imagePath()).completeBaseName()
            : QStringLiteral("Untitled");
        defaultPath = lastDirectory(KEY_LAST_PROJECT_DIR) + "/" + baseName + ".proof";
    }

    QString filePath = QFileDialog::getSaveFileName(
        this,
        tr("Save Project"),
        defaultPath,
        ProjectManager::projectFilter()
    );

    if (filePath.isEmpty()) {
        // User cancelled
        return;
    }

    filePath = ProjectManager::ensureProjectExtension(filePath);

    if (!m_projectManager->saveProject(m_state.toDocument(), filePath)) {
        QMessageBox::critical(this, tr("Save Error"),
            tr("Failed to save project to:\n%1\n\n%2").arg(filePath, m_projectManager->lastError()));
        return;
    }

    rememberDirectory(KEY_LAST_PROJECT_DIR, filePath);
}

void MainWindow::openProject()
{
    const QString filePath = QFileDialog::getOpenFileName(
        this,
        tr("Open Project"),
        lastDirectory(KEY_LAST_PROJECT_DIR),
        ProjectManager::projectFilter()
    );

    if (filePath.isEmpty()) {
        // User cancelled
        return;
    }

    openProjectFile(filePath);
}

bool MainWindow::openProjectFile(const QString& path)
{
    QImage image;
    if (!m_projectManager->openProject(path, &m_state, &image)) {
        QMessageBox::critical(this, tr("Load Error"),
            tr("Failed to load project from:\n%1\n\n%2").arg(path, m_projectManager->lastError()));
        return false;
    }

    m_canvas->setBackgroundImage(image);
    rememberDirectory(KEY_LAST_PROJECT_DIR, path);
    m_projectPath = path;
    updateWindowTitle();
    return true;
}

// ============================================================================
// Commands
// ============================================================================

void MainWindow::clearAllAnnotations()
{
    if (m_state.store()->isEmpty()) {
        return;
    }

    const QMessageBox::StandardButton answer = QMessageBox::question(
        this,
        tr("Clear All"),
        tr("Remove all %1 annotations from the diagram?").arg(m_state.store()->count()),
        QMessageBox::Yes | QMessageBox::No,
        QMessageBox::No
    );

    if (answer == QMessageBox::Yes) {
        m_state.clearAnnotations();
    }
}

void MainWindow::applyTheme(bool dark)
{
    QApplication::setPalette(ThemeColors::applicationPalette(dark));
    m_proofPanel->setDarkMode(dark);
}

void MainWindow::updateWindowTitle()
{
    if (m_projectPath.isEmpty()) {
        setWindowTitle(tr("ProofBoard"));
    } else {
        setWindowTitle(tr("ProofBoard - %1").arg(QFileInfo(m_projectPath).fileName()));
    }
}

// ============================================================================
// Settings
// ============================================================================

QString MainWindow::lastDirectory(const QString& key) const
{
    QSettings settings;
    const QString dir = settings.value(key).toString();
    return (!dir.isEmpty() && QDir(dir).exists()) ? dir : QDir::homePath();
}

void MainWindow::rememberDirectory(const QString& key, const QString& filePath)
{
    QSettings settings;
    settings.setValue(key, QFileInfo(filePath).absolutePath());
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    QSettings settings;
    settings.setValue(KEY_GEOMETRY, saveGeometry());
    QMainWindow::closeEvent(event);
}
