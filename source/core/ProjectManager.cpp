// ============================================================================
// ProjectManager - Implementation
// ============================================================================

#include "ProjectManager.h"
#include "BoardState.h"

#include <QCoreApplication>  // For translate()
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QSaveFile>

ProjectManager::ProjectManager(QObject* parent)
    : QObject(parent)
{
}

ProjectManager::~ProjectManager() = default;

// =========================================================================
// Images
// =========================================================================

QImage ProjectManager::loadImage(const QString& path)
{
    m_lastError.clear();

    if (!QFileInfo::exists(path)) {
        setError(QCoreApplication::translate("ProjectManager", "File not found: %1").arg(path));
        return QImage();
    }

    QImageReader reader(path);
    reader.setAutoTransform(true);  // Honour EXIF orientation from phone photos

    QImage image = reader.read();
    if (image.isNull()) {
        setError(QCoreApplication::translate("ProjectManager", "Cannot decode image %1: %2")
                     .arg(path, reader.errorString()));
        return QImage();
    }

#ifdef QT_DEBUG
    qDebug() << "ProjectManager::loadImage: loaded" << path << image.size();
#endif

    return image;
}

// =========================================================================
// Projects
// =========================================================================

std::unique_ptr<ProjectDocument> ProjectManager::loadProject(const QString& path)
{
    m_lastError.clear();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(QCoreApplication::translate("ProjectManager", "Cannot open %1: %2")
                     .arg(path, file.errorString()));
        return nullptr;
    }

    const QByteArray data = file.readAll();
    file.close();

    QString parseError;
    auto doc = ProjectSerializer::deserialize(data, &parseError);
    if (!doc) {
        setError(QCoreApplication::translate("ProjectManager", "Malformed project file %1: %2")
                     .arg(path, parseError));
        return nullptr;
    }

    qDebug() << "ProjectManager::loadProject: loaded" << doc->annotations.size()
             << "annotations and" << doc->proofSteps.size() << "proof steps from" << path;

    return doc;
}

bool ProjectManager::openProject(const QString& path, BoardState* state, QImage* image)
{
    if (!state) {
        setError(QCoreApplication::translate("ProjectManager", "No board to load %1 into").arg(path));
        return false;
    }

    std::unique_ptr<ProjectDocument> doc = loadProject(path);
    if (!doc) {
        return false;
    }

    // Resolve and decode the diagram before touching state
    QImage diagram;
    if (doc->hasImage()) {
        doc->imagePath = resolveImagePath(doc->imagePath, path);
        diagram = loadImage(doc->imagePath);
        if (diagram.isNull()) {
            // loadImage() already set lastError()
            return false;
        }
    }

    state->applyDocument(*doc, diagram.size());
    if (image) {
        *image = diagram;
    }

    emit projectLoaded(path);
    return true;
}

bool ProjectManager::saveProject(const ProjectDocument& doc, const QString& path)
{
    m_lastError.clear();

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(QCoreApplication::translate("ProjectManager", "Cannot write %1: %2")
                     .arg(path, file.errorString()));
        return false;
    }

    const QByteArray data = ProjectSerializer::serialize(doc);
    if (file.write(data) != data.size()) {
        setError(QCoreApplication::translate("ProjectManager", "Write to %1 failed: %2")
                     .arg(path, file.errorString()));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        setError(QCoreApplication::translate("ProjectManager", "Cannot commit %1: %2")
                     .arg(path, file.errorString()));
        return false;
    }

    qDebug() << "ProjectManager::saveProject: saved" << doc.annotations.size()
             << "annotations to" << path;

    emit projectSaved(path);
    return true;
}

QString ProjectManager::resolveImagePath(const QString& imagePath, const QString& projectPath)
{
    if (imagePath.isEmpty() || QFileInfo(imagePath).isAbsolute()) {
        return imagePath;
    }
    return QDir::cleanPath(QFileInfo(projectPath).absoluteDir().absoluteFilePath(imagePath));
}

// =========================================================================
// Picker helpers
// =========================================================================

const QStringList& ProjectManager::imageExtensions()
{
    static const QStringList exts = {
        QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("jpeg"),
        QStringLiteral("gif"), QStringLiteral("svg")
    };
    return exts;
}

const QStringList& ProjectManager::projectExtensions()
{
    static const QStringList exts = { QStringLiteral("proof"), QStringLiteral("json") };
    return exts;
}

static QString buildFilter(const QString& label, const QStringList& extensions)
{
    QStringList patterns;
    for (const QString& ext : extensions) {
        patterns << QStringLiteral("*.") + ext;
    }
    return QStringLiteral("%1 (%2)").arg(label, patterns.join(QLatin1Char(' ')));
}

QString ProjectManager::imageFilter()
{
    return buildFilter(QCoreApplication::translate("ProjectManager", "Images"), imageExtensions());
}

QString ProjectManager::projectFilter()
{
    return buildFilter(QCoreApplication::translate("ProjectManager", "Proof Project"), projectExtensions());
}

QString ProjectManager::ensureProjectExtension(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (projectExtensions().contains(suffix)) {
        return path;
    }
    return path + QStringLiteral(".proof");
}

void ProjectManager::setError(const QString& message)
{
    m_lastError = message;
    qWarning() << "ProjectManager:" << message;
}
