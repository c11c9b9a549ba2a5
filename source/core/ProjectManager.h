#pragma once

// ============================================================================
// ProjectManager - File I/O for projects and diagram images
// ============================================================================
// Part of the ProofBoard document architecture
//
// ProjectManager is responsible for:
// - Decoding diagram images from disk (import and project re-resolution)
// - Reading project files and handing back parsed ProjectDocuments
// - Writing project files atomically
//
// Every method reports failure through its return value and keeps a human
// readable reason in lastError(). openProject() is the only method that
// touches BoardState, and only after every step has succeeded.
// ============================================================================

#include "ProjectDocument.h"

#include <QObject>
#include <QImage>
#include <QString>
#include <QStringList>
#include <memory>

class BoardState;

class ProjectManager : public QObject {
    Q_OBJECT

public:
    explicit ProjectManager(QObject* parent = nullptr);
    ~ProjectManager() override;

    // =========================================================================
    // Images
    // =========================================================================

    /**
     * @brief Decode an image file.
     * @param path Absolute path to a png/jpg/jpeg/gif/svg file.
     * @return The decoded image, or a null QImage on failure (see lastError()).
     */
    QImage loadImage(const QString& path);

    // =========================================================================
    // Projects
    // =========================================================================

    /**
     * @brief Read and parse a project file.
     * @param path Path to a .proof or .json file.
     * @return The parsed document, or nullptr if the file cannot be read or
     *         is malformed (see lastError()).
     *
     * The image reference inside the document is NOT resolved here.
     */
    std::unique_ptr<ProjectDocument> loadProject(const QString& path);

    /**
     * @brief Load a project file and its diagram, then apply both to @p state.
     * @param path Path to a .proof or .json file.
     * @param state State to replace. Left untouched on any failure.
     * @param image Receives the decoded diagram (null if the project has none).
     * @return True if the project was applied (see lastError() otherwise).
     *
     * A relative imagePath is resolved against the project file's directory.
     * Emits projectLoaded() only after the state has been replaced.
     */
    bool openProject(const QString& path, BoardState* state, QImage* image = nullptr);

    /**
     * @brief Serialize and write a project file.
     * @param doc Document to save.
     * @param path Destination path.
     * @return True on success.
     *
     * Uses QSaveFile, so a failed write leaves an existing file untouched.
     * Emits projectSaved() on success.
     */
    bool saveProject(const ProjectDocument& doc, const QString& path);

    /**
     * @brief Reason for the last failure (empty after a success).
     */
    QString lastError() const { return m_lastError; }

    /**
     * @brief Resolve a stored image reference against its project file.
     * @param imagePath Path as stored in the document.
     * @param projectPath Path of the project file it was read from.
     * @return @p imagePath unchanged if absolute, otherwise the absolute path
     *         relative to the project file's directory.
     */
    static QString resolveImagePath(const QString& imagePath, const QString& projectPath);

    // =========================================================================
    // Picker helpers
    // =========================================================================

    static const QStringList& imageExtensions();
    static const QStringList& projectExtensions();

    /**
     * @brief Name filter for image open dialogs.
     */
    static QString imageFilter();

    /**
     * @brief Name filter for project open/save dialogs.
     */
    static QString projectFilter();

    /**
     * @brief Append ".proof" unless the path already ends in .proof or .json.
     */
    static QString ensureProjectExtension(const QString& path);

signals:
    void projectLoaded(const QString& path);
    void projectSaved(const QString& path);

private:
    void setError(const QString& message);

    QString m_lastError;
};
