#pragma once

// ============================================================================
// BoardState - Owned application state for one annotation session
// ============================================================================
// Part of the ProofBoard annotation model
//
// BoardState bundles everything the UI mutates:
// - AnnotationStore (annotations + selection)
// - CanvasTransform (image size, viewport, scale)
// - TemplatePalette (armed token)
// - ProofStepList
// - session preferences (current color, font size, dark mode)
//
// It is owned explicitly by MainWindow (no globals) and has no widget
// dependencies, so it can be driven directly from tests. Renderer events
// (click, drag-end) arrive as synchronous calls and are fully applied before
// the next one.
// ============================================================================

#include "AnnotationStore.h"
#include "CanvasTransform.h"
#include "TemplatePalette.h"
#include "ProofStepList.h"
#include "ProjectDocument.h"

#include <QObject>
#include <QColor>
#include <QSize>
#include <QString>

class BoardState : public QObject {
    Q_OBJECT

public:
    explicit BoardState(QObject* parent = nullptr);

    // ===== Components =====
    AnnotationStore* store() { return &m_store; }
    const AnnotationStore* store() const { return &m_store; }
    TemplatePalette* palette() { return &m_palette; }
    const TemplatePalette* palette() const { return &m_palette; }
    ProofStepList* proofSteps() { return &m_proofSteps; }
    const ProofStepList* proofSteps() const { return &m_proofSteps; }
    const CanvasTransform& transform() const { return m_transform; }

    // ===== Renderer events =====

    /**
     * @brief Handle a click on the empty canvas.
     * @param widgetPos Pointer position reported by the renderer.
     * @return Id of the inserted annotation, or empty if nothing was inserted
     *         (no token armed, no image, or pointer off-canvas).
     *
     * Inserts the armed token with the current color and font size, then
     * disarms the palette so one click inserts at most one annotation.
     */
    QString placePendingToken(const QPointF& widgetPos);

    void handleAnnotationClicked(const QString& id);
    void handleBackgroundPressed();

    /**
     * @brief Apply a drag-end reported by the renderer.
     * Ignored if the annotation was deleted in the meantime.
     */
    void handleDragEnd(const QString& id, const QPointF& newPosition);

    void setViewportSize(const QSizeF& size);

    // ===== Image =====

    /**
     * @brief Install a freshly imported image.
     *
     * Starts a new canvas: existing annotations and the selection are cleared
     * and the image is fitted to the viewport. Proof steps are kept.
     */
    void setImage(const QString& path, const QSize& naturalSize);

    bool hasImage() const { return m_transform.hasImage(); }
    QString imagePath() const { return m_imagePath; }

    // ===== Commands =====

    /**
     * @brief Remove every annotation. Confirmation is the caller's job.
     */
    void clearAnnotations();

    void zoomIn();
    void zoomOut();

    QColor currentColor() const { return m_currentColor; }
    void setCurrentColor(const QColor& color);

    int fontSize() const { return m_fontSize; }
    void setFontSize(int size);

    bool isDarkMode() const { return m_darkMode; }
    void setDarkMode(bool dark);
    void toggleDarkMode() { setDarkMode(!m_darkMode); }

    // ===== Persistence =====

    ProjectDocument toDocument() const;

    /**
     * @brief Replace the whole state with a loaded document.
     * @param doc The document (already fully parsed).
     * @param imageSize Natural size of the resolved image; ignored if the
     *        document has no image reference.
     *
     * Clears the selection and seeds one blank proof step if the document
     * has none.
     */
    void applyDocument(const ProjectDocument& doc, const QSize& imageSize = QSize());

    static const QColor DEFAULT_COLOR;

signals:
    void imageChanged();
    void displayChanged();
    void currentColorChanged(const QColor& color);
    void fontSizeChanged(int size);
    void darkModeChanged(bool dark);

private:
    AnnotationStore m_store;
    CanvasTransform m_transform;
    TemplatePalette m_palette;
    ProofStepList m_proofSteps;

    QString m_imagePath;
    QColor m_currentColor;
    int m_fontSize = TextAnnotation::DEFAULT_FONT_SIZE;
    bool m_darkMode = false;
};
