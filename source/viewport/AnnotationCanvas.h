#pragma once

// ============================================================================
// AnnotationCanvas - Passive renderer for the diagram and its annotations
// ============================================================================
// Part of the ProofBoard viewport
//
// AnnotationCanvas paints:
// - the background image, scaled by BoardState's CanvasTransform
// - every annotation in list order, the selected one highlighted
// - an empty-state hint when no image has been imported
//
// It never mutates state itself. Input is reported as signals:
// - annotationClicked / backgroundPressed on press
// - canvasClicked on a click (press + release without drag) on empty canvas
// - annotationDragEnded when a dragged annotation is dropped
// - viewportResized whenever the widget changes size
// ============================================================================

#include <QWidget>
#include <QPixmap>
#include <QImage>
#include <QPointF>
#include <QSizeF>
#include <QString>

class BoardState;

class AnnotationCanvas : public QWidget {
    Q_OBJECT

public:
    explicit AnnotationCanvas(QWidget* parent = nullptr);
    ~AnnotationCanvas() override;

    /**
     * @brief Attach the state to render. Not owned.
     */
    void setBoardState(BoardState* state);
    BoardState* boardState() const { return m_state; }

    /**
     * @brief Set the decoded background image (null to clear).
     */
    void setBackgroundImage(const QImage& image);
    bool hasBackgroundImage() const { return !m_background.isNull(); }

signals:
    void canvasClicked(QPointF pos);
    void backgroundPressed();
    void annotationClicked(const QString& id);
    void annotationDragEnded(const QString& id, QPointF newPosition);
    void viewportResized(QSizeF size);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    void resetPointerState();

    BoardState* m_state = nullptr;
    QPixmap m_background;

    // ----- Pointer tracking -----
    bool m_pointerDown = false;
    QPointF m_pressPos;
    QString m_dragId;          ///< Annotation under the press (empty = background)
    QPointF m_dragOffset;      ///< Live preview displacement while dragging
    bool m_dragging = false;

    /// Pointer travel (px) before a press turns into a drag
    static constexpr qreal DRAG_THRESHOLD = 3.0;
};
