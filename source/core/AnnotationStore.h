#pragma once

// ============================================================================
// AnnotationStore - Ordered collection of text annotations + selection
// ============================================================================
// Part of the ProofBoard annotation model
//
// AnnotationStore owns every TextAnnotation on the canvas, keyed by id, in
// insertion order. It also tracks the (single) selected annotation.
//
// The selection is a weak reference: it holds an id, never a pointer, and is
// cleared explicitly whenever its target is removed.
//
// All operations are synchronous; the renderer repaints from annotations()
// after annotationsChanged() is emitted.
// ============================================================================

#include "../objects/TextAnnotation.h"

#include <QObject>
#include <QVector>
#include <QString>
#include <QPointF>
#include <QColor>

/**
 * @brief Annotation list with insert/move/edit/remove and selection tracking.
 */
class AnnotationStore : public QObject {
    Q_OBJECT

public:
    explicit AnnotationStore(QObject* parent = nullptr);

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Insert a new annotation.
     * @return The new id, or an empty string if @p text is empty (nothing armed).
     *
     * The inserted annotation becomes the selection.
     */
    QString insert(const QPointF& position, const QString& text,
                   const QColor& color, int fontSize);

    /**
     * @brief Select an annotation, or clear the selection with an empty id.
     * @return False if @p id does not exist; the selection is left unchanged.
     *
     * The renderer only reports live ids, so an unknown id is a caller bug.
     */
    bool select(const QString& id);

    void clearSelection() { select(QString()); }

    /**
     * @brief Move an annotation to a new top-left position.
     * @return False (and no change) if @p id is unknown.
     *
     * Drag-end callbacks may arrive after the annotation has been deleted;
     * that case is silently ignored.
     */
    bool move(const QString& id, const QPointF& position);

    /**
     * @brief Replace the text of an annotation.
     *
     * Unlike insert(), empty text is allowed (the user is mid-edit).
     */
    bool updateText(const QString& id, const QString& text);

    /**
     * @brief Remove an annotation. Clears the selection if it was selected.
     */
    bool remove(const QString& id);

    /**
     * @brief Remove whatever is currently selected.
     */
    bool removeSelected();

    /**
     * @brief Remove every annotation and clear the selection.
     */
    void clear();

    /**
     * @brief Replace the full contents (used when loading a project).
     * The selection is cleared.
     */
    void replaceAll(const QVector<TextAnnotation>& annotations);

    // =========================================================================
    // Queries
    // =========================================================================

    const QVector<TextAnnotation>& annotations() const { return m_annotations; }
    int count() const { return m_annotations.size(); }
    bool isEmpty() const { return m_annotations.isEmpty(); }
    bool contains(const QString& id) const { return indexOf(id) >= 0; }

    /**
     * @brief Look up an annotation by id.
     * @return Pointer into the store (invalidated by the next mutation), or nullptr.
     */
    const TextAnnotation* annotation(const QString& id) const;

    QString selectedId() const { return m_selectedId; }
    bool hasSelection() const { return !m_selectedId.isEmpty(); }
    const TextAnnotation* selectedAnnotation() const { return annotation(m_selectedId); }

    /**
     * @brief Hit test in canvas coordinates.
     * @return Id of the last-inserted annotation under @p pt, or empty.
     */
    QString annotationAt(const QPointF& pt) const;

signals:
    /**
     * @brief Emitted after any change to the annotation list.
     */
    void annotationsChanged();

    /**
     * @brief Emitted when the selected id changes (empty = none).
     */
    void selectionChanged(const QString& id);

private:
    int indexOf(const QString& id) const;
    void setSelectedId(const QString& id);

    QVector<TextAnnotation> m_annotations;
    QString m_selectedId;
};
