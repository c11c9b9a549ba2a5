// ============================================================================
// AnnotationStore - Implementation
// ============================================================================

#include "AnnotationStore.h"

#include <QDebug>
#include <QUuid>

AnnotationStore::AnnotationStore(QObject* parent)
    : QObject(parent)
{
}

// ===== Mutation =====

QString AnnotationStore::insert(const QPointF& position, const QString& text,
                                const QColor& color, int fontSize)
{
    if (text.isEmpty()) {
        return QString();
    }

    TextAnnotation a(position, text, color, fontSize);

    // Ids are never reused within a store
    while (contains(a.id)) {
        a.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    m_annotations.append(a);
    emit annotationsChanged();

    setSelectedId(a.id);

#ifdef QT_DEBUG
    qDebug() << "AnnotationStore::insert:" << a.text << "at" << a.position << "id =" << a.id;
#endif

    return a.id;
}

bool AnnotationStore::select(const QString& id)
{
    if (!id.isEmpty() && !contains(id)) {
        qWarning() << "AnnotationStore::select: unknown annotation id" << id;
        return false;
    }
    setSelectedId(id);
    return true;
}

bool AnnotationStore::move(const QString& id, const QPointF& position)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    if (m_annotations[idx].position == position) {
        return true;
    }
    m_annotations[idx].position = position;
    emit annotationsChanged();
    return true;
}

bool AnnotationStore::updateText(const QString& id, const QString& text)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    if (m_annotations[idx].text == text) {
        return true;
    }
    m_annotations[idx].text = text;
    emit annotationsChanged();
    return true;
}

bool AnnotationStore::remove(const QString& id)
{
    const int idx = indexOf(id);
    if (idx < 0) {
        return false;
    }
    m_annotations.removeAt(idx);

    // Invalidate the weak selection before anyone can observe it dangling
    if (m_selectedId == id) {
        setSelectedId(QString());
    }
    emit annotationsChanged();
    return true;
}

bool AnnotationStore::removeSelected()
{
    if (m_selectedId.isEmpty()) {
        return false;
    }
    return remove(m_selectedId);
}

void AnnotationStore::clear()
{
    const bool hadAnnotations = !m_annotations.isEmpty();
    m_annotations.clear();
    setSelectedId(QString());
    if (hadAnnotations) {
        emit annotationsChanged();
    }
}

void AnnotationStore::replaceAll(const QVector<TextAnnotation>& annotations)
{
    m_annotations = annotations;
    setSelectedId(QString());
    emit annotationsChanged();
}

// ===== Queries =====

const TextAnnotation* AnnotationStore::annotation(const QString& id) const
{
    const int idx = indexOf(id);
    return idx >= 0 ? &m_annotations[idx] : nullptr;
}

QString AnnotationStore::annotationAt(const QPointF& pt) const
{
    // Later annotations are painted on top, so search back to front
    for (int i = m_annotations.size() - 1; i >= 0; --i) {
        if (m_annotations[i].containsPoint(pt)) {
            return m_annotations[i].id;
        }
    }
    return QString();
}

// ===== Private =====

int AnnotationStore::indexOf(const QString& id) const
{
    if (id.isEmpty()) {
        return -1;
    }
    for (int i = 0; i < m_annotations.size(); ++i) {
        if (m_annotations[i].id == id) {
            return i;
        }
    }
    return -1;
}

void AnnotationStore::setSelectedId(const QString& id)
{
    if (m_selectedId == id) {
        return;
    }
    m_selectedId = id;
    emit selectionChanged(m_selectedId);
}
