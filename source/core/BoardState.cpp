// ============================================================================
// BoardState - Implementation
// ============================================================================

#include "BoardState.h"

#include <QDebug>

const QColor BoardState::DEFAULT_COLOR = QColor(0xFF, 0x00, 0x00);

BoardState::BoardState(QObject* parent)
    : QObject(parent)
    , m_currentColor(DEFAULT_COLOR)
{
    // A fresh session always shows one empty proof step to type into
    m_proofSteps.ensureSeeded();
}

// ===== Renderer events =====

QString BoardState::placePendingToken(const QPointF& widgetPos)
{
    if (!m_palette.isArmed() || !hasImage()) {
        return QString();
    }

    const std::optional<QPointF> canvasPos = m_transform.canvasPosition(widgetPos);
    if (!canvasPos) {
        return QString();
    }

    const QString id = m_store.insert(*canvasPos, m_palette.pendingToken(),
                                      m_currentColor, m_fontSize);
    if (!id.isEmpty()) {
        m_palette.disarm();
    }
    return id;
}

void BoardState::handleAnnotationClicked(const QString& id)
{
    m_store.select(id);
}

void BoardState::handleBackgroundPressed()
{
    m_store.clearSelection();
}

void BoardState::handleDragEnd(const QString& id, const QPointF& newPosition)
{
    if (!m_store.move(id, newPosition)) {
#ifdef QT_DEBUG
        qDebug() << "BoardState::handleDragEnd: annotation" << id << "no longer exists";
#endif
    }
}

void BoardState::setViewportSize(const QSizeF& size)
{
    if (m_transform.setViewportSize(size)) {
        emit displayChanged();
    }
}

// ===== Image =====

void BoardState::setImage(const QString& path, const QSize& naturalSize)
{
    m_imagePath = path;
    m_transform.setImageSize(naturalSize);
    m_store.clear();

    emit imageChanged();
    emit displayChanged();
}

// ===== Commands =====

void BoardState::clearAnnotations()
{
    m_store.clear();
}

void BoardState::zoomIn()
{
    m_transform.zoomIn();
    emit displayChanged();
}

void BoardState::zoomOut()
{
    m_transform.zoomOut();
    emit displayChanged();
}

void BoardState::setCurrentColor(const QColor& color)
{
    if (!color.isValid() || color == m_currentColor) {
        return;
    }
    m_currentColor = color;
    emit currentColorChanged(m_currentColor);
}

void BoardState::setFontSize(int size)
{
    size = TextAnnotation::clampFontSize(size);
    if (size == m_fontSize) {
        return;
    }
    m_fontSize = size;
    emit fontSizeChanged(m_fontSize);
}

void BoardState::setDarkMode(bool dark)
{
    if (dark == m_darkMode) {
        return;
    }
    m_darkMode = dark;
    emit darkModeChanged(m_darkMode);
}

// ===== Persistence =====

ProjectDocument BoardState::toDocument() const
{
    ProjectDocument doc;
    doc.imagePath = m_imagePath;
    doc.annotations = m_store.annotations();
    doc.proofSteps = m_proofSteps.steps();
    doc.fontSize = m_fontSize;
    doc.darkMode = m_darkMode;
    return doc;
}

void BoardState::applyDocument(const ProjectDocument& doc, const QSize& imageSize)
{
    if (doc.hasImage() && imageSize.isValid()) {
        m_imagePath = doc.imagePath;
        m_transform.setImageSize(imageSize);
    } else {
        m_imagePath.clear();
        m_transform.clearImage();
    }

    m_store.replaceAll(doc.annotations);
    m_proofSteps.replaceAll(doc.proofSteps);
    m_proofSteps.ensureSeeded();

    setFontSize(doc.fontSize);
    setDarkMode(doc.darkMode);

    emit imageChanged();
    emit displayChanged();

#ifdef QT_DEBUG
    qDebug() << "BoardState::applyDocument:" << m_store.count() << "annotations,"
             << m_proofSteps.count() << "proof steps, image =" << m_imagePath;
#endif
}
