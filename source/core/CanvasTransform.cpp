// ============================================================================
// CanvasTransform - Implementation
// ============================================================================

#include "CanvasTransform.h"

#include <QtGlobal>
#include <QDebug>

// ===== Pure helpers =====

qreal CanvasTransform::computeFitScale(const QSizeF& natural, const QSizeF& viewport)
{
    // Guard against zero-size images and unmeasured viewports
    if (natural.width() <= 0 || natural.height() <= 0
        || viewport.width() <= 0 || viewport.height() <= 0) {
        return 1.0;
    }

    const qreal scaleX = viewport.width() / natural.width();
    const qreal scaleY = viewport.height() / natural.height();

    return qMin(qMin(scaleX, scaleY), MAX_FIT_SCALE);
}

qreal CanvasTransform::zoomIn(qreal scale)
{
    return qMin(scale * ZOOM_STEP, MAX_SCALE);
}

qreal CanvasTransform::zoomOut(qreal scale)
{
    return qMax(scale / ZOOM_STEP, MIN_SCALE);
}

// ===== State =====

void CanvasTransform::setImageSize(const QSize& naturalSize)
{
    m_imageSize = naturalSize;
    fitToViewport();

#ifdef QT_DEBUG
    qDebug() << "CanvasTransform::setImageSize:" << naturalSize
             << "viewport =" << m_viewportSize << "scale =" << m_scale;
#endif
}

void CanvasTransform::clearImage()
{
    m_imageSize = QSize();
    m_scale = 1.0;
    m_fitMode = true;
}

bool CanvasTransform::setViewportSize(const QSizeF& size)
{
    if (size == m_viewportSize) {
        return false;
    }
    m_viewportSize = size;

    // An explicit zoom is the user's choice; a window resize must not undo it
    if (!m_fitMode || !hasImage()) {
        return false;
    }

    const qreal oldScale = m_scale;
    m_scale = computeFitScale(m_imageSize, m_viewportSize);
    return !qFuzzyCompare(oldScale, m_scale);
}

void CanvasTransform::fitToViewport()
{
    m_scale = hasImage() ? computeFitScale(m_imageSize, m_viewportSize) : 1.0;
    m_fitMode = true;
}

void CanvasTransform::zoomIn()
{
    m_scale = zoomIn(m_scale);
    m_fitMode = false;
}

void CanvasTransform::zoomOut()
{
    m_scale = zoomOut(m_scale);
    m_fitMode = false;
}

// ===== Mapping =====

QRectF CanvasTransform::imageRect() const
{
    if (!hasImage()) {
        return QRectF();
    }
    return QRectF(QPointF(0, 0), QSizeF(m_imageSize) * m_scale);
}

std::optional<QPointF> CanvasTransform::canvasPosition(const QPointF& widgetPos) const
{
    // The canvas origin is the widget origin; only reject points off-surface
    const QRectF viewport(QPointF(0, 0), m_viewportSize);
    if (!viewport.contains(widgetPos)) {
        return std::nullopt;
    }
    return widgetPos;
}
