#pragma once

// ============================================================================
// CanvasTransform - Image fit and zoom for the annotation canvas
// ============================================================================
// Part of the ProofBoard annotation model
//
// Maps an image's natural size into the canvas viewport:
// - On import the image is fitted to the viewport, never upscaled past 1.0
// - Explicit zoom steps are multiplicative (x1.2) and clamped to [0.1, 3.0]
// - Viewport resizes re-fit the image only while no explicit zoom was applied
//
// Annotation positions are canvas-space and are NEVER rescaled here.
// ============================================================================

#include <QSize>
#include <QSizeF>
#include <QPointF>
#include <QRectF>
#include <optional>

/**
 * @brief Display state of the background image: natural size, viewport, scale.
 */
class CanvasTransform {
public:
    // ----- Zoom Limits -----
    static constexpr qreal MIN_SCALE = 0.1;    // 10%
    static constexpr qreal MAX_SCALE = 3.0;    // 300%
    static constexpr qreal ZOOM_STEP = 1.2;
    /// Fit never enlarges the image beyond its natural resolution
    static constexpr qreal MAX_FIT_SCALE = 1.0;

    /// Viewport assumed before the host widget has been measured
    static constexpr int DEFAULT_VIEWPORT_WIDTH = 800;
    static constexpr int DEFAULT_VIEWPORT_HEIGHT = 600;

    CanvasTransform() = default;

    // ===== Pure helpers =====

    /**
     * @brief Scale that fits @p natural inside @p viewport.
     * @return min(vw/nw, vh/nh, 1.0), or 1.0 if any dimension is not positive.
     */
    static qreal computeFitScale(const QSizeF& natural, const QSizeF& viewport);

    /// scale * 1.2, clamped to MAX_SCALE
    static qreal zoomIn(qreal scale);

    /// scale / 1.2, clamped to MIN_SCALE
    static qreal zoomOut(qreal scale);

    // ===== State =====

    bool hasImage() const { return m_imageSize.isValid() && !m_imageSize.isEmpty(); }
    QSize imageSize() const { return m_imageSize; }
    QSizeF viewportSize() const { return m_viewportSize; }
    qreal scale() const { return m_scale; }

    /**
     * @brief True while the scale follows the viewport (no explicit zoom yet).
     */
    bool isFitMode() const { return m_fitMode; }

    /**
     * @brief Set the natural size of a newly imported/loaded image and fit it.
     */
    void setImageSize(const QSize& naturalSize);

    /**
     * @brief Forget the image. Scale returns to 1.0.
     */
    void clearImage();

    /**
     * @brief Record a new viewport size.
     * @return True if the scale changed as a result.
     */
    bool setViewportSize(const QSizeF& size);

    /**
     * @brief Re-fit the current image to the viewport and re-enter fit mode.
     */
    void fitToViewport();

    void zoomIn();
    void zoomOut();

    // ===== Mapping =====

    /**
     * @brief The rectangle the image occupies on the canvas.
     * Empty when no image is loaded.
     */
    QRectF imageRect() const;

    /**
     * @brief Convert a pointer position reported by the renderer to canvas space.
     * @return std::nullopt when the pointer lies outside the viewport.
     */
    std::optional<QPointF> canvasPosition(const QPointF& widgetPos) const;

private:
    QSize m_imageSize;
    QSizeF m_viewportSize = QSizeF(DEFAULT_VIEWPORT_WIDTH, DEFAULT_VIEWPORT_HEIGHT);
    qreal m_scale = 1.0;
    bool m_fitMode = true;
};
