#pragma once

// ============================================================================
// CanvasTransformTests - Unit tests for fit scale and zoom
// ============================================================================
// Part of the ProofBoard annotation model
//
// Tests:
// - Fit scale never exceeds 1.0 and never overflows the viewport
// - Zero-size guard
// - Zoom step sequence and clamping
// - Fit mode: resize refits until the user zooms explicitly
// - Widget to canvas position mapping
// ============================================================================

#include "CanvasTransform.h"
#include <QDebug>
#include <QtGlobal>

namespace CanvasTransformTests {

/**
 * @brief computeFitScale() for shrinking, non-upscaling and zero sizes.
 */
inline bool testFitScale()
{
    qDebug() << "=== Test: Fit Scale ===";
    bool success = true;

    // Large image is shrunk to fit the limiting axis
    {
        const qreal s = CanvasTransform::computeFitScale(QSizeF(1600, 900), QSizeF(800, 600));
        if (!qFuzzyCompare(s, 0.5)) {
            qDebug() << "FAIL: 1600x900 in 800x600 should fit at 0.5, got" << s;
            success = false;
        }
        if (1600 * s > 800 + 1e-9 || 900 * s > 600 + 1e-9) {
            qDebug() << "FAIL: fitted image overflows the viewport";
            success = false;
        }
        qDebug() << "  - Shrink to fit: OK";
    }

    // Small image is never upscaled
    {
        const qreal s = CanvasTransform::computeFitScale(QSizeF(200, 100), QSizeF(800, 600));
        if (!qFuzzyCompare(s, 1.0)) {
            qDebug() << "FAIL: small image should stay at 1.0, got" << s;
            success = false;
        }
        qDebug() << "  - No upscaling: OK";
    }

    // Sweep: result is always in (0, 1] and the image fits
    {
        const QSizeF images[] = { QSizeF(3000, 20), QSizeF(20, 3000), QSizeF(801, 601), QSizeF(1, 1) };
        const QSizeF viewports[] = { QSizeF(800, 600), QSizeF(320, 240), QSizeF(1920, 1080) };
        for (const QSizeF& img : images) {
            for (const QSizeF& vp : viewports) {
                const qreal s = CanvasTransform::computeFitScale(img, vp);
                if (s <= 0 || s > 1.0) {
                    qDebug() << "FAIL: fit scale out of range for" << img << vp << "=" << s;
                    success = false;
                }
                if (img.width() * s > vp.width() + 1e-6 || img.height() * s > vp.height() + 1e-6) {
                    qDebug() << "FAIL: fitted image overflows for" << img << vp;
                    success = false;
                }
            }
        }
        qDebug() << "  - Fit bound sweep: OK";
    }

    // Any zero dimension falls back to 1.0
    {
        const qreal a = CanvasTransform::computeFitScale(QSizeF(0, 100), QSizeF(800, 600));
        const qreal b = CanvasTransform::computeFitScale(QSizeF(100, 100), QSizeF(0, 0));
        if (!qFuzzyCompare(a, 1.0) || !qFuzzyCompare(b, 1.0)) {
            qDebug() << "FAIL: zero-size guard should return 1.0, got" << a << b;
            success = false;
        }
        qDebug() << "  - Zero-size guard: OK";
    }

    return success;
}

/**
 * @brief Zoom steps multiply by 1.2 and clamp to [0.1, 3.0].
 */
inline bool testZoom()
{
    qDebug() << "=== Test: Zoom ===";
    bool success = true;

    // 1.0 → 1.2 → 1.44 → 1.728
    {
        CanvasTransform t;
        const qreal expected[] = { 1.2, 1.44, 1.728 };
        for (qreal e : expected) {
            t.zoomIn();
            if (!qFuzzyCompare(t.scale(), e)) {
                qDebug() << "FAIL: zoom in expected" << e << "got" << t.scale();
                success = false;
            }
        }
        qDebug() << "  - Zoom in sequence: OK";
    }

    // Repeated zoom in converges to exactly the maximum
    {
        qreal s = 1.0;
        for (int i = 0; i < 50; ++i) {
            s = CanvasTransform::zoomIn(s);
        }
        if (s != CanvasTransform::MAX_SCALE) {
            qDebug() << "FAIL: zoom in should clamp to 3.0, got" << s;
            success = false;
        }
        qDebug() << "  - Zoom in clamp: OK";
    }

    // Repeated zoom out converges to exactly the minimum
    {
        qreal s = 1.0;
        for (int i = 0; i < 50; ++i) {
            s = CanvasTransform::zoomOut(s);
        }
        if (s != CanvasTransform::MIN_SCALE) {
            qDebug() << "FAIL: zoom out should clamp to 0.1, got" << s;
            success = false;
        }
        qDebug() << "  - Zoom out clamp: OK";
    }

    return success;
}

/**
 * @brief A resize refits only while no explicit zoom has happened.
 */
inline bool testFitMode()
{
    qDebug() << "=== Test: Fit Mode ===";
    bool success = true;

    CanvasTransform t;
    t.setImageSize(QSize(1600, 1200));
    if (!qFuzzyCompare(t.scale(), 0.5) || !t.isFitMode()) {
        qDebug() << "FAIL: 1600x1200 in default 800x600 should fit at 0.5, got" << t.scale();
        success = false;
    }

    // Resize while fitted: refit
    if (!t.setViewportSize(QSizeF(400, 300))) {
        qDebug() << "FAIL: resize in fit mode should report a scale change";
        success = false;
    }
    if (!qFuzzyCompare(t.scale(), 0.25)) {
        qDebug() << "FAIL: refit should give 0.25, got" << t.scale();
        success = false;
    }
    qDebug() << "  - Resize refits: OK";

    // After an explicit zoom, resize leaves the scale alone
    t.zoomIn();
    const qreal zoomed = t.scale();
    if (t.isFitMode()) {
        qDebug() << "FAIL: zoom should leave fit mode";
        success = false;
    }
    if (t.setViewportSize(QSizeF(1600, 1200)) || !qFuzzyCompare(t.scale(), zoomed)) {
        qDebug() << "FAIL: resize after zoom should not change the scale";
        success = false;
    }
    qDebug() << "  - Zoom survives resize: OK";

    // Explicit refit re-enters fit mode
    t.fitToViewport();
    if (!t.isFitMode() || !qFuzzyCompare(t.scale(), 1.0)) {
        qDebug() << "FAIL: fitToViewport should restore fit mode at 1.0, got" << t.scale();
        success = false;
    }
    qDebug() << "  - Refit: OK";

    // clearImage resets
    t.clearImage();
    if (t.hasImage() || !qFuzzyCompare(t.scale(), 1.0) || !t.imageRect().isNull()) {
        qDebug() << "FAIL: clearImage should reset scale and image rect";
        success = false;
    }
    qDebug() << "  - Clear image: OK";

    return success;
}

/**
 * @brief imageRect() and canvasPosition().
 */
inline bool testMapping()
{
    qDebug() << "=== Test: Mapping ===";
    bool success = true;

    CanvasTransform t;
    t.setImageSize(QSize(400, 200));

    if (t.imageRect() != QRectF(0, 0, 400, 200)) {
        qDebug() << "FAIL: imageRect at scale 1.0 should be 400x200, got" << t.imageRect();
        success = false;
    }

    const std::optional<QPointF> inside = t.canvasPosition(QPointF(120, 80));
    if (!inside || *inside != QPointF(120, 80)) {
        qDebug() << "FAIL: (120,80) should map to itself";
        success = false;
    }

    if (t.canvasPosition(QPointF(-5, 10)) || t.canvasPosition(QPointF(10, 900))) {
        qDebug() << "FAIL: points outside the viewport should not map";
        success = false;
    }
    qDebug() << "  - Position mapping: OK";

    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running CanvasTransform Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testFitScale();
    qDebug() << "";

    allPass &= testZoom();
    qDebug() << "";

    allPass &= testFitMode();
    qDebug() << "";

    allPass &= testMapping();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL CANVAS TRANSFORM TESTS PASSED!";
    } else {
        qDebug() << "SOME CANVAS TRANSFORM TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace CanvasTransformTests
