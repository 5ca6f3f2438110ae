#pragma once

// ============================================================================
// ViewportMath - Pure coordinate math for the camera engine
// ============================================================================
// No state, no I/O. Every input is sanitized here: a zero or non-finite scale
// becomes 1, a non-finite scroll becomes 0. Nothing in this file throws.
// ============================================================================

#include "CameraState.h"
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <optional>

namespace ViewportMath {

// ===== Tuning defaults =====
// Empirical values; callers pass their configured value where one exists.

constexpr qreal DEFAULT_DEVIATION_EPSILON = 0.02;     ///< Relative fit deviation
constexpr qreal DEFAULT_SIGNIFICANCE_EPSILON = 0.002; ///< Minimum scale change worth a write
constexpr qreal DEFAULT_WHEEL_SENSITIVITY = 0.0005;   ///< Per normalized wheel pixel
constexpr qreal DEFAULT_ZOOM_STEP = 0.08;             ///< Discrete zoom step (8%)
constexpr qreal SNAP_TO_ZERO_PX = 0.5;
constexpr qreal WHEEL_LINE_HEIGHT_PX = 16.0;

/**
 * @brief Units of a wheel delta.
 */
enum class DeltaMode {
    Pixel,
    Line,
    Page
};

// ===== Sanitizers =====

/**
 * @brief Returns value if it is a usable scale (finite, > 0), else fallback.
 * A non-usable fallback degrades to 1.
 */
qreal sanitizeScale(qreal value, qreal fallback = 1.0);

/**
 * @brief Returns value if finite, else 0.
 */
qreal sanitizeScroll(qreal value);

/**
 * @brief Clamp a scale into the constraint range (after sanitizing it).
 */
qreal clampScale(qreal scale, const CameraConstraints& constraints);

// ===== Transforms =====

/**
 * @brief world = scroll + (client - origin) / scale
 */
QPointF screenToWorld(QPointF clientPoint, QPointF viewportOrigin, const ViewState& camera);

/**
 * @brief Inverse of screenToWorld.
 */
QPointF worldToScreen(QPointF worldPoint, QPointF viewportOrigin, const ViewState& camera);

/**
 * @brief Clamp scroll into [-gutter, max(0, contentSize * scale - viewportSize) + gutter].
 *
 * Values within half a pixel of zero snap to exactly zero.
 */
QPointF clampScroll(qreal scrollX, qreal scrollY, qreal scale,
                    QSizeF viewportSize, QSizeF contentSize, qreal gutter = 0.0);

/**
 * @brief clampScroll evaluated in world units.
 *
 * Equivalent to clampScroll(x, y, 1, viewportSize / scale, contentSize, gutter),
 * i.e. the maximum scroll is max(0, content - viewport / scale).
 */
QPointF clampWorldScroll(qreal scrollX, qreal scrollY, qreal scale,
                         QSizeF viewportSize, QSizeF contentSize, qreal gutter = 0.0);

/**
 * @brief Solve the scroll that keeps the world point under clientPoint fixed
 * while the scale changes to newScale.
 *
 * This is the one zoom-anchoring routine. Wheel, pinch, keyboard and
 * programmatic zoom all go through it.
 *
 * @param viewportRect Viewport rectangle in the same space as clientPoint.
 *        Its top-left is the origin; its size is used for clamping.
 * @param contentSize When set, the result is clamped with clampWorldScroll.
 */
ViewState zoomAtClientPoint(QPointF clientPoint, qreal newScale,
                            const ViewState& current, const QRectF& viewportRect,
                            std::optional<QSizeF> contentSize = std::nullopt,
                            qreal gutter = 0.0);

/**
 * @brief The visual transform for a camera.
 */
ViewTransform viewTransform(const ViewState& camera);

// ===== Fit =====

/**
 * @brief (viewport.width - padding) / page.width, clamped to constraints.
 *
 * Returns 1 (clamped) when the page width is not usable.
 */
qreal computeFitScale(QSizeF viewportSize, QSizeF pageSize, qreal paddingPx,
                      const CameraConstraints& constraints = CameraConstraints());

/**
 * @brief |current - fit| / fit, or 0 when fit is not positive.
 */
qreal fitDeviation(qreal currentScale, qreal fitScale);

/**
 * @brief True when the relative deviation from the fit scale exceeds epsilon.
 */
bool hasDeviatedFromFit(qreal currentScale, qreal fitScale,
                        qreal epsilon = DEFAULT_DEVIATION_EPSILON);

// ===== Zoom curves =====

/**
 * @brief Wheel sensitivity per normalized pixel. Larger when zoomed out,
 * smaller when zoomed in, so zoom feels perceptually even.
 */
qreal getAdaptiveZoomSensitivity(qreal scale, qreal baseSensitivity = DEFAULT_WHEEL_SENSITIVITY);

/**
 * @brief Discrete zoom step (fraction) for keyboard/button zoom.
 */
qreal getAdaptiveZoomStep(qreal scale, qreal baseStep = DEFAULT_ZOOM_STEP);

/**
 * @brief Change filter. Callers skip the camera write when this is false.
 */
bool isSignificantScaleChange(qreal oldScale, qreal newScale,
                              qreal epsilon = DEFAULT_SIGNIFICANCE_EPSILON);

/**
 * @brief Apply ticks multiplicatively with the adaptive step, then clamp.
 */
qreal applyZoomTicks(qreal currentScale, int ticks, qreal minScale, qreal maxScale,
                     qreal baseStep = DEFAULT_ZOOM_STEP);

/**
 * @brief Convert a wheel delta to pixels.
 * @param pageHeightPx Height used for DeltaMode::Page (the viewport height).
 */
qreal normalizedWheelDelta(qreal delta, DeltaMode mode, qreal pageHeightPx);

} // namespace ViewportMath
