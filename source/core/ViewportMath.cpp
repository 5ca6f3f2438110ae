// ============================================================================
// ViewportMath - Implementation
// ============================================================================

#include "ViewportMath.h"

#include <QtMath>
#include <algorithm>
#include <cmath>

namespace ViewportMath {

// ===== Sanitizers =====

qreal sanitizeScale(qreal value, qreal fallback)
{
    if (std::isfinite(value) && value > 0) {
        return value;
    }
    if (std::isfinite(fallback) && fallback > 0) {
        return fallback;
    }
    return 1.0;
}

qreal sanitizeScroll(qreal value)
{
    return std::isfinite(value) ? value : 0.0;
}

qreal clampScale(qreal scale, const CameraConstraints& constraints)
{
    const qreal safe = sanitizeScale(scale);
    return qBound(constraints.minScale, safe, constraints.maxScale);
}

// ===== Transforms =====

QPointF screenToWorld(QPointF clientPoint, QPointF viewportOrigin, const ViewState& camera)
{
    const qreal scale = sanitizeScale(camera.scale);
    const qreal scrollX = sanitizeScroll(camera.scrollX);
    const qreal scrollY = sanitizeScroll(camera.scrollY);

    const QPointF local = clientPoint - viewportOrigin;
    return QPointF(scrollX + local.x() / scale, scrollY + local.y() / scale);
}

QPointF worldToScreen(QPointF worldPoint, QPointF viewportOrigin, const ViewState& camera)
{
    const qreal scale = sanitizeScale(camera.scale);
    const qreal scrollX = sanitizeScroll(camera.scrollX);
    const qreal scrollY = sanitizeScroll(camera.scrollY);

    return QPointF((worldPoint.x() - scrollX) * scale + viewportOrigin.x(),
                   (worldPoint.y() - scrollY) * scale + viewportOrigin.y());
}

QPointF clampScroll(qreal scrollX, qreal scrollY, qreal scale,
                    QSizeF viewportSize, QSizeF contentSize, qreal gutter)
{
    const qreal safeScale = sanitizeScale(scale);
    const qreal safeGutter = std::isfinite(gutter) ? qMax<qreal>(0.0, gutter) : 0.0;

    const qreal maxScrollX = qMax<qreal>(0.0, contentSize.width() * safeScale - viewportSize.width());
    const qreal maxScrollY = qMax<qreal>(0.0, contentSize.height() * safeScale - viewportSize.height());

    qreal x = qBound(-safeGutter, sanitizeScroll(scrollX), maxScrollX + safeGutter);
    qreal y = qBound(-safeGutter, sanitizeScroll(scrollY), maxScrollY + safeGutter);

    // Sub-pixel residue around the origin would otherwise drift forever
    if (qAbs(x) < SNAP_TO_ZERO_PX) x = 0.0;
    if (qAbs(y) < SNAP_TO_ZERO_PX) y = 0.0;

    return QPointF(x, y);
}

QPointF clampWorldScroll(qreal scrollX, qreal scrollY, qreal scale,
                         QSizeF viewportSize, QSizeF contentSize, qreal gutter)
{
    const qreal safeScale = sanitizeScale(scale);
    const QSizeF viewportWorld(viewportSize.width() / safeScale,
                               viewportSize.height() / safeScale);
    return clampScroll(scrollX, scrollY, 1.0, viewportWorld, contentSize, gutter);
}

ViewState zoomAtClientPoint(QPointF clientPoint, qreal newScale,
                            const ViewState& current, const QRectF& viewportRect,
                            std::optional<QSizeF> contentSize, qreal gutter)
{
    const qreal oldScale = sanitizeScale(current.scale);
    const qreal nextScale = sanitizeScale(newScale);
    const qreal prevScrollX = sanitizeScroll(current.scrollX);
    const qreal prevScrollY = sanitizeScroll(current.scrollY);

    const QPointF local = clientPoint - viewportRect.topLeft();

    // worldAnchor = scroll + local / oldScale; newScroll = worldAnchor - local / newScale
    const qreal worldX = prevScrollX + local.x() / oldScale;
    const qreal worldY = prevScrollY + local.y() / oldScale;

    ViewState result;
    result.scale = nextScale;
    result.scrollX = worldX - local.x() / nextScale;
    result.scrollY = worldY - local.y() / nextScale;

    if (contentSize) {
        const QPointF clamped = clampWorldScroll(result.scrollX, result.scrollY, nextScale,
                                                 viewportRect.size(), *contentSize, gutter);
        result.scrollX = clamped.x();
        result.scrollY = clamped.y();
    }

    return result;
}

ViewTransform viewTransform(const ViewState& camera)
{
    ViewTransform t;
    t.scale = sanitizeScale(camera.scale);
    t.offsetX = -sanitizeScroll(camera.scrollX) * t.scale;
    t.offsetY = -sanitizeScroll(camera.scrollY) * t.scale;
    return t;
}

// ===== Fit =====

qreal computeFitScale(QSizeF viewportSize, QSizeF pageSize, qreal paddingPx,
                      const CameraConstraints& constraints)
{
    if (!std::isfinite(pageSize.width()) || pageSize.width() <= 0) {
        return clampScale(1.0, constraints);
    }

    const qreal padding = std::isfinite(paddingPx) ? paddingPx : 0.0;
    const qreal available = viewportSize.width() - padding;
    if (!std::isfinite(available) || available <= 0) {
        return constraints.minScale;
    }

    return clampScale(available / pageSize.width(), constraints);
}

qreal fitDeviation(qreal currentScale, qreal fitScale)
{
    if (!std::isfinite(fitScale) || fitScale <= 0 || !std::isfinite(currentScale)) {
        return 0.0;
    }
    return qAbs(currentScale - fitScale) / fitScale;
}

bool hasDeviatedFromFit(qreal currentScale, qreal fitScale, qreal epsilon)
{
    return fitDeviation(currentScale, fitScale) > epsilon;
}

// ===== Zoom curves =====

qreal getAdaptiveZoomSensitivity(qreal scale, qreal baseSensitivity)
{
    const qreal s = sanitizeScale(scale);

    if (s < 0.25) {
        return baseSensitivity * 1.8;
    } else if (s < 0.5) {
        return baseSensitivity * 1.4;
    } else if (s < 2.0) {
        return baseSensitivity;
    } else if (s < 4.0) {
        return baseSensitivity * 0.7;
    }
    return baseSensitivity * 0.5;
}

qreal getAdaptiveZoomStep(qreal scale, qreal baseStep)
{
    const qreal s = sanitizeScale(scale);

    if (s < 0.25) {
        return baseStep * 1.25;
    } else if (s < 0.5) {
        return baseStep * 1.1;
    } else if (s < 2.0) {
        return baseStep;
    } else if (s < 4.0) {
        return baseStep * 0.75;
    }
    return baseStep * 0.5;
}

bool isSignificantScaleChange(qreal oldScale, qreal newScale, qreal epsilon)
{
    if (!std::isfinite(newScale)) {
        return false;
    }
    if (!std::isfinite(oldScale)) {
        return true;
    }
    return qAbs(newScale - oldScale) >= epsilon;
}

qreal applyZoomTicks(qreal currentScale, int ticks, qreal minScale, qreal maxScale, qreal baseStep)
{
    const qreal start = sanitizeScale(currentScale);
    if (ticks == 0) {
        return start;
    }

    const qreal step = getAdaptiveZoomStep(start, baseStep);
    qreal next = start;
    for (int i = 0; i < qAbs(ticks); ++i) {
        next = ticks > 0 ? next * (1.0 + step) : next / (1.0 + step);
    }

    return qBound(minScale, next, maxScale);
}

qreal normalizedWheelDelta(qreal delta, DeltaMode mode, qreal pageHeightPx)
{
    if (!std::isfinite(delta)) {
        return 0.0;
    }

    switch (mode) {
        case DeltaMode::Line:
            return delta * WHEEL_LINE_HEIGHT_PX;
        case DeltaMode::Page:
            return delta * (pageHeightPx > 0 ? pageHeightPx : 800.0);
        case DeltaMode::Pixel:
            break;
    }
    return delta;
}

} // namespace ViewportMath
