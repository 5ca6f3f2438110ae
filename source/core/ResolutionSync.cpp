#include "ResolutionSync.h"
#include "CameraStore.h"
#include "ViewportMath.h"

#include <QDebug>
#include <cmath>

// Two results closer than this in effective DPR are the same backing store.
// The camera scale is part of the key too, since a clamped size stays the same
// across scales.
static constexpr qreal DPR_DEDUPE_EPSILON = 0.01;

ResolutionSync::ResolutionSync(CameraStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    if (m_store) {
        connect(m_store, &CameraStore::scaleChanged, this, [this]() { refresh(); });
        connect(m_store, &CameraStore::geometryChanged, this, [this]() { refresh(); });
    }
}

PhysicalResolution ResolutionSync::compute(QSizeF pageSize, qreal scale, qreal devicePixelRatio,
                                           const DeviceLimits& limits)
{
    const qreal safeScale = ViewportMath::sanitizeScale(scale);
    const qreal safeDpr = ViewportMath::sanitizeScale(devicePixelRatio);

    PhysicalResolution result;
    result.scale = safeScale;

    if (pageSize.width() <= 0 || pageSize.height() <= 0) {
        result.effectiveDpr = safeScale * safeDpr;
        return result;
    }

    const qreal rawW = pageSize.width() * safeScale * safeDpr;
    const qreal rawH = pageSize.height() * safeScale * safeDpr;

    // Smallest reduction that satisfies every limit
    qreal ratio = 1.0;
    if (rawW > limits.maxWidth) {
        ratio = qMin(ratio, limits.maxWidth / rawW);
    }
    if (rawH > limits.maxHeight) {
        ratio = qMin(ratio, limits.maxHeight / rawH);
    }
    if (rawW * rawH > limits.maxPixels) {
        ratio = qMin(ratio, std::sqrt(limits.maxPixels / (rawW * rawH)));
    }

    if (ratio < 1.0) {
        result.width = qMax(1, static_cast<int>(std::floor(rawW * ratio)));
        result.height = qMax(1, static_cast<int>(std::floor(rawH * ratio)));
        result.clamped = true;
    } else {
        result.width = qRound(rawW);
        result.height = qRound(rawH);
    }

    result.effectiveDpr = safeScale * safeDpr * ratio;
    return result;
}

void ResolutionSync::setDevicePixelRatio(qreal dpr)
{
    const qreal safe = ViewportMath::sanitizeScale(dpr);
    if (qFuzzyCompare(safe, m_dpr)) {
        return;
    }
    m_dpr = safe;
    refresh();
}

void ResolutionSync::setLimits(const DeviceLimits& limits)
{
    m_limits = limits;
    m_warnedClamp = false;
    refresh();
}

bool ResolutionSync::refresh()
{
    if (!m_store) {
        return false;
    }

    const CameraState& s = m_store->state();
    const PhysicalResolution next = compute(s.pageSize, s.scale, m_dpr, m_limits);

    if (m_hasPublished &&
        next.width == m_current.width &&
        next.height == m_current.height &&
        qFuzzyCompare(next.scale, m_current.scale) &&
        qAbs(next.effectiveDpr - m_current.effectiveDpr) < DPR_DEDUPE_EPSILON) {
        return false;
    }

    if (next.clamped && !m_warnedClamp) {
        qWarning() << "ResolutionSync: backing store clamped to" << next.width << "x" << next.height
                   << "(scale" << next.scale << "dpr" << m_dpr << ")";
        m_warnedClamp = true;
    } else if (!next.clamped) {
        m_warnedClamp = false;
    }

    m_current = next;
    m_hasPublished = true;

#if FOLIOVIEW_DEBUG
    qDebug() << "[CanvasResolution]" << m_current.width << "x" << m_current.height
             << "effectiveDpr" << m_current.effectiveDpr;
#endif

    emit resolutionChanged(m_current);
    return true;
}
