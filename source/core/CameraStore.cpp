#include "CameraStore.h"
#include "ViewportMath.h"

#include <QDebug>
#include <QtMath>
#include <cmath>

// ===== Construction =====

CameraStore::CameraStore(QObject* parent)
    : CameraStore(CameraState(), parent)
{
}

CameraStore::CameraStore(const CameraState& initial, QObject* parent)
    : QObject(parent)
{
    // Run the initial state through the same sanitizing path as every write
    m_state.constraints = repairedConstraints(initial.constraints, CameraConstraints());

    CameraPatch patch;
    patch.pageSize = initial.pageSize;
    patch.pageMargin = initial.pageMargin;
    patch.scrollGutter = initial.scrollGutter;
    patch.viewportSize = initial.viewportSize;
    patch.fitMode = initial.fitMode;
    patch.scale = initial.scale;
    patch.scrollX = initial.scrollX;
    patch.scrollY = initial.scrollY;
    set(patch, WriteOptions{true, WriteOrigin::User});
}

// ===== Read =====

int CameraStore::zoomPercent() const
{
    return qRound(m_state.scale * 100.0);
}

QSizeF CameraStore::scaledPageSize() const
{
    return m_state.pageSize * m_state.scale;
}

// ===== Write =====

bool CameraStore::set(const CameraPatch& patch, const WriteOptions& options)
{
    if (options.origin == WriteOrigin::Auto && m_autoSuspended && !options.force) {
#if FOLIOVIEW_DEBUG
        qDebug() << "[camera-store] auto write dropped while suspended";
#endif
        return false;
    }

    const CameraState previous = m_state;
    CameraState next = m_state;

    // ----- Geometry -----
    if (patch.constraints) {
        next.constraints = repairedConstraints(*patch.constraints, previous.constraints);
    }

    if (patch.pageSize) {
        const QSizeF size = *patch.pageSize;
        if (std::isfinite(size.width()) && std::isfinite(size.height()) &&
            size.width() > 0 && size.height() > 0) {
            next.pageSize = size;
        } else {
            qWarning() << "CameraStore: ignoring invalid page size" << size;
        }
    }

    if (patch.pageMargin) {
        const qreal margin = *patch.pageMargin;
        next.pageMargin = (std::isfinite(margin) && margin >= 0) ? margin : previous.pageMargin;
    }

    if (patch.scrollGutter) {
        const qreal gutter = *patch.scrollGutter;
        next.scrollGutter = (std::isfinite(gutter) && gutter >= 0) ? gutter : previous.scrollGutter;
    }

    next.virtualSize = QSizeF(next.pageSize.width() + 2 * next.pageMargin,
                              next.pageSize.height() + 2 * next.pageMargin);

    if (patch.viewportSize) {
        const QSizeF size = *patch.viewportSize;
        const qreal w = std::isfinite(size.width()) ? qMax<qreal>(0.0, size.width()) : 0.0;
        const qreal h = std::isfinite(size.height()) ? qMax<qreal>(0.0, size.height()) : 0.0;
        next.viewportSize = QSizeF(w, h);
        if (w > 0 && h > 0) {
            next.viewportReady = true;
        }
    }

    if (patch.fitMode) {
        next.fitMode = *patch.fitMode;
    }

    // ----- Camera -----
    // A non-usable requested scale falls back to the previous valid scale
    const qreal requestedScale = patch.scale
        ? ViewportMath::sanitizeScale(*patch.scale, previous.scale)
        : previous.scale;
    next.scale = ViewportMath::clampScale(requestedScale, next.constraints);

    const qreal requestedX = patch.scrollX ? ViewportMath::sanitizeScroll(*patch.scrollX) : previous.scrollX;
    const qreal requestedY = patch.scrollY ? ViewportMath::sanitizeScroll(*patch.scrollY) : previous.scrollY;

    const QPointF clamped = ViewportMath::clampWorldScroll(requestedX, requestedY, next.scale,
                                                           next.viewportSize, next.virtualSize,
                                                           next.scrollGutter);
    next.scrollX = clamped.x();
    next.scrollY = clamped.y();

    // ----- Change detection -----
    const bool scaleDiffers = !sameValue(previous.scale, next.scale);
    const bool fitModeDiffers = previous.fitMode != next.fitMode;
    const bool geometryDiffers = !sameSize(previous.pageSize, next.pageSize) ||
                                 !sameValue(previous.pageMargin, next.pageMargin) ||
                                 !sameValue(previous.scrollGutter, next.scrollGutter);
    const bool becameReady = !previous.viewportReady && next.viewportReady;

    const bool anyChange = scaleDiffers || fitModeDiffers || geometryDiffers || becameReady ||
                           !sameValue(previous.scrollX, next.scrollX) ||
                           !sameValue(previous.scrollY, next.scrollY) ||
                           !sameSize(previous.viewportSize, next.viewportSize) ||
                           previous.constraints != next.constraints;

    if (!anyChange) {
        return false;
    }

    m_state = next;

#if FOLIOVIEW_DEBUG
    qDebug() << "[camera-store] scale" << m_state.scale
             << "scroll" << m_state.scrollX << m_state.scrollY
             << "mode" << (m_state.fitMode == FitMode::FitWidth ? "fit-width" : "free")
             << (options.origin == WriteOrigin::Auto ? "(auto)" : "(user)");
#endif

    emit changed(m_state);
    if (scaleDiffers) {
        emit scaleChanged(m_state.scale);
    }
    if (fitModeDiffers) {
        emit fitModeChanged(m_state.fitMode);
    }
    if (geometryDiffers) {
        emit geometryChanged();
    }
    if (becameReady) {
        emit viewportReady();
    }
    return true;
}

bool CameraStore::setScale(qreal scale, WriteOrigin origin)
{
    CameraPatch patch;
    patch.scale = scale;
    return set(patch, WriteOptions{false, origin});
}

bool CameraStore::setViewState(const ViewState& view, const WriteOptions& options)
{
    return set(CameraPatch::fromViewState(view), options);
}

bool CameraStore::pan(qreal dx, qreal dy)
{
    if (!m_state.constraints.enablePan) {
        return false;
    }
    if (!std::isfinite(dx) || !std::isfinite(dy)) {
        return false;
    }

    CameraPatch patch;
    patch.scrollX = m_state.scrollX + dx;
    patch.scrollY = m_state.scrollY + dy;
    return set(patch);
}

bool CameraStore::setViewportSize(QSizeF size)
{
    CameraPatch patch;
    patch.viewportSize = size;
    return set(patch);
}

bool CameraStore::setPageSize(QSizeF size)
{
    CameraPatch patch;
    patch.pageSize = size;
    return set(patch);
}

bool CameraStore::setPageMargin(qreal margin)
{
    CameraPatch patch;
    patch.pageMargin = margin;
    return set(patch);
}

bool CameraStore::setScrollGutter(qreal gutter)
{
    CameraPatch patch;
    patch.scrollGutter = gutter;
    return set(patch);
}

bool CameraStore::setConstraints(const CameraConstraints& constraints)
{
    CameraPatch patch;
    patch.constraints = constraints;
    return set(patch);
}

bool CameraStore::setFitMode(FitMode mode)
{
    CameraPatch patch;
    patch.fitMode = mode;
    return set(patch);
}

// ===== Subscription =====

QMetaObject::Connection CameraStore::subscribe(QObject* context,
                                               std::function<void(const CameraState&)> callback)
{
    if (!context || !callback) {
        return QMetaObject::Connection();
    }
    return connect(this, &CameraStore::changed, context, std::move(callback), Qt::DirectConnection);
}

void CameraStore::unsubscribe(const QMetaObject::Connection& connection)
{
    disconnect(connection);
}

// ===== Helpers =====

CameraConstraints CameraStore::repairedConstraints(const CameraConstraints& requested,
                                                   const CameraConstraints& previous)
{
    CameraConstraints result = requested;

    const bool minValid = std::isfinite(result.minScale) && result.minScale > 0;
    const bool maxValid = std::isfinite(result.maxScale) && result.maxScale > 0;
    if (!minValid) {
        result.minScale = previous.minScale;
    }
    if (!maxValid) {
        result.maxScale = previous.maxScale;
    }
    if (result.minScale > result.maxScale) {
        qWarning() << "CameraStore: minScale" << result.minScale
                   << "exceeds maxScale" << result.maxScale << "- swapping";
        qSwap(result.minScale, result.maxScale);
    }
    return result;
}

bool CameraStore::sameValue(qreal a, qreal b)
{
    return qAbs(a - b) <= 1e-9 * qMax<qreal>(1.0, qMax(qAbs(a), qAbs(b)));
}

bool CameraStore::sameSize(const QSizeF& a, const QSizeF& b)
{
    return sameValue(a.width(), b.width()) && sameValue(a.height(), b.height());
}
