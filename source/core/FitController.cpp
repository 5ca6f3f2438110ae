#include "FitController.h"
#include "CameraStore.h"
#include "ViewportMath.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QEasingCurve>
#include <QVariantAnimation>

// ============================================================================
// FitHysteresisCounter
// ============================================================================

FitHysteresisCounter::FitHysteresisCounter(int threshold, qint64 windowMs)
    : m_threshold(qMax(1, threshold))
    , m_windowMs(qMax<qint64>(0, windowMs))
{
}

bool FitHysteresisCounter::registerNudge(qint64 nowMs)
{
    if (m_nudgeCount > 0 && nowMs - m_lastNudgeTimeMs > m_windowMs) {
        m_nudgeCount = 0;
    }

    ++m_nudgeCount;
    m_lastNudgeTimeMs = nowMs;
    return m_nudgeCount >= m_threshold;
}

void FitHysteresisCounter::reset()
{
    m_nudgeCount = 0;
    m_lastNudgeTimeMs = 0;
}

// ============================================================================
// FitController
// ============================================================================

FitController::FitController(CameraStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    m_clock = []() {
        static QElapsedTimer timer;
        if (!timer.isValid()) {
            timer.start();
        }
        return timer.elapsed();
    };

    m_animation = new QVariantAnimation(this);
    m_animation->setStartValue(0.0);
    m_animation->setEndValue(1.0);
    m_animation->setEasingCurve(QEasingCurve::OutQuad);

    connect(m_animation, &QVariantAnimation::valueChanged, this, [this](const QVariant& value) {
        if (!m_store || m_animation->state() != QAbstractAnimation::Running) {
            return;
        }
        const qreal t = value.toReal();
        ViewState frame;
        frame.scale = m_animFrom.scale + (m_animTo.scale - m_animFrom.scale) * t;
        frame.scrollX = m_animFrom.scrollX + (m_animTo.scrollX - m_animFrom.scrollX) * t;
        frame.scrollY = m_animFrom.scrollY + (m_animTo.scrollY - m_animFrom.scrollY) * t;
        m_store->setViewState(frame, WriteOptions{m_animForce, WriteOrigin::Auto});
    });

    connect(m_animation, &QVariantAnimation::finished, this, [this]() {
        if (!m_store) {
            return;
        }
        // Land exactly on the target; easing frames may stop short of t = 1
        m_store->setViewState(m_animTo, WriteOptions{m_animForce, WriteOrigin::Auto});
        emit fitApplied(m_animTo);
    });

    setConfig(m_config);
}

FitController::~FitController()
{
    stopAnimation();
}

void FitController::setConfig(const FitConfig& config)
{
    m_config = config;
    m_hysteresis.setThreshold(config.nudgeThreshold);
    m_hysteresis.setWindowMs(config.nudgeWindowMs);
}

void FitController::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

qint64 FitController::now() const
{
    return m_clock();
}

// ===== Fit target =====

qreal FitController::liveFitScale() const
{
    if (!m_store) {
        return 1.0;
    }
    const CameraState& s = m_store->state();
    return ViewportMath::computeFitScale(s.viewportSize, s.pageSize, m_config.fitPadding, s.constraints);
}

ViewState FitController::fitTarget(qreal scrollY) const
{
    ViewState target;
    target.scale = liveFitScale();
    target.scrollY = ViewportMath::sanitizeScroll(scrollY);

    if (m_store) {
        const CameraState& s = m_store->state();
        // Page centre under viewport centre
        const qreal visibleWorldWidth = s.viewportSize.width() / target.scale;
        target.scrollX = s.virtualSize.width() / 2.0 - visibleWorldWidth / 2.0;
    }
    return target;
}

// ===== Lifecycle =====

bool FitController::mount()
{
    if (!m_store || m_appliedOnce) {
        return false;
    }
    if (!m_store->state().viewportReady) {
#if FOLIOVIEW_DEBUG
        qDebug() << "[center-apply] deferred: viewport not measured yet";
#endif
        return false;
    }

    const ViewState target = fitTarget(0.0);
    CameraPatch patch = CameraPatch::fromViewState(target);
    patch.fitMode = FitMode::FitWidth;
    m_store->set(patch, WriteOptions{true, WriteOrigin::Auto});

    m_appliedOnce = true;

#if FOLIOVIEW_DEBUG
    qDebug() << "[center-apply]" << target.scale << target.scrollX << target.scrollY;
#endif

    emit fitApplied(target);
    return true;
}

// ===== Events from input arbitration =====

bool FitController::noteManualZoom(qreal newScale)
{
    stopAnimation();

    if (!m_store || m_store->fitMode() != FitMode::FitWidth) {
        return false;
    }

    const qreal fit = liveFitScale();
    if (!ViewportMath::hasDeviatedFromFit(newScale, fit, m_config.deviationEpsilon)) {
        return false;
    }

    const bool reached = m_hysteresis.registerNudge(now());

#if FOLIOVIEW_DEBUG
    qDebug() << "[fit] nudge" << m_hysteresis.nudgeCount() << "/" << m_hysteresis.threshold()
             << "deviation" << ViewportMath::fitDeviation(newScale, fit);
#endif

    if (!reached) {
        return false;
    }

    m_hysteresis.reset();
    m_store->setFitMode(FitMode::Free);

#if FOLIOVIEW_DEBUG
    qDebug() << "[fit] fit-width -> free";
#endif
    return true;
}

bool FitController::onViewportResized()
{
    if (!m_store) {
        return false;
    }
    if (!m_appliedOnce) {
        return mount();
    }
    if (m_suspended || m_store->fitMode() != FitMode::FitWidth) {
        return false;
    }

#if FOLIOVIEW_DEBUG
    qDebug() << "[center-resize-anim]" << liveFitScale();
#endif
    return applyFit(false, true);
}

// ===== Commands =====

bool FitController::fitWidth()
{
    if (!m_store) {
        return false;
    }
    m_hysteresis.reset();
    m_store->setFitMode(FitMode::FitWidth);
    return applyFit(true, true);
}

bool FitController::recenter()
{
    if (!m_store) {
        return false;
    }
    resume();
    m_hysteresis.reset();
    m_store->setFitMode(FitMode::FitWidth);

#if FOLIOVIEW_DEBUG
    qDebug() << "[center-resume]";
#endif

    m_appliedOnce = m_appliedOnce || m_store->state().viewportReady;
    return applyFit(fitTarget(0.0), true, true);
}

// ===== Suspension =====

void FitController::suspend(const QString& reason)
{
    stopAnimation();
    if (m_suspended) {
        return;
    }
    m_suspended = true;
    if (m_store) {
        m_store->setAutoWritesSuspended(true);
    }

#if FOLIOVIEW_DEBUG
    qDebug() << "[center-pause]" << reason;
#else
    Q_UNUSED(reason);
#endif

    emit suspendedChanged(true);
}

void FitController::resume()
{
    if (!m_suspended) {
        return;
    }
    m_suspended = false;
    if (m_store) {
        m_store->setAutoWritesSuspended(false);
    }
    emit suspendedChanged(false);
}

bool FitController::applyFit(bool force, bool animate)
{
    if (!m_store) {
        return false;
    }
    return applyFit(fitTarget(m_store->state().scrollY), force, animate);
}

bool FitController::applyFit(const ViewState& target, bool force, bool animate)
{
    if (!m_store) {
        return false;
    }
    if (!force && m_suspended) {
        return false;
    }

    stopAnimation();

    if (!animate || m_config.animationMs <= 0) {
        m_store->setViewState(target, WriteOptions{force, WriteOrigin::Auto});
        emit fitApplied(target);
        return true;
    }

    m_animFrom = m_store->viewState();
    m_animTo = target;
    m_animForce = force;
    m_animation->setDuration(m_config.animationMs);
    m_animation->start();
    return true;
}

bool FitController::isAnimating() const
{
    return m_animation && m_animation->state() == QAbstractAnimation::Running;
}

void FitController::stopAnimation()
{
    if (isAnimating()) {
        // stop() does not emit finished(), so the target is not written
        m_animation->stop();
    }
}
