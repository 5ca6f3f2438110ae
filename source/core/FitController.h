#pragma once

// ============================================================================
// FitController - Fit-width / free state machine with hysteresis
// ============================================================================
// Two orthogonal axes:
//   - mode (stored in CameraStore): FitWidth or Free
//   - suspension (owned here): set by any user interaction, cleared only by
//     resume()/recenter(). While suspended the automatic re-fit is skipped.
//
// FitWidth -> Free only after N qualifying deviations within a rolling window.
// Free -> FitWidth only through fitWidth()/recenter().
// ============================================================================

#include "CameraState.h"

#include <QObject>
#include <QPointer>
#include <QString>
#include <functional>

class CameraStore;
class QVariantAnimation;

/**
 * @brief Counts zoom writes that deviate from the fit scale.
 *
 * The count restarts when more than windowMs elapses between two nudges.
 * Time is always passed in, so tests drive it deterministically.
 */
class FitHysteresisCounter
{
public:
    explicit FitHysteresisCounter(int threshold = 3, qint64 windowMs = 2000);

    /**
     * @brief Record one qualifying deviation at nowMs.
     * @return true when the count has reached the threshold.
     */
    bool registerNudge(qint64 nowMs);

    void reset();

    int nudgeCount() const { return m_nudgeCount; }
    qint64 lastNudgeTimeMs() const { return m_lastNudgeTimeMs; }

    void setThreshold(int threshold) { m_threshold = qMax(1, threshold); }
    int threshold() const { return m_threshold; }
    void setWindowMs(qint64 windowMs) { m_windowMs = qMax<qint64>(0, windowMs); }
    qint64 windowMs() const { return m_windowMs; }

private:
    int m_threshold;
    qint64 m_windowMs;
    int m_nudgeCount = 0;
    qint64 m_lastNudgeTimeMs = 0;
};

/**
 * @brief Tuning for the fit controller. Defaults match ViewportSettings.
 */
struct FitConfig {
    qreal fitPadding = 80.0;          ///< Horizontal padding subtracted from the viewport (px)
    qreal deviationEpsilon = 0.02;    ///< Relative deviation that counts as a nudge
    int nudgeThreshold = 3;
    qint64 nudgeWindowMs = 2000;
    int animationMs = 200;            ///< 0 applies fit writes immediately
};

class FitController : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<qint64()>;

    explicit FitController(CameraStore* store, QObject* parent = nullptr);
    ~FitController() override;

    void setConfig(const FitConfig& config);
    const FitConfig& config() const { return m_config; }

    /**
     * @brief Replace the time source (milliseconds, monotonic). Tests only.
     */
    void setClock(Clock clock);

    // ===== Fit target =====

    /**
     * @brief computeFitScale for the store's current viewport and page.
     */
    qreal liveFitScale() const;

    /**
     * @brief The fit camera: fit scale, page horizontally centred.
     * @param scrollY World Y to keep at the top of the viewport.
     */
    ViewState fitTarget(qreal scrollY) const;

    // ===== Lifecycle =====

    /**
     * @brief Apply the fit camera once, forced and without animation.
     *
     * Does nothing until the store reports a ready viewport, and nothing after
     * the first successful mount.
     * @return true if the camera was applied by this call.
     */
    bool mount();
    bool hasMounted() const { return m_appliedOnce; }

    // ===== Events from input arbitration =====

    /**
     * @brief Feed one zoom write into the hysteresis.
     *
     * Must be called for every zoom write, regardless of input source, before
     * the write lands. Stops any running fit animation.
     * @return true if this nudge switched the store to Free.
     */
    bool noteManualZoom(qreal newScale);

    /**
     * @brief Re-fit after the store's viewport size changed.
     *
     * Mounts first if needed. In FitWidth re-applies the fit scale (animated)
     * keeping scrollY. In Free the store has already re-clamped scroll.
     * @return true if a camera write was issued.
     */
    bool onViewportResized();

    // ===== Commands =====

    /**
     * @brief Enter FitWidth and apply the fit camera (forced, animated).
     */
    bool fitWidth();

    /**
     * @brief Resume, enter FitWidth, reset the hysteresis and re-apply the fit
     * camera from the top of the canvas.
     */
    bool recenter();

    // ===== Suspension =====

    /**
     * @brief Mark the user as interacting. Not cleared automatically.
     * @param reason Short tag for the debug log ("wheel", "key:+", ...).
     */
    void suspend(const QString& reason);
    void resume();
    bool isSuspended() const { return m_suspended; }

    /**
     * @brief Write the fit camera through the Auto path.
     * @param force Bypass suspension.
     * @param animate Ease into the target over config().animationMs.
     * @return true if the camera was written (or an animation started).
     */
    bool applyFit(bool force, bool animate);
    bool applyFit(const ViewState& target, bool force, bool animate);

    bool isAnimating() const;
    void stopAnimation();

    const FitHysteresisCounter& hysteresis() const { return m_hysteresis; }

signals:
    void suspendedChanged(bool suspended);

    /**
     * @brief Emitted when a fit camera lands (end of animation or immediate write).
     */
    void fitApplied(const ViewState& target);

private:
    qint64 now() const;

    QPointer<CameraStore> m_store;
    FitConfig m_config;
    FitHysteresisCounter m_hysteresis;
    Clock m_clock;

    bool m_appliedOnce = false;
    bool m_suspended = false;

    // ===== Animation =====
    QVariantAnimation* m_animation = nullptr;
    ViewState m_animFrom;
    ViewState m_animTo;
    bool m_animForce = false;
};
