#pragma once

// ============================================================================
// InputArbiter - Decides which input owns the camera
// ============================================================================
// Installed as an event filter on the viewport host and all of its descendants
// (ahead of the drawing engine's own handlers), plus an application-level key
// filter restricted to the host's window. Each Qt event is translated into an
// InputEvent, resolved with resolveIntent(), and applied:
//   - zoom   -> significance check -> zoomAtClientPoint -> fit hysteresis -> store
//   - pan    -> store.pan, then the drag baseline is re-measured
//   - resize -> debounce timer -> frame timer -> re-measure -> fit controller
// ============================================================================

#include "InputEvent.h"

#include <QObject>
#include <QPointer>
#include <QList>
#include <optional>

class QEvent;
class QKeyEvent;
class QMouseEvent;
class QNativeGestureEvent;
class QTimer;
class QWheelEvent;
class QWidget;
class CameraStore;
class FitController;
class TouchGestureHandler;

class InputArbiter : public QObject
{
    Q_OBJECT

public:
    explicit InputArbiter(CameraStore* store, FitController* fit, QObject* parent = nullptr);
    ~InputArbiter() override;

    // ===== Host =====

    /**
     * @brief Start arbitrating input for host.
     *
     * A null host logs a warning and leaves the arbiter idle.
     * @return true if attached.
     */
    bool attach(QWidget* host);

    /**
     * @brief Remove every filter, cancel timers, release capture and drop baselines.
     */
    void detach();

    QWidget* host() const { return m_host; }
    bool isAttached() const { return !m_host.isNull(); }

    // ===== Tool state =====

    void setActiveTool(ToolType tool);
    ToolType activeTool() const { return m_activeTool; }
    bool isSpacePanActive() const { return m_spacePanActive; }

    // ===== Tuning =====

    void setWheelBaseSensitivity(qreal value) { m_wheelBaseSensitivity = value; }
    void setKeyboardBaseStep(qreal value) { m_keyboardBaseStep = value; }
    void setSignificanceEpsilon(qreal value) { m_significanceEpsilon = value; }
    void setResizeDebounceMs(int ms);
    void setFrameIntervalMs(int ms);

    TouchGestureHandler* touchHandler() const { return m_touch; }

    // ===== Dispatch =====

    /**
     * @brief Resolve and apply one translated event.
     * @return true if the event should be consumed.
     */
    bool dispatch(const InputEvent& event);

    /**
     * @brief The shared zoom write path. Every zoom source ends here.
     * @param anchor Host coordinates that must stay over the same world point.
     * @return true if the camera changed.
     */
    bool zoomTo(qreal targetScale, QPointF anchor);

    /**
     * @brief Snapshot of what resolveIntent() sees right now.
     */
    ArbitrationContext context() const;

    bool isGestureActive() const;
    bool isDragging() const { return m_drag.has_value(); }

    // ===== Resize =====

    /**
     * @brief Restart the resize debounce. Pending work from an earlier resize is dropped.
     */
    void scheduleResize();
    bool isResizePending() const;

signals:
    /**
     * @brief Emitted by the resize frame after the viewport was re-measured.
     */
    void viewportRemeasured(QSizeF size);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    friend class WindowKeyFilter;

    void installOn(QWidget* widget);
    void removeFilters();

    bool handleWheel(QWidget* receiver, QWheelEvent* event);
    bool handleNativeGesture(QWidget* receiver, QNativeGestureEvent* event);
    bool handleMouse(QWidget* receiver, QMouseEvent* event);
    bool handleKey(QWidget* receiver, QKeyEvent* event);

    void applyIntent(const Intent& intent, const InputEvent& event);
    void releaseDrag();
    void updateCursor();

    QPointF toHost(QWidget* receiver, QPointF position) const;
    bool isOwnWidget(QObject* object) const;
    static bool isEditableFocus();

    void onResizeDebounced();
    void onResizeFrame();

    // ===== Collaborators =====
    QPointer<CameraStore> m_store;
    QPointer<FitController> m_fit;
    TouchGestureHandler* m_touch = nullptr;

    // ===== Host and filters =====
    QPointer<QWidget> m_host;
    QList<QPointer<QWidget>> m_filtered;
    QObject* m_keyFilter = nullptr;

    // ===== Gesture lifecycle =====
    std::optional<GestureBaseline> m_gesture;
    std::optional<DragBaseline> m_drag;
    qreal m_nativeGestureScale = 1.0;
    bool m_pointerCaptured = false;

    ToolType m_activeTool = ToolType::Select;
    bool m_spacePanActive = false;

    // ===== Tuning =====
    qreal m_wheelBaseSensitivity = ViewportMath::DEFAULT_WHEEL_SENSITIVITY;
    qreal m_keyboardBaseStep = ViewportMath::DEFAULT_ZOOM_STEP;
    qreal m_significanceEpsilon = ViewportMath::DEFAULT_SIGNIFICANCE_EPSILON;

    // ===== Resize scheduling =====
    QTimer* m_resizeDebounce = nullptr;
    QTimer* m_resizeFrame = nullptr;
    static constexpr int DEFAULT_RESIZE_DEBOUNCE_MS = 120;
    static constexpr int DEFAULT_FRAME_INTERVAL_MS = 16;   ///< ~60 FPS
};
