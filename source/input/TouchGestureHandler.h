#pragma once

// ============================================================================
// TouchGestureHandler - Clean Break + Hysteresis
// ============================================================================
// Translates raw QTouchEvent sequences into viewport InputEvents:
// - 1 finger  = pointer drag (pan), only in Full mode
// - 2 fingers = pinch gesture (GestureStart/Change/End)
// - Clean break on finger count change (end gesture, clear state, start fresh)
// - Hysteresis: require N stable frames before changing gesture modes
// ============================================================================

#include <QObject>
#include <QPointF>

class QTouchEvent;
class InputArbiter;
struct InputEvent;

enum class TouchGestureMode {
    Disabled,     // Touch gestures completely off
    PinchOnly,    // Two-finger pinch only, one finger is left to the drawing engine
    Full          // Pinch plus one-finger pan
};

class TouchGestureHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct a touch gesture handler.
     * @param arbiter Receives the translated events (not owned).
     * @param parent QObject parent for memory management.
     */
    explicit TouchGestureHandler(InputArbiter* arbiter, QObject* parent = nullptr);
    ~TouchGestureHandler() override = default;

    /**
     * @brief Handle a touch event.
     * @param event The touch event to process.
     * @param toHost Offset from the receiving widget to the host widget.
     * @return True if event was handled, false to pass through.
     */
    bool handleTouchEvent(QTouchEvent* event, QPointF toHost = QPointF());

    /**
     * @brief Set the touch gesture mode. Ends any active gesture if the mode changes.
     */
    void setMode(TouchGestureMode mode);
    TouchGestureMode mode() const { return m_mode; }

    bool isActive() const { return m_gestureType != GestureType::None; }

    /**
     * @brief Force reset all gesture state.
     * Call this on detach, hideEvent, etc. to prevent stale state.
     */
    void resetAllState();

private:
    // ===== Gesture Type =====
    enum class GestureType {
        None,       // No gesture active
        OneFinger,  // 1-finger pan
        TwoFinger   // 2-finger pinch
    };

    InputArbiter* m_arbiter;  ///< Event sink (not owned)

    TouchGestureMode m_mode = TouchGestureMode::Full;
    GestureType m_gestureType = GestureType::None;

    // ===== Hysteresis State =====
    int m_pendingFingerCount = 0;       ///< The finger count we're transitioning to
    int m_hysteresisCounter = 0;        ///< How many frames we've seen this count
    static constexpr int HYSTERESIS_THRESHOLD = 3;  ///< Frames required before mode switch

    // After ending a gesture via hysteresis (e.g., 2->1 finger), don't immediately
    // start a new gesture. Wait for a fresh TouchBegin to avoid stale position data.
    bool m_waitingForFreshTouch = false;

    // ===== 1-Finger State =====
    QPointF m_lastPanPosition;

    // ===== 2-Finger State =====
    QPointF m_startCentroid;            ///< Anchor for the whole pinch
    qreal m_startDistance = 0;

    // Scale dead zone: treat scale values within this range of 1.0 as exactly 1.0
    static constexpr qreal ZOOM_SCALE_DEAD_ZONE = 0.002;

    // ===== Helper Methods =====
    void endGesture(bool cancelled);
    void beginOneFinger(QPointF position);
    void updateOneFinger(QPointF position);
    void beginTwoFinger(QPointF p1, QPointF p2);
    void updateTwoFinger(QPointF p1, QPointF p2);
    bool dispatch(const InputEvent& event);
};
