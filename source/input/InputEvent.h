#pragma once

// ============================================================================
// InputEvent - Closed set of viewport input events and their intents
// ============================================================================
// Qt events (wheel, native gesture, touch, key, mouse) are classified once into
// an InputEvent by InputArbiter. resolveIntent() then decides, without side
// effects, what the event means for the camera. All zoom anchoring is reachable
// from that one function.
// ============================================================================

#include "core/CameraState.h"
#include "core/ToolType.h"
#include "core/ViewportMath.h"

#include <QPointF>
#include <QRectF>
#include <QString>
#include <optional>

/**
 * @brief One viewport input event, already translated out of Qt's event types.
 *
 * position is in host widget coordinates.
 */
struct InputEvent {
    enum class Kind {
        Wheel,
        GestureStart,
        GestureChange,
        GestureEnd,
        KeyPress,
        KeyRelease,
        PointerDown,
        PointerMove,
        PointerUp,
        PointerCancel
    };

    Kind kind = Kind::Wheel;
    QPointF position;

    // ----- Wheel -----
    qreal deltaX = 0.0;
    qreal deltaY = 0.0;                 ///< Positive = scroll down / zoom out
    ViewportMath::DeltaMode deltaMode = ViewportMath::DeltaMode::Pixel;

    // ----- Modifiers -----
    bool ctrl = false;                  ///< Ctrl (Command on macOS, as Qt maps it)
    bool meta = false;
    bool shift = false;

    // ----- Gesture -----
    qreal gestureScale = 1.0;           ///< Cumulative scale since GestureStart

    // ----- Key -----
    int key = 0;                        ///< Qt::Key
    bool autoRepeat = false;
    bool editableFocus = false;         ///< Focus is inside a text-editing widget

    // ----- Pointer -----
    bool primaryButton = true;
    bool touch = false;                 ///< Synthesized by TouchGestureHandler (one-finger pan)

    bool zoomModifier() const { return ctrl || meta; }
};

/**
 * @brief Captured at gesture start; every change is solved against it.
 */
struct GestureBaseline {
    qreal scale = 1.0;
    qreal scrollX = 0.0;
    qreal scrollY = 0.0;
    QPointF anchor;                     ///< Host coordinates
};

/**
 * @brief World point under the pointer at the last drag step.
 */
struct DragBaseline {
    QPointF world;
};

/**
 * @brief Everything resolveIntent() reads besides the event.
 */
struct ArbitrationContext {
    ViewState camera;
    CameraConstraints constraints;
    QRectF viewportRect;                ///< Host rect; top-left is the viewport origin

    ToolType activeTool = ToolType::Select;
    bool spacePanActive = false;

    std::optional<GestureBaseline> gesture;
    std::optional<DragBaseline> drag;

    qreal wheelBaseSensitivity = ViewportMath::DEFAULT_WHEEL_SENSITIVITY;
    qreal keyboardBaseStep = ViewportMath::DEFAULT_ZOOM_STEP;
};

/**
 * @brief What an event means for the camera.
 */
struct Intent {
    enum class Type {
        Ignore,
        Zoom,       ///< targetScale anchored at anchor
        Pan,        ///< panDelta in world units
        ResetFit    ///< Back to fit-width (Ctrl+0)
    };

    /**
     * @brief Gesture and drag bookkeeping the arbiter performs.
     */
    enum class Lifecycle {
        None,
        CaptureGesture,
        ReleaseGesture,
        CaptureDrag,
        UpdateDrag,
        ReleaseDrag,
        BeginSpacePan,
        EndSpacePan
    };

    Type type = Type::Ignore;
    Lifecycle lifecycle = Lifecycle::None;

    qreal targetScale = 1.0;
    QPointF anchor;
    QPointF panDelta;

    GestureBaseline gestureBaseline;    ///< Valid for CaptureGesture
    DragBaseline dragBaseline;          ///< Valid for CaptureDrag

    bool consume = false;               ///< Stop the event from reaching anything else
    QString suspendReason;              ///< Non-empty: suspend auto-fit with this tag
};

/**
 * @brief Classify one event. Pure.
 */
Intent resolveIntent(const InputEvent& event, const ArbitrationContext& context);

/**
 * @brief Short debug name for an event kind.
 */
const char* inputEventKindName(InputEvent::Kind kind);
