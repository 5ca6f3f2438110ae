#include "InputEvent.h"

#include <Qt>
#include <cmath>

namespace {

using ViewportMath::clampScale;

// ===== Wheel =====

Intent resolveWheel(const InputEvent& event, const ArbitrationContext& ctx)
{
    Intent intent;
    intent.suspendReason = QStringLiteral("wheel");

    if (!event.zoomModifier()) {
        // Plain wheel belongs to container scrolling
        return intent;
    }

    // Native zoom must never see a modified wheel, even when zoom is disabled
    intent.consume = true;
    if (!ctx.constraints.enableZoom) {
        return intent;
    }

    const qreal dy = ViewportMath::normalizedWheelDelta(event.deltaY, event.deltaMode,
                                                        ctx.viewportRect.height());
    const qreal sensitivity = ViewportMath::getAdaptiveZoomSensitivity(ctx.camera.scale,
                                                                       ctx.wheelBaseSensitivity);
    const qreal current = ViewportMath::sanitizeScale(ctx.camera.scale);

    intent.type = Intent::Type::Zoom;
    intent.targetScale = clampScale(current * std::exp(-dy * sensitivity), ctx.constraints);
    intent.anchor = event.position;
    return intent;
}

// ===== Gesture =====

Intent resolveGesture(const InputEvent& event, const ArbitrationContext& ctx)
{
    Intent intent;
    intent.consume = true;

    switch (event.kind) {
        case InputEvent::Kind::GestureStart: {
            intent.lifecycle = Intent::Lifecycle::CaptureGesture;
            intent.suspendReason = QStringLiteral("gesture");
            intent.gestureBaseline.scale = ViewportMath::sanitizeScale(ctx.camera.scale);
            intent.gestureBaseline.scrollX = ctx.camera.scrollX;
            intent.gestureBaseline.scrollY = ctx.camera.scrollY;
            intent.gestureBaseline.anchor = event.position;
            return intent;
        }

        case InputEvent::Kind::GestureChange: {
            if (!ctx.gesture) {
                // Change without a start: adopt this event as the baseline
                intent.lifecycle = Intent::Lifecycle::CaptureGesture;
                intent.suspendReason = QStringLiteral("gesture");
                intent.gestureBaseline.scale = ViewportMath::sanitizeScale(ctx.camera.scale);
                intent.gestureBaseline.scrollX = ctx.camera.scrollX;
                intent.gestureBaseline.scrollY = ctx.camera.scrollY;
                intent.gestureBaseline.anchor = event.position;
                return intent;
            }
            if (!ctx.constraints.enableZoom || !std::isfinite(event.gestureScale) ||
                event.gestureScale <= 0) {
                return intent;
            }

            const GestureBaseline& base = *ctx.gesture;
            intent.type = Intent::Type::Zoom;
            intent.targetScale = clampScale(base.scale * event.gestureScale, ctx.constraints);
            intent.anchor = base.anchor;
            return intent;
        }

        case InputEvent::Kind::GestureEnd:
            intent.lifecycle = Intent::Lifecycle::ReleaseGesture;
            return intent;

        default:
            break;
    }
    return intent;
}

// ===== Keyboard =====

Intent resolveKey(const InputEvent& event, const ArbitrationContext& ctx)
{
    Intent intent;

    // Typing into a text field always wins
    if (event.editableFocus) {
        return intent;
    }

    if (event.key == Qt::Key_Space && !event.zoomModifier()) {
        intent.consume = true;
        if (event.autoRepeat) {
            return intent;
        }
        if (event.kind == InputEvent::Kind::KeyPress) {
            intent.lifecycle = Intent::Lifecycle::BeginSpacePan;
            intent.suspendReason = QStringLiteral("space-pan");
        } else {
            intent.lifecycle = Intent::Lifecycle::EndSpacePan;
        }
        return intent;
    }

    if (event.kind != InputEvent::Kind::KeyPress || !event.zoomModifier()) {
        return intent;
    }

    int ticks = 0;
    QString keyTag;
    switch (event.key) {
        case Qt::Key_Plus:
            ticks = 1;
            keyTag = QStringLiteral("+");
            break;
        case Qt::Key_Equal:
            ticks = 1;
            keyTag = QStringLiteral("=");
            break;
        case Qt::Key_Minus:
            ticks = -1;
            keyTag = QStringLiteral("-");
            break;
        case Qt::Key_Underscore:
            ticks = -1;
            keyTag = QStringLiteral("_");
            break;
        case Qt::Key_0:
            intent.type = Intent::Type::ResetFit;
            intent.consume = true;
            return intent;
        default:
            return intent;
    }

    intent.consume = true;
    intent.suspendReason = QStringLiteral("key:") + keyTag;
    if (!ctx.constraints.enableZoom) {
        return intent;
    }

    intent.type = Intent::Type::Zoom;
    intent.targetScale = ViewportMath::applyZoomTicks(ctx.camera.scale, ticks,
                                                      ctx.constraints.minScale,
                                                      ctx.constraints.maxScale,
                                                      ctx.keyboardBaseStep);
    // No cursor for a key press: anchor at the visual centre
    intent.anchor = ctx.viewportRect.center();
    return intent;
}

// ===== Pointer =====

Intent resolvePointer(const InputEvent& event, const ArbitrationContext& ctx)
{
    Intent intent;
    const QPointF origin = ctx.viewportRect.topLeft();

    switch (event.kind) {
        case InputEvent::Kind::PointerDown: {
            const bool panTool = ctx.activeTool == ToolType::Pan || ctx.spacePanActive || event.touch;
            intent.suspendReason = event.touch ? QStringLiteral("touch")
                                 : ctx.spacePanActive ? QStringLiteral("space-pan")
                                 : QStringLiteral("pointer");
            if (!panTool || !event.primaryButton || !ctx.constraints.enablePan) {
                return intent;
            }
            intent.consume = true;
            intent.lifecycle = Intent::Lifecycle::CaptureDrag;
            intent.dragBaseline.world = ViewportMath::screenToWorld(event.position, origin, ctx.camera);
            return intent;
        }

        case InputEvent::Kind::PointerMove: {
            if (!ctx.drag) {
                return intent;
            }
            intent.consume = true;
            const QPointF current = ViewportMath::screenToWorld(event.position, origin, ctx.camera);
            // Grab semantics: the world point under the pointer follows the pointer
            intent.type = Intent::Type::Pan;
            intent.lifecycle = Intent::Lifecycle::UpdateDrag;
            intent.panDelta = ctx.drag->world - current;
            return intent;
        }

        case InputEvent::Kind::PointerUp:
        case InputEvent::Kind::PointerCancel:
            if (!ctx.drag) {
                return intent;
            }
            intent.consume = true;
            intent.lifecycle = Intent::Lifecycle::ReleaseDrag;
            return intent;

        default:
            break;
    }
    return intent;
}

} // namespace

Intent resolveIntent(const InputEvent& event, const ArbitrationContext& context)
{
    switch (event.kind) {
        case InputEvent::Kind::Wheel:
            return resolveWheel(event, context);

        case InputEvent::Kind::GestureStart:
        case InputEvent::Kind::GestureChange:
        case InputEvent::Kind::GestureEnd:
            return resolveGesture(event, context);

        case InputEvent::Kind::KeyPress:
        case InputEvent::Kind::KeyRelease:
            return resolveKey(event, context);

        case InputEvent::Kind::PointerDown:
        case InputEvent::Kind::PointerMove:
        case InputEvent::Kind::PointerUp:
        case InputEvent::Kind::PointerCancel:
            return resolvePointer(event, context);
    }
    return Intent();
}

const char* inputEventKindName(InputEvent::Kind kind)
{
    switch (kind) {
        case InputEvent::Kind::Wheel:         return "wheel";
        case InputEvent::Kind::GestureStart:  return "gesture-start";
        case InputEvent::Kind::GestureChange: return "gesture-change";
        case InputEvent::Kind::GestureEnd:    return "gesture-end";
        case InputEvent::Kind::KeyPress:      return "key-press";
        case InputEvent::Kind::KeyRelease:    return "key-release";
        case InputEvent::Kind::PointerDown:   return "pointer-down";
        case InputEvent::Kind::PointerMove:   return "pointer-move";
        case InputEvent::Kind::PointerUp:     return "pointer-up";
        case InputEvent::Kind::PointerCancel: return "pointer-cancel";
    }
    return "unknown";
}
