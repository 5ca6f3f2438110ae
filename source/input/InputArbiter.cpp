#include "InputArbiter.h"
#include "TouchGestureHandler.h"
#include "core/CameraStore.h"
#include "core/FitController.h"

#include <QAbstractSpinBox>
#include <QApplication>
#include <QComboBox>
#include <QDebug>
#include <QKeyEvent>
#include <QLineEdit>
#include <QMouseEvent>
#include <QNativeGestureEvent>
#include <QPlainTextEdit>
#include <QTextEdit>
#include <QTimer>
#include <QTouchEvent>
#include <QWheelEvent>
#include <QWidget>

// ============================================================================
// WindowKeyFilter - application-level key hook for the host's window
// ============================================================================
// Key events go to the focus widget, which may be anywhere in the window.
// Only events whose receiver is a widget in the host's window are forwarded.

class WindowKeyFilter : public QObject
{
public:
    explicit WindowKeyFilter(InputArbiter* arbiter)
        : QObject(arbiter)
        , m_arbiter(arbiter)
    {
    }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override
    {
        switch (event->type()) {
            case QEvent::ShortcutOverride:
            case QEvent::KeyPress:
            case QEvent::KeyRelease:
                break;
            default:
                return false;
        }

        auto* widget = qobject_cast<QWidget*>(watched);
        QWidget* host = m_arbiter->host();
        if (!widget || !host || widget->window() != host->window()) {
            return false;
        }
        return m_arbiter->handleKey(widget, static_cast<QKeyEvent*>(event));
    }

private:
    InputArbiter* m_arbiter;
};

// ============================================================================
// Construction
// ============================================================================

InputArbiter::InputArbiter(CameraStore* store, FitController* fit, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_fit(fit)
{
    m_touch = new TouchGestureHandler(this, this);

    m_resizeDebounce = new QTimer(this);
    m_resizeDebounce->setSingleShot(true);
    m_resizeDebounce->setTimerType(Qt::PreciseTimer);
    m_resizeDebounce->setInterval(DEFAULT_RESIZE_DEBOUNCE_MS);
    connect(m_resizeDebounce, &QTimer::timeout, this, &InputArbiter::onResizeDebounced);

    m_resizeFrame = new QTimer(this);
    m_resizeFrame->setSingleShot(true);
    m_resizeFrame->setTimerType(Qt::PreciseTimer);
    m_resizeFrame->setInterval(DEFAULT_FRAME_INTERVAL_MS);
    connect(m_resizeFrame, &QTimer::timeout, this, &InputArbiter::onResizeFrame);
}

InputArbiter::~InputArbiter()
{
    detach();
}

// ============================================================================
// Host
// ============================================================================

bool InputArbiter::attach(QWidget* host)
{
    if (!host) {
        qWarning() << "InputArbiter: no viewport host to attach to; input arbitration disabled";
        return false;
    }
    if (m_host == host) {
        return true;
    }

    detach();
    m_host = host;

    m_host->setAttribute(Qt::WA_AcceptTouchEvents, true);
    installOn(m_host);
    const QList<QWidget*> descendants = m_host->findChildren<QWidget*>();
    for (QWidget* child : descendants) {
        installOn(child);
    }

    m_keyFilter = new WindowKeyFilter(this);
    qApp->installEventFilter(m_keyFilter);

#if FOLIOVIEW_DEBUG
    qDebug() << "[arbiter] attached to" << m_host << "with" << m_filtered.size() << "filtered widgets";
#endif
    return true;
}

void InputArbiter::detach()
{
    m_resizeDebounce->stop();
    m_resizeFrame->stop();

    if (m_touch) {
        m_touch->resetAllState();
    }
    releaseDrag();
    m_gesture.reset();
    m_nativeGestureScale = 1.0;
    m_spacePanActive = false;

    if (m_fit) {
        m_fit->stopAnimation();
    }

    removeFilters();
    m_host.clear();
}

void InputArbiter::installOn(QWidget* widget)
{
    if (!widget) {
        return;
    }
    for (const QPointer<QWidget>& w : m_filtered) {
        if (w == widget) {
            return;
        }
    }
    widget->installEventFilter(this);
    m_filtered.append(widget);
}

void InputArbiter::removeFilters()
{
    for (const QPointer<QWidget>& w : m_filtered) {
        if (w) {
            w->removeEventFilter(this);
        }
    }
    m_filtered.clear();

    if (m_keyFilter) {
        qApp->removeEventFilter(m_keyFilter);
        delete m_keyFilter;
        m_keyFilter = nullptr;
    }
}

// ============================================================================
// Tool state and tuning
// ============================================================================

void InputArbiter::setActiveTool(ToolType tool)
{
    if (m_activeTool == tool) {
        return;
    }
    m_activeTool = tool;
    if (tool != ToolType::Pan && !m_spacePanActive) {
        releaseDrag();
    }
    updateCursor();
}

void InputArbiter::setResizeDebounceMs(int ms)
{
    m_resizeDebounce->setInterval(qMax(0, ms));
}

void InputArbiter::setFrameIntervalMs(int ms)
{
    m_resizeFrame->setInterval(qMax(0, ms));
}

ArbitrationContext InputArbiter::context() const
{
    ArbitrationContext ctx;
    if (m_store) {
        const CameraState& s = m_store->state();
        ctx.camera = s.viewState();
        ctx.constraints = s.constraints;
        ctx.viewportRect = QRectF(QPointF(0, 0), s.viewportSize);
    }
    if (m_host && (ctx.viewportRect.isEmpty())) {
        ctx.viewportRect = QRectF(m_host->rect());
    }
    ctx.activeTool = m_activeTool;
    ctx.spacePanActive = m_spacePanActive;
    ctx.gesture = m_gesture;
    ctx.drag = m_drag;
    ctx.wheelBaseSensitivity = m_wheelBaseSensitivity;
    ctx.keyboardBaseStep = m_keyboardBaseStep;
    return ctx;
}

bool InputArbiter::isGestureActive() const
{
    return m_gesture.has_value() || m_drag.has_value() || (m_touch && m_touch->isActive());
}

// ============================================================================
// Dispatch
// ============================================================================

bool InputArbiter::dispatch(const InputEvent& event)
{
    if (!m_host || !m_store) {
        return false;
    }

    const Intent intent = resolveIntent(event, context());

#if FOLIOVIEW_DEBUG
    if (intent.type != Intent::Type::Ignore || intent.lifecycle != Intent::Lifecycle::None) {
        qDebug() << "[arbiter]" << inputEventKindName(event.kind)
                 << "type" << static_cast<int>(intent.type)
                 << "target" << intent.targetScale << "consume" << intent.consume;
    }
#endif

    applyIntent(intent, event);
    return intent.consume;
}

void InputArbiter::applyIntent(const Intent& intent, const InputEvent& event)
{
    // ----- Suspension first, so a running fit animation cannot overwrite this input -----
    if (!intent.suspendReason.isEmpty() && m_fit) {
        m_fit->suspend(intent.suspendReason);
    }

    // ----- Lifecycle -----
    switch (intent.lifecycle) {
        case Intent::Lifecycle::CaptureGesture:
            m_gesture = intent.gestureBaseline;
            break;
        case Intent::Lifecycle::ReleaseGesture:
            m_gesture.reset();
            m_nativeGestureScale = 1.0;
            break;
        case Intent::Lifecycle::CaptureDrag:
            m_drag = intent.dragBaseline;
            if (m_host && !event.touch) {
                m_host->grabMouse();
                m_pointerCaptured = true;
            }
            updateCursor();
            break;
        case Intent::Lifecycle::ReleaseDrag:
            releaseDrag();
            break;
        case Intent::Lifecycle::BeginSpacePan:
            m_spacePanActive = true;
            updateCursor();
            break;
        case Intent::Lifecycle::EndSpacePan:
            m_spacePanActive = false;
            updateCursor();
            break;
        case Intent::Lifecycle::UpdateDrag:
        case Intent::Lifecycle::None:
            break;
    }

    // ----- Camera -----
    switch (intent.type) {
        case Intent::Type::Zoom:
            zoomTo(intent.targetScale, intent.anchor);
            break;

        case Intent::Type::Pan:
            m_store->pan(intent.panDelta.x(), intent.panDelta.y());
            if (m_drag) {
                // Re-measure against the camera that actually landed (clamping may have eaten part of the delta)
                m_drag->world = ViewportMath::screenToWorld(event.position, QPointF(0, 0),
                                                            m_store->viewState());
            }
            break;

        case Intent::Type::ResetFit:
            if (m_fit) {
                m_fit->recenter();
            }
            break;

        case Intent::Type::Ignore:
            break;
    }
}

bool InputArbiter::zoomTo(qreal targetScale, QPointF anchor)
{
    if (!m_store) {
        return false;
    }

    const CameraState& s = m_store->state();
    if (!s.constraints.enableZoom) {
        return false;
    }

    const qreal target = ViewportMath::clampScale(targetScale, s.constraints);
    if (!ViewportMath::isSignificantScaleChange(s.scale, target, m_significanceEpsilon)) {
        return false;
    }

    const ViewState next = ViewportMath::zoomAtClientPoint(anchor, target, s.viewState(),
                                                           QRectF(QPointF(0, 0), s.viewportSize),
                                                           s.virtualSize, s.scrollGutter);

    if (m_fit) {
        m_fit->noteManualZoom(next.scale);
    }

#if FOLIOVIEW_DEBUG
    qDebug() << "[viewport-zoom]" << s.scale << "->" << next.scale << "anchor" << anchor;
#endif

    return m_store->setViewState(next);
}

void InputArbiter::releaseDrag()
{
    m_drag.reset();
    if (m_pointerCaptured) {
        if (m_host) {
            m_host->releaseMouse();
        }
        m_pointerCaptured = false;
    }
    updateCursor();
}

void InputArbiter::updateCursor()
{
    if (!m_host) {
        return;
    }
    if (m_drag) {
        m_host->setCursor(Qt::ClosedHandCursor);
    } else if (m_activeTool == ToolType::Pan || m_spacePanActive) {
        m_host->setCursor(Qt::OpenHandCursor);
    } else {
        m_host->unsetCursor();
    }
}

// ============================================================================
// Event filter
// ============================================================================

bool InputArbiter::eventFilter(QObject* watched, QEvent* event)
{
    if (!m_host || !isOwnWidget(watched)) {
        return QObject::eventFilter(watched, event);
    }

    auto* receiver = static_cast<QWidget*>(watched);

    switch (event->type()) {
        case QEvent::ChildAdded: {
            // Descendants created after attach must be intercepted too
            auto* childEvent = static_cast<QChildEvent*>(event);
            if (auto* child = qobject_cast<QWidget*>(childEvent->child())) {
                installOn(child);
                const QList<QWidget*> nested = child->findChildren<QWidget*>();
                for (QWidget* w : nested) {
                    installOn(w);
                }
            }
            return false;
        }

        case QEvent::Resize:
            if (receiver == m_host) {
                scheduleResize();
            }
            return false;

        case QEvent::Wheel:
            return handleWheel(receiver, static_cast<QWheelEvent*>(event));

        case QEvent::NativeGesture:
            return handleNativeGesture(receiver, static_cast<QNativeGestureEvent*>(event));

        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
            return m_touch->handleTouchEvent(static_cast<QTouchEvent*>(event),
                                             toHost(receiver, QPointF(0, 0)));

        case QEvent::MouseButtonPress:
        case QEvent::MouseButtonDblClick:
        case QEvent::MouseMove:
        case QEvent::MouseButtonRelease:
            return handleMouse(receiver, static_cast<QMouseEvent*>(event));

        case QEvent::Hide:
            if (receiver == m_host) {
                m_touch->resetAllState();
                releaseDrag();
                m_gesture.reset();
                m_nativeGestureScale = 1.0;
            }
            return false;

        default:
            break;
    }
    return QObject::eventFilter(watched, event);
}

bool InputArbiter::handleWheel(QWidget* receiver, QWheelEvent* event)
{
    InputEvent ev;
    ev.kind = InputEvent::Kind::Wheel;
    ev.position = toHost(receiver, event->position());
    ev.ctrl = event->modifiers().testFlag(Qt::ControlModifier);
    ev.meta = event->modifiers().testFlag(Qt::MetaModifier);
    ev.shift = event->modifiers().testFlag(Qt::ShiftModifier);

    // Qt: positive = away from the user (scroll up). InputEvent: positive = down / zoom out.
    const QPoint pixelDelta = event->pixelDelta();
    const QPoint angleDelta = event->angleDelta();
    if (!pixelDelta.isNull()) {
        ev.deltaMode = ViewportMath::DeltaMode::Pixel;
        ev.deltaX = -pixelDelta.x();
        ev.deltaY = -pixelDelta.y();
    } else {
        // 120 units = one notch = wheelScrollLines() lines
        const qreal lines = QApplication::wheelScrollLines();
        ev.deltaMode = ViewportMath::DeltaMode::Line;
        ev.deltaX = -angleDelta.x() / 120.0 * lines;
        ev.deltaY = -angleDelta.y() / 120.0 * lines;
    }

    const bool consume = dispatch(ev);
    if (consume) {
        event->accept();
    }
    return consume;
}

bool InputArbiter::handleNativeGesture(QWidget* receiver, QNativeGestureEvent* event)
{
    InputEvent ev;
    ev.position = toHost(receiver, event->position());

    switch (event->gestureType()) {
        case Qt::BeginNativeGesture:
            m_nativeGestureScale = 1.0;
            ev.kind = InputEvent::Kind::GestureStart;
            break;
        case Qt::ZoomNativeGesture:
            // value() is the incremental magnification since the previous event
            m_nativeGestureScale *= (1.0 + event->value());
            ev.kind = InputEvent::Kind::GestureChange;
            ev.gestureScale = m_nativeGestureScale;
            break;
        case Qt::EndNativeGesture:
            ev.kind = InputEvent::Kind::GestureEnd;
            break;
        default:
            return false;
    }

    const bool consume = dispatch(ev);
    if (consume) {
        event->accept();
    }
    return consume;
}

bool InputArbiter::handleMouse(QWidget* receiver, QMouseEvent* event)
{
    // Touch-synthesized mouse events are handled by TouchGestureHandler
    if (event->source() == Qt::MouseEventSynthesizedBySystem ||
        event->source() == Qt::MouseEventSynthesizedByQt) {
        return false;
    }

    InputEvent ev;
    ev.position = toHost(receiver, event->position());
    ev.primaryButton = event->button() == Qt::LeftButton ||
                       (event->type() == QEvent::MouseMove && event->buttons().testFlag(Qt::LeftButton));

    switch (event->type()) {
        case QEvent::MouseButtonPress:
        case QEvent::MouseButtonDblClick:
            ev.kind = InputEvent::Kind::PointerDown;
            break;
        case QEvent::MouseMove:
            if (!m_drag) {
                return false;
            }
            ev.kind = InputEvent::Kind::PointerMove;
            break;
        case QEvent::MouseButtonRelease:
            if (event->button() != Qt::LeftButton) {
                return m_drag.has_value();
            }
            ev.kind = InputEvent::Kind::PointerUp;
            break;
        default:
            return false;
    }

    const bool consume = dispatch(ev);
    if (consume) {
        event->accept();
    }
    return consume;
}

bool InputArbiter::handleKey(QWidget* receiver, QKeyEvent* event)
{
    Q_UNUSED(receiver);
    if (!m_host || !m_store) {
        return false;
    }

    InputEvent ev;
    ev.kind = event->type() == QEvent::KeyRelease ? InputEvent::Kind::KeyRelease
                                                   : InputEvent::Kind::KeyPress;
    ev.key = event->key();
    ev.autoRepeat = event->isAutoRepeat();
    ev.ctrl = event->modifiers().testFlag(Qt::ControlModifier);
    ev.meta = event->modifiers().testFlag(Qt::MetaModifier);
    ev.shift = event->modifiers().testFlag(Qt::ShiftModifier);
    ev.editableFocus = isEditableFocus();

    if (event->type() == QEvent::ShortcutOverride) {
        // Claim zoom keys as plain key presses so no QAction shortcut steals them.
        // Resolve against the context without applying anything.
        const Intent intent = resolveIntent(ev, context());
        if (intent.consume) {
            event->accept();
            return true;
        }
        return false;
    }

    const bool consume = dispatch(ev);
    if (consume) {
        event->accept();
    }
    return consume;
}

// ============================================================================
// Helpers
// ============================================================================

QPointF InputArbiter::toHost(QWidget* receiver, QPointF position) const
{
    if (!m_host || !receiver || receiver == m_host) {
        return position;
    }
    return receiver->mapTo(m_host, position);
}

bool InputArbiter::isOwnWidget(QObject* object) const
{
    for (const QPointer<QWidget>& w : m_filtered) {
        if (w == object) {
            return true;
        }
    }
    return false;
}

bool InputArbiter::isEditableFocus()
{
    QWidget* focus = QApplication::focusWidget();
    if (!focus) {
        return false;
    }
    if (auto* line = qobject_cast<QLineEdit*>(focus)) {
        return !line->isReadOnly();
    }
    if (auto* text = qobject_cast<QTextEdit*>(focus)) {
        return !text->isReadOnly();
    }
    if (auto* plain = qobject_cast<QPlainTextEdit*>(focus)) {
        return !plain->isReadOnly();
    }
    if (qobject_cast<QAbstractSpinBox*>(focus)) {
        return true;
    }
    if (auto* combo = qobject_cast<QComboBox*>(focus)) {
        return combo->isEditable();
    }
    return false;
}

// ============================================================================
// Resize scheduling
// ============================================================================

void InputArbiter::scheduleResize()
{
    if (!m_host) {
        return;
    }
    // A new resize supersedes any pending debounce or frame
    m_resizeFrame->stop();
    m_resizeDebounce->start();
}

bool InputArbiter::isResizePending() const
{
    return m_resizeDebounce->isActive() || m_resizeFrame->isActive();
}

void InputArbiter::onResizeDebounced()
{
    m_resizeFrame->stop();
    m_resizeFrame->start();
}

void InputArbiter::onResizeFrame()
{
    if (!m_host || !m_store) {
        return;
    }

    const QSizeF size = m_host->size();
    m_store->setViewportSize(size);
    emit viewportRemeasured(size);

    if (!m_fit) {
        return;
    }
    if (!m_fit->hasMounted()) {
        m_fit->mount();
        return;
    }
    if (m_fit->isSuspended() || isGestureActive()) {
#if FOLIOVIEW_DEBUG
        qDebug() << "[fit] resize re-fit skipped"
                 << (m_fit->isSuspended() ? "(suspended)" : "(mid-gesture)");
#endif
        return;
    }
    m_fit->onViewportResized();
}
