#include "TouchGestureHandler.h"
#include "InputArbiter.h"
#include "InputEvent.h"

#include <QDebug>
#include <QLineF>
#include <QTouchEvent>

// ===== Constructor =====

TouchGestureHandler::TouchGestureHandler(InputArbiter* arbiter, QObject* parent)
    : QObject(parent)
    , m_arbiter(arbiter)
{
}

// ===== Mode =====

void TouchGestureHandler::setMode(TouchGestureMode mode)
{
    if (m_mode == mode) {
        return;
    }
    endGesture(true);
    m_mode = mode;
}

void TouchGestureHandler::resetAllState()
{
    endGesture(true);
    m_pendingFingerCount = 0;
    m_hysteresisCounter = 0;
    m_waitingForFreshTouch = false;
}

// ===== Touch Event Handling =====

bool TouchGestureHandler::handleTouchEvent(QTouchEvent* event, QPointF toHost)
{
    if (m_mode == TouchGestureMode::Disabled || !event) {
        return false;
    }

    // Collect live points in host coordinates
    QList<QPointF> live;
    for (const QEventPoint& point : event->points()) {
        if (point.state() != QEventPoint::Released) {
            live.append(point.position() + toHost);
        }
    }
    const int count = live.size();

    switch (event->type()) {
        case QEvent::TouchBegin: {
            m_waitingForFreshTouch = false;
            m_pendingFingerCount = 0;
            m_hysteresisCounter = 0;

            if (count == 1 && m_mode == TouchGestureMode::Full) {
                beginOneFinger(live[0]);
            } else if (count >= 2) {
                beginTwoFinger(live[0], live[1]);
            }
            event->accept();
            return true;
        }

        case QEvent::TouchUpdate: {
            if (m_waitingForFreshTouch) {
                event->accept();
                return true;
            }

            const int activeCount = m_gestureType == GestureType::TwoFinger ? 2
                                  : m_gestureType == GestureType::OneFinger ? 1 : 0;
            const int wanted = qMin(count, 2);

            if (wanted == activeCount) {
                m_pendingFingerCount = 0;
                m_hysteresisCounter = 0;
                if (m_gestureType == GestureType::TwoFinger) {
                    updateTwoFinger(live[0], live[1]);
                } else if (m_gestureType == GestureType::OneFinger) {
                    updateOneFinger(live[0]);
                }
                event->accept();
                return true;
            }

            // Finger count changed: wait for it to settle
            if (wanted == m_pendingFingerCount) {
                ++m_hysteresisCounter;
            } else {
                m_pendingFingerCount = wanted;
                m_hysteresisCounter = 1;
            }

            if (m_hysteresisCounter >= HYSTERESIS_THRESHOLD) {
                endGesture(false);
                m_pendingFingerCount = 0;
                m_hysteresisCounter = 0;

                if (wanted == 2) {
                    beginTwoFinger(live[0], live[1]);
                } else if (wanted < activeCount) {
                    // Lifting fingers: clean break until the next TouchBegin
                    m_waitingForFreshTouch = true;
                } else if (wanted == 1 && m_mode == TouchGestureMode::Full) {
                    beginOneFinger(live[0]);
                }
            }
            event->accept();
            return true;
        }

        case QEvent::TouchEnd:
            endGesture(false);
            m_waitingForFreshTouch = false;
            event->accept();
            return true;

        case QEvent::TouchCancel:
            endGesture(true);
            m_waitingForFreshTouch = false;
            event->accept();
            return true;

        default:
            break;
    }

    return false;
}

// ===== Gesture Helpers =====

void TouchGestureHandler::endGesture(bool cancelled)
{
    if (m_gestureType == GestureType::OneFinger) {
        InputEvent ev;
        ev.kind = cancelled ? InputEvent::Kind::PointerCancel : InputEvent::Kind::PointerUp;
        ev.position = m_lastPanPosition;
        ev.touch = true;
        dispatch(ev);
    } else if (m_gestureType == GestureType::TwoFinger) {
        InputEvent ev;
        ev.kind = InputEvent::Kind::GestureEnd;
        ev.position = m_startCentroid;
        dispatch(ev);
    }

    m_gestureType = GestureType::None;
    m_startDistance = 0;
}

void TouchGestureHandler::beginOneFinger(QPointF position)
{
    m_gestureType = GestureType::OneFinger;
    m_lastPanPosition = position;

    InputEvent ev;
    ev.kind = InputEvent::Kind::PointerDown;
    ev.position = position;
    ev.touch = true;
    dispatch(ev);
}

void TouchGestureHandler::updateOneFinger(QPointF position)
{
    m_lastPanPosition = position;

    InputEvent ev;
    ev.kind = InputEvent::Kind::PointerMove;
    ev.position = position;
    ev.touch = true;
    dispatch(ev);
}

void TouchGestureHandler::beginTwoFinger(QPointF p1, QPointF p2)
{
    m_gestureType = GestureType::TwoFinger;
    m_startCentroid = (p1 + p2) / 2.0;
    // Avoid division by zero
    m_startDistance = qMax<qreal>(1.0, QLineF(p1, p2).length());

    InputEvent ev;
    ev.kind = InputEvent::Kind::GestureStart;
    ev.position = m_startCentroid;
    ev.gestureScale = 1.0;
    dispatch(ev);
}

void TouchGestureHandler::updateTwoFinger(QPointF p1, QPointF p2)
{
    const qreal distance = qMax<qreal>(1.0, QLineF(p1, p2).length());
    qreal scale = distance / m_startDistance;
    if (qAbs(scale - 1.0) < ZOOM_SCALE_DEAD_ZONE) {
        scale = 1.0;
    }

    InputEvent ev;
    ev.kind = InputEvent::Kind::GestureChange;
    ev.position = m_startCentroid;
    ev.gestureScale = scale;
    dispatch(ev);
}

bool TouchGestureHandler::dispatch(const InputEvent& event)
{
    if (!m_arbiter) {
        return false;
    }
    return m_arbiter->dispatch(event);
}
