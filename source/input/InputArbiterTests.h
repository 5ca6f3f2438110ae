#ifndef INPUTARBITERTESTS_H
#define INPUTARBITERTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QApplication>
#include <QPointingDevice>
#include <QRegularExpression>
#include <QWheelEvent>
#include <QWidget>

#include "InputArbiter.h"
#include "TouchGestureHandler.h"
#include "core/CameraStore.h"
#include "core/FitController.h"

/**
 * Unit tests for intent resolution and InputArbiter.
 * Run with: folioview --test-input
 *
 * Most tests dispatch InputEvents directly; a few go through the Qt event
 * filter with synthetic QWheelEvent / resize traffic.
 */
class InputArbiterTests : public QObject {
    Q_OBJECT

private:
    // 800x600 host inside a window, over a 1200x2200 page with a 200 margin, camera at scale 1
    struct Fixture {
        QWidget window;
        QWidget host;
        CameraStore store;
        FitController fit;
        InputArbiter arbiter;
        qint64 now = 0;     // fit controller clock, advanced by hand

        Fixture()
            : host(&window)
            , store(initialState())
            , fit(&store)
            , arbiter(&store, &fit)
        {
            FitConfig config;
            config.animationMs = 0;
            fit.setConfig(config);
            fit.setClock([this]() { return now; });

            window.resize(1200, 900);
            host.setGeometry(0, 0, 800, 600);
            window.show();
            arbiter.attach(&host);
            store.setViewState(ViewState{1.0, 300.0, 500.0});
        }

        ~Fixture() { arbiter.detach(); }

        static CameraState initialState() {
            CameraState s;
            s.viewportSize = QSizeF(800, 600);
            s.pageMargin = 200.0;
            return s;
        }

        QPointF worldAt(QPointF client) const {
            return ViewportMath::screenToWorld(client, QPointF(0, 0), store.viewState());
        }
    };

    static InputEvent wheel(QPointF pos, qreal deltaY, bool ctrl) {
        InputEvent ev;
        ev.kind = InputEvent::Kind::Wheel;
        ev.position = pos;
        ev.deltaY = deltaY;
        ev.ctrl = ctrl;
        return ev;
    }

    static InputEvent key(InputEvent::Kind kind, int k, bool ctrl) {
        InputEvent ev;
        ev.kind = kind;
        ev.key = k;
        ev.ctrl = ctrl;
        return ev;
    }

    static InputEvent pointer(InputEvent::Kind kind, QPointF pos) {
        InputEvent ev;
        ev.kind = kind;
        ev.position = pos;
        return ev;
    }

    static InputEvent gesture(InputEvent::Kind kind, QPointF pos, qreal scale = 1.0) {
        InputEvent ev;
        ev.kind = kind;
        ev.position = pos;
        ev.gestureScale = scale;
        return ev;
    }

    static bool near(QPointF a, QPointF b, qreal tolerance = 1e-6) {
        return qAbs(a.x() - b.x()) <= tolerance && qAbs(a.y() - b.y()) <= tolerance;
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<CameraState>("CameraState");
    }

    // ===== Pure resolution =====

    void testResolveKeyboard() {
        ArbitrationContext ctx;
        ctx.viewportRect = QRectF(0, 0, 800, 600);

        Intent intent = resolveIntent(key(InputEvent::Kind::KeyPress, Qt::Key_Minus, true), ctx);
        QCOMPARE(intent.type, Intent::Type::Zoom);
        QVERIFY(intent.consume);
        QCOMPARE(intent.anchor, QPointF(400, 300));
        QVERIFY(intent.targetScale < 1.0);
        QCOMPARE(intent.suspendReason, QStringLiteral("key:-"));

        // Without a modifier the key belongs to someone else
        intent = resolveIntent(key(InputEvent::Kind::KeyPress, Qt::Key_Minus, false), ctx);
        QCOMPARE(intent.type, Intent::Type::Ignore);
        QVERIFY(!intent.consume);

        // Text fields always win
        InputEvent typing = key(InputEvent::Kind::KeyPress, Qt::Key_Plus, true);
        typing.editableFocus = true;
        intent = resolveIntent(typing, ctx);
        QVERIFY(!intent.consume);
        QVERIFY(intent.suspendReason.isEmpty());

        intent = resolveIntent(key(InputEvent::Kind::KeyPress, Qt::Key_0, true), ctx);
        QCOMPARE(intent.type, Intent::Type::ResetFit);
        QVERIFY(intent.consume);
    }

    void testResolveSpacePan() {
        ArbitrationContext ctx;

        Intent intent = resolveIntent(key(InputEvent::Kind::KeyPress, Qt::Key_Space, false), ctx);
        QCOMPARE(intent.lifecycle, Intent::Lifecycle::BeginSpacePan);
        QVERIFY(intent.consume);

        InputEvent repeat = key(InputEvent::Kind::KeyPress, Qt::Key_Space, false);
        repeat.autoRepeat = true;
        intent = resolveIntent(repeat, ctx);
        QCOMPARE(intent.lifecycle, Intent::Lifecycle::None);
        QVERIFY(intent.consume);

        intent = resolveIntent(key(InputEvent::Kind::KeyRelease, Qt::Key_Space, false), ctx);
        QCOMPARE(intent.lifecycle, Intent::Lifecycle::EndSpacePan);

        // Space-pan turns a plain pointer press into a drag
        ctx.spacePanActive = true;
        intent = resolveIntent(pointer(InputEvent::Kind::PointerDown, QPointF(10, 10)), ctx);
        QCOMPARE(intent.lifecycle, Intent::Lifecycle::CaptureDrag);
        QCOMPARE(intent.suspendReason, QStringLiteral("space-pan"));
    }

    void testResolveZoomDisabled() {
        ArbitrationContext ctx;
        ctx.constraints.enableZoom = false;

        // Modified wheel is still consumed so the native page zoom never sees it
        const Intent intent = resolveIntent(wheel(QPointF(5, 5), -100, true), ctx);
        QVERIFY(intent.consume);
        QCOMPARE(intent.type, Intent::Type::Ignore);
    }

    void testResolveGestureWithoutStart() {
        ArbitrationContext ctx;
        ctx.camera = ViewState{2.0, 10.0, 20.0};

        const Intent intent = resolveIntent(gesture(InputEvent::Kind::GestureChange, QPointF(50, 60), 1.3), ctx);
        QCOMPARE(intent.lifecycle, Intent::Lifecycle::CaptureGesture);
        QCOMPARE(intent.type, Intent::Type::Ignore);
        QCOMPARE(intent.gestureBaseline.scale, 2.0);
        QCOMPARE(intent.gestureBaseline.anchor, QPointF(50, 60));
    }

    // ===== Wheel =====

    // Ctrl+wheel zooms around the pointer; +deltaY zooms out, -deltaY zooms in
    void testCtrlWheelZoom() {
        Fixture f;
        const QPointF anchor(200, 150);

        QPointF before = f.worldAt(anchor);
        QVERIFY(f.arbiter.dispatch(wheel(anchor, 100, true)));
        QVERIFY(f.store.scale() < 1.0);
        QVERIFY(near(f.worldAt(anchor), before));

        const qreal zoomedOut = f.store.scale();
        before = f.worldAt(anchor);
        QVERIFY(f.arbiter.dispatch(wheel(anchor, -100, true)));
        QVERIFY(f.store.scale() > zoomedOut);
        QVERIFY(near(f.worldAt(anchor), before));

        QVERIFY(f.fit.isSuspended());
    }

    // Plain wheel is left to container scrolling but still pauses auto-fit
    void testPlainWheel() {
        Fixture f;
        QVERIFY(!f.arbiter.dispatch(wheel(QPointF(100, 100), 100, false)));
        QCOMPARE(f.store.scale(), 1.0);
        QVERIFY(f.fit.isSuspended());
    }

    // Tiny wheel deltas below the significance threshold do not write
    void testInsignificantWheel() {
        Fixture f;
        QSignalSpy spy(&f.store, &CameraStore::changed);
        QVERIFY(f.arbiter.dispatch(wheel(QPointF(100, 100), 1, true)));
        QCOMPARE(spy.count(), 0);
        QCOMPARE(f.store.scale(), 1.0);
    }

    // A real QWheelEvent reaching the host is claimed by the filter
    void testWheelThroughFilter() {
        Fixture f;
        const QPointF pos(400, 300);
        const QPointF before = f.worldAt(pos);

        QWheelEvent event(pos, f.host.mapToGlobal(pos), QPoint(), QPoint(0, 120),
                          Qt::NoButton, Qt::ControlModifier, Qt::NoScrollPhase, false);
        QApplication::sendEvent(&f.host, &event);

        QVERIFY(event.isAccepted());
        QVERIFY(f.store.scale() > 1.0);
        QVERIFY(near(f.worldAt(pos), before));
    }

    // ===== Gesture =====

    // Pinch scale is relative to the baseline, anchored at the gesture start
    void testGestureBaseline() {
        Fixture f;
        const QPointF anchor(400, 300);
        const QPointF before = f.worldAt(anchor);

        QVERIFY(f.arbiter.dispatch(gesture(InputEvent::Kind::GestureStart, anchor)));
        QVERIFY(f.arbiter.isGestureActive());
        QVERIFY(f.fit.isSuspended());

        f.arbiter.dispatch(gesture(InputEvent::Kind::GestureChange, QPointF(10, 10), 1.5));
        QCOMPARE(f.store.scale(), 1.5);
        QVERIFY(near(f.worldAt(anchor), before));

        // Not compounded: 2.0 is relative to the scale at GestureStart
        f.arbiter.dispatch(gesture(InputEvent::Kind::GestureChange, QPointF(10, 10), 2.0));
        QCOMPARE(f.store.scale(), 2.0);
        QVERIFY(near(f.worldAt(anchor), before));

        f.arbiter.dispatch(gesture(InputEvent::Kind::GestureEnd, anchor));
        QVERIFY(!f.arbiter.isGestureActive());
    }

    // ===== Keyboard =====

    void testKeyboardZoomAnchorsCentre() {
        Fixture f;
        const QPointF centre(400, 300);
        const QPointF before = f.worldAt(centre);

        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_Equal, true)));
        QVERIFY(qAbs(f.store.scale() - 1.08) < 1e-9);
        QVERIFY(near(f.worldAt(centre), before));

        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_Underscore, true)));
        QVERIFY(qAbs(f.store.scale() - 1.0) < 1e-9);
    }

    void testEditableFocusIgnored() {
        Fixture f;
        InputEvent ev = key(InputEvent::Kind::KeyPress, Qt::Key_Plus, true);
        ev.editableFocus = true;
        QVERIFY(!f.arbiter.dispatch(ev));
        QCOMPARE(f.store.scale(), 1.0);
        QVERIFY(!f.fit.isSuspended());
    }

    // Ctrl+0 resumes auto-fit and recentres
    void testResetFit() {
        Fixture f;
        f.arbiter.dispatch(wheel(QPointF(100, 100), -300, true));
        QVERIFY(f.fit.isSuspended());

        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_0, true)));
        QVERIFY(!f.fit.isSuspended());
        QCOMPARE(f.store.fitMode(), FitMode::FitWidth);
        QCOMPARE(f.store.scale(), 0.6);
        QCOMPARE(f.store.state().scrollY, 0.0);
    }

    // ===== Fit hysteresis =====

    // Three deviating Ctrl+wheel zooms inside the window leave fit-width
    void testWheelZoomLeavesFit() {
        Fixture f;
        const QPointF anchor(400, 300);

        f.now = 0;
        QVERIFY(f.arbiter.dispatch(wheel(anchor, -100, true)));
        f.now = 500;
        QVERIFY(f.arbiter.dispatch(wheel(anchor, -100, true)));
        QCOMPARE(f.store.fitMode(), FitMode::FitWidth);

        f.now = 1000;
        QVERIFY(f.arbiter.dispatch(wheel(anchor, -100, true)));
        QCOMPARE(f.store.fitMode(), FitMode::Free);
    }

    // Each pinch update counts like any other zoom
    void testPinchZoomLeavesFit() {
        Fixture f;
        const QPointF anchor(400, 300);

        f.now = 0;
        QVERIFY(f.arbiter.dispatch(gesture(InputEvent::Kind::GestureStart, anchor)));
        QVERIFY(f.arbiter.dispatch(gesture(InputEvent::Kind::GestureChange, anchor, 1.2)));
        f.now = 500;
        QVERIFY(f.arbiter.dispatch(gesture(InputEvent::Kind::GestureChange, anchor, 1.4)));
        QCOMPARE(f.store.fitMode(), FitMode::FitWidth);

        f.now = 1000;
        QVERIFY(f.arbiter.dispatch(gesture(InputEvent::Kind::GestureChange, anchor, 1.6)));
        QCOMPARE(f.store.fitMode(), FitMode::Free);
        f.arbiter.dispatch(gesture(InputEvent::Kind::GestureEnd, anchor));
    }

    void testKeyboardZoomLeavesFit() {
        Fixture f;

        f.now = 0;
        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_Equal, true)));
        f.now = 500;
        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_Equal, true)));
        QCOMPARE(f.store.fitMode(), FitMode::FitWidth);

        f.now = 1000;
        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_Equal, true)));
        QCOMPARE(f.store.fitMode(), FitMode::Free);
    }

    // Wheel, pinch and keyboard nudges share one counter
    void testMixedSourcesLeaveFit() {
        Fixture f;
        const QPointF anchor(200, 150);

        f.now = 0;
        QVERIFY(f.arbiter.dispatch(wheel(anchor, -100, true)));
        f.now = 400;
        f.arbiter.dispatch(gesture(InputEvent::Kind::GestureStart, anchor));
        QVERIFY(f.arbiter.dispatch(gesture(InputEvent::Kind::GestureChange, anchor, 1.3)));
        f.arbiter.dispatch(gesture(InputEvent::Kind::GestureEnd, anchor));
        QCOMPARE(f.store.fitMode(), FitMode::FitWidth);
        QCOMPARE(f.fit.hysteresis().nudgeCount(), 2);

        f.now = 800;
        QVERIFY(f.arbiter.dispatch(key(InputEvent::Kind::KeyPress, Qt::Key_Plus, true)));
        QCOMPARE(f.store.fitMode(), FitMode::Free);
    }

    // A pause longer than the window restarts the count
    void testSlowWheelZoomStaysInFit() {
        Fixture f;
        const QPointF anchor(400, 300);

        f.now = 0;
        f.arbiter.dispatch(wheel(anchor, -100, true));
        f.now = 500;
        f.arbiter.dispatch(wheel(anchor, -100, true));
        f.now = 2600;
        QVERIFY(f.arbiter.dispatch(wheel(anchor, -100, true)));

        QCOMPARE(f.store.fitMode(), FitMode::FitWidth);
        QCOMPARE(f.fit.hysteresis().nudgeCount(), 1);
    }

    // ===== Pointer =====

    // Drag pans incrementally; the grabbed world point follows the pointer
    void testPanDrag() {
        Fixture f;
        f.arbiter.setActiveTool(ToolType::Pan);

        QVERIFY(f.arbiter.dispatch(pointer(InputEvent::Kind::PointerDown, QPointF(100, 100))));
        QVERIFY(f.arbiter.isDragging());
        const QPointF grabbed = f.worldAt(QPointF(100, 100));

        QVERIFY(f.arbiter.dispatch(pointer(InputEvent::Kind::PointerMove, QPointF(150, 130))));
        QCOMPARE(f.store.state().scrollX, 250.0);
        QCOMPARE(f.store.state().scrollY, 470.0);
        QVERIFY(near(f.worldAt(QPointF(150, 130)), grabbed));

        f.arbiter.dispatch(pointer(InputEvent::Kind::PointerMove, QPointF(100, 100)));
        QCOMPARE(f.store.state().scrollX, 300.0);
        QCOMPARE(f.store.state().scrollY, 500.0);

        QVERIFY(f.arbiter.dispatch(pointer(InputEvent::Kind::PointerUp, QPointF(100, 100))));
        QVERIFY(!f.arbiter.isDragging());
        QVERIFY(!f.arbiter.dispatch(pointer(InputEvent::Kind::PointerMove, QPointF(0, 0))));
    }

    // Pan blocked at an edge resumes immediately when the pointer reverses
    void testPanAtEdge() {
        Fixture f;
        f.store.setViewState(ViewState{1.0, 0.0, 500.0});
        f.arbiter.setActiveTool(ToolType::Pan);

        f.arbiter.dispatch(pointer(InputEvent::Kind::PointerDown, QPointF(100, 100)));
        f.arbiter.dispatch(pointer(InputEvent::Kind::PointerMove, QPointF(150, 100)));
        QCOMPARE(f.store.state().scrollX, 0.0);

        f.arbiter.dispatch(pointer(InputEvent::Kind::PointerMove, QPointF(100, 100)));
        QCOMPARE(f.store.state().scrollX, 50.0);

        f.arbiter.dispatch(pointer(InputEvent::Kind::PointerCancel, QPointF(100, 100)));
        QVERIFY(!f.arbiter.isDragging());
    }

    // Without the pan tool a press is left to the drawing engine
    void testSelectToolPointer() {
        Fixture f;
        QVERIFY(!f.arbiter.dispatch(pointer(InputEvent::Kind::PointerDown, QPointF(100, 100))));
        QVERIFY(!f.arbiter.isDragging());
        QVERIFY(f.fit.isSuspended());
    }

    void testPanDisabled() {
        Fixture f;
        CameraConstraints locked;
        locked.enablePan = false;
        f.store.setConstraints(locked);
        f.arbiter.setActiveTool(ToolType::Pan);

        QVERIFY(!f.arbiter.dispatch(pointer(InputEvent::Kind::PointerDown, QPointF(100, 100))));
        QVERIFY(!f.arbiter.isDragging());
    }

    // ===== Touch =====

    // Two fingers pinch around their starting centroid
    void testTouchPinch() {
        Fixture f;
        QVERIFY(QTest::qWaitForWindowExposed(&f.window));
        static QPointingDevice* device = QTest::createTouchDevice();

        const QPointF centre(400, 300);
        const QPointF before = f.worldAt(centre);

        QTest::touchEvent(&f.host, device).press(0, QPoint(300, 300), &f.host)
                                          .press(1, QPoint(500, 300), &f.host);
        QVERIFY(f.arbiter.isGestureActive());
        QVERIFY(f.fit.isSuspended());

        QTest::touchEvent(&f.host, device).move(0, QPoint(250, 300), &f.host)
                                          .move(1, QPoint(550, 300), &f.host);
        QVERIFY(qAbs(f.store.scale() - 1.5) < 1e-9);
        QVERIFY(near(f.worldAt(centre), before));

        QTest::touchEvent(&f.host, device).release(0, QPoint(250, 300), &f.host)
                                          .release(1, QPoint(550, 300), &f.host);
        QVERIFY(!f.arbiter.isGestureActive());
    }

    // One finger pans in Full mode and is left alone in PinchOnly mode
    void testTouchPan() {
        Fixture f;
        QVERIFY(QTest::qWaitForWindowExposed(&f.window));
        static QPointingDevice* device = QTest::createTouchDevice();

        QTest::touchEvent(&f.host, device).press(0, QPoint(100, 100), &f.host);
        QVERIFY(f.arbiter.isDragging());
        QTest::touchEvent(&f.host, device).move(0, QPoint(140, 120), &f.host);
        QCOMPARE(f.store.state().scrollX, 260.0);
        QCOMPARE(f.store.state().scrollY, 480.0);
        QTest::touchEvent(&f.host, device).release(0, QPoint(140, 120), &f.host);
        QVERIFY(!f.arbiter.isDragging());

        f.arbiter.touchHandler()->setMode(TouchGestureMode::PinchOnly);
        QTest::touchEvent(&f.host, device).press(0, QPoint(100, 100), &f.host);
        QVERIFY(!f.arbiter.isDragging());
        QTest::touchEvent(&f.host, device).release(0, QPoint(100, 100), &f.host);
    }

    // ===== Host =====

    void testAttachNull() {
        CameraStore store;
        FitController fit(&store);
        InputArbiter arbiter(&store, &fit);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("no viewport host"));
        QVERIFY(!arbiter.attach(nullptr));
        QVERIFY(!arbiter.isAttached());
        QVERIFY(!arbiter.dispatch(wheel(QPointF(0, 0), -100, true)));
    }

    void testLateChildFiltered() {
        Fixture f;
        auto* child = new QWidget(&f.host);
        child->setGeometry(100, 100, 200, 200);
        child->show();

        // Child coordinates map into host coordinates
        const QPointF local(50, 50);
        const QPointF hostPos(150, 150);
        const QPointF before = f.worldAt(hostPos);

        QWheelEvent event(local, child->mapToGlobal(local), QPoint(), QPoint(0, 120),
                          Qt::NoButton, Qt::ControlModifier, Qt::NoScrollPhase, false);
        QApplication::sendEvent(child, &event);

        QVERIFY(f.store.scale() > 1.0);
        QVERIFY(near(f.worldAt(hostPos), before));
    }

    // ===== Resize =====

    // A burst of resizes is measured once, after the debounce and one frame
    void testResizeStorm() {
        Fixture f;
        f.arbiter.setResizeDebounceMs(40);
        f.arbiter.setFrameIntervalMs(5);
        QSignalSpy spy(&f.arbiter, &InputArbiter::viewportRemeasured);

        for (int i = 1; i <= 10; ++i) {
            f.host.resize(800 + i * 10, 600 + i * 4);
        }
        QVERIFY(f.arbiter.isResizePending());

        QTRY_COMPARE(spy.count(), 1);
        QTest::qWait(80);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(f.store.state().viewportSize, QSizeF(900, 640));
        QVERIFY(!f.arbiter.isResizePending());
    }

    // A resize during a drag is measured but not re-fitted
    void testResizeDuringDrag() {
        Fixture f;
        QVERIFY(f.fit.mount());
        f.arbiter.setResizeDebounceMs(5);
        f.arbiter.setFrameIntervalMs(1);
        f.arbiter.setActiveTool(ToolType::Pan);

        InputEvent touchDown = pointer(InputEvent::Kind::PointerDown, QPointF(10, 10));
        touchDown.touch = true;
        QVERIFY(f.arbiter.dispatch(touchDown));
        // Only the drag should hold the re-fit back
        f.fit.resume();
        QVERIFY(f.arbiter.isGestureActive());

        const qreal scale = f.store.scale();
        QSignalSpy spy(&f.arbiter, &InputArbiter::viewportRemeasured);
        f.host.resize(1000, 600);
        QTRY_COMPARE(spy.count(), 1);
        QCOMPARE(f.store.state().viewportSize, QSizeF(1000, 600));
        QCOMPARE(f.store.scale(), scale);

        // Once released, the next resize re-fits
        f.arbiter.dispatch(pointer(InputEvent::Kind::PointerUp, QPointF(10, 10)));
        f.host.resize(1000, 620);
        QTRY_COMPARE(spy.count(), 2);
        QVERIFY(qAbs(f.store.scale() - (920.0 / 1200.0)) < 1e-9);
    }
};

#endif // INPUTARBITERTESTS_H
