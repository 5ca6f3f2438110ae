#ifndef PAGEVIEWPORTTESTS_H
#define PAGEVIEWPORTTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QApplication>
#include <QWheelEvent>
#include <QScrollBar>
#include <QSettings>
#include <QTemporaryDir>

#include "PageViewport.h"
#include "PageSurface.h"
#include "core/CameraStore.h"
#include "core/FitController.h"
#include "input/InputArbiter.h"
#include "MainWindow.h"

/**
 * Integration tests for PageViewport: mounting, the command surface and
 * what it publishes to the drawing engine.
 * Run with: folioview --test-viewport
 */
class PageViewportTests : public QObject {
    Q_OBJECT

private:
    // Records what the camera engine pushes to a drawing engine
    struct RecordingEngine : public DrawingEngine {
        int transforms = 0;
        int resolutions = 0;
        ViewTransform lastTransform;
        PhysicalResolution lastResolution;
        QSizeF pageSize;
        qreal pageMargin = -1;

        void setViewTransform(const ViewTransform& transform) override {
            ++transforms;
            lastTransform = transform;
        }
        void applyPhysicalResolution(const PhysicalResolution& resolution) override {
            ++resolutions;
            lastResolution = resolution;
        }
        void setPageGeometry(QSizeF size, qreal margin) override {
            pageSize = size;
            pageMargin = margin;
        }
    };

    static ViewportSettings testSettings() {
        ViewportSettings s;
        s.fitAnimationMs = 0;
        s.resizeDebounceMs = 0;
        return s;
    }

    // Show the viewport and let the initial resize settle
    static bool showAndSettle(PageViewport& viewport) {
        viewport.resize(800, 600);
        viewport.show();
        if (!QTest::qWaitForWindowExposed(&viewport)) {
            return false;
        }
        return QTest::qWaitFor([&viewport]() { return !viewport.arbiter()->isResizePending(); });
    }

private slots:
    void initTestCase() {
        qRegisterMetaType<CameraState>("CameraState");
        qRegisterMetaType<ViewTransform>("ViewTransform");
        qRegisterMetaType<PhysicalResolution>("PhysicalResolution");
        qRegisterMetaType<FitMode>("FitMode");
    }

    // Showing the viewport mounts it in fit-width
    void testMountOnShow() {
        PageViewport viewport(testSettings());
        QVERIFY(!viewport.fitController()->hasMounted());
        QVERIFY(showAndSettle(viewport));

        QVERIFY(viewport.fitController()->hasMounted());
        QCOMPARE(viewport.fitMode(), FitMode::FitWidth);
        QCOMPARE(viewport.camera().scale, 0.6);
        QCOMPARE(viewport.zoomPercent(), 60);
        QCOMPARE(viewport.scaledPageSize(), QSizeF(720, 1320));
    }

    // The transform is published as a signal and as dynamic properties
    void testPublishedTransform() {
        PageViewport viewport(testSettings());
        QVERIFY(showAndSettle(viewport));
        QSignalSpy spy(&viewport, &PageViewport::viewTransformChanged);

        QVERIFY(viewport.setViewState(ViewState{2.0, 100.0, 300.0}));
        QCOMPARE(spy.count(), 1);

        const ViewTransform t = viewport.viewTransform();
        QCOMPARE(t.scale, 2.0);
        QCOMPARE(t.offsetX, -200.0);
        QCOMPARE(t.offsetY, -600.0);
        QCOMPARE(viewport.property("scale").toReal(), 2.0);
        QCOMPARE(viewport.property("offsetX").toReal(), -200.0);
        QCOMPARE(viewport.property("offsetY").toReal(), -600.0);
        QCOMPARE(viewport.surface()->viewTransform().offsetY, -600.0);
    }

    // Zoom buttons step around the viewport centre and announce the percentage
    void testZoomCommands() {
        PageViewport viewport(testSettings());
        QVERIFY(showAndSettle(viewport));
        QSignalSpy percentSpy(&viewport, &PageViewport::zoomPercentChanged);

        const QPointF centre(400, 300);
        const QPointF before = ViewportMath::screenToWorld(centre, QPointF(0, 0), viewport.camera());

        QVERIFY(viewport.zoomIn());
        QVERIFY(qAbs(viewport.camera().scale - 0.648) < 1e-9);
        const QPointF after = ViewportMath::screenToWorld(centre, QPointF(0, 0), viewport.camera());
        QVERIFY(qAbs(after.y() - before.y()) < 1e-6);

        QCOMPARE(percentSpy.count(), 1);
        QCOMPARE(percentSpy.takeFirst().at(0).toInt(), 65);

        QVERIFY(viewport.zoomOut());
        QVERIFY(qAbs(viewport.camera().scale - 0.6) < 1e-9);

        // Limits are honoured
        QVERIFY(viewport.setScale(100.0));
        QCOMPARE(viewport.camera().scale, 6.0);
        QVERIFY(!viewport.zoomIn());
    }

    // Unmodified wheel scrolls the container vertically, Shift horizontally
    void testPlainWheelScrolls() {
        PageViewport viewport(testSettings());
        QVERIFY(showAndSettle(viewport));
        const qreal scale = viewport.camera().scale;
        const qreal lines = QApplication::wheelScrollLines();

        const QPointF pos(400, 300);
        QWheelEvent down(pos, viewport.mapToGlobal(pos), QPoint(), QPoint(0, -120),
                         Qt::NoButton, Qt::NoModifier, Qt::NoScrollPhase, false);
        QApplication::sendEvent(&viewport, &down);

        QCOMPARE(viewport.camera().scale, scale);
        QVERIFY(qAbs(viewport.camera().scrollY - lines * 16.0 / scale) < 1e-6);
        QVERIFY(viewport.fitController()->isSuspended());
        QVERIFY(viewport.scrollFractions().y() > 0.0);
    }

    // Device pixel ratio feeds the physical resolution
    void testDevicePixelRatioOverride() {
        PageViewport viewport(testSettings());
        QVERIFY(showAndSettle(viewport));
        QSignalSpy spy(&viewport, &PageViewport::physicalResolutionChanged);

        viewport.setDevicePixelRatioOverride(2.0);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(viewport.physicalResolution().size(), QSize(1440, 2640));
        QCOMPARE(viewport.surface()->physicalResolution().size(), QSize(1440, 2640));

        // 0 goes back to the screen ratio
        viewport.setDevicePixelRatioOverride(0.0);
        QCOMPARE(viewport.effectiveDevicePixelRatio(), viewport.devicePixelRatioF());
    }

    // An external drawing engine receives geometry, transform and resolution
    void testExternalDrawingEngine() {
        PageViewport viewport(testSettings());
        RecordingEngine engine;
        viewport.setDrawingEngine(&engine);
        QCOMPARE(engine.pageSize, QSizeF(1200, 2200));
        QCOMPARE(engine.pageMargin, 64.0);
        QVERIFY(!viewport.surface()->isVisible());

        QVERIFY(showAndSettle(viewport));
        QVERIFY(engine.transforms > 0);
        QCOMPARE(engine.lastTransform.scale, 0.6);
        QVERIFY(engine.resolutions > 0);
        QCOMPARE(engine.lastResolution.scale, 0.6);

        viewport.setPageSize(QSizeF(1000, 1400));
        QCOMPARE(engine.pageSize, QSizeF(1000, 1400));

        viewport.setDrawingEngine(nullptr);
        QCOMPARE(viewport.drawingEngine(), static_cast<DrawingEngine*>(viewport.surface()));
    }

    // A session page size reaches the store but not the stored preferences
    void testSessionPageSizeNotSaved() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        PageViewport viewport(testSettings());

        viewport.setPageSize(QSizeF(1000, 1400));
        QCOMPARE(viewport.cameraState().pageSize, QSizeF(1000, 1400));
        QCOMPARE(viewport.settings().pageSize(), QSizeF(1200, 2200));

        const QString path = dir.filePath(QStringLiteral("viewport.ini"));
        {
            QSettings settings(path, QSettings::IniFormat);
            viewport.settings().save(settings);
        }
        QSettings settings(path, QSettings::IniFormat);
        QCOMPARE(ViewportSettings::load(settings).pageSize(), QSizeF(1200, 2200));
    }

    // Dragging the window's scroll bar pauses auto-fit like any other scroll
    void testScrollBarSuspendsFit() {
        MainWindow window(testSettings());
        window.show();
        QVERIFY(QTest::qWaitForWindowExposed(&window));
        PageViewport* viewport = window.viewport();
        QVERIFY(QTest::qWaitFor([viewport]() { return !viewport->arbiter()->isResizePending(); }));
        QVERIFY(viewport->fitController()->hasMounted());
        QVERIFY(!viewport->fitController()->isSuspended());

        QScrollBar* vertical = nullptr;
        const auto bars = window.findChildren<QScrollBar*>();
        for (QScrollBar* bar : bars) {
            if (bar->orientation() == Qt::Vertical) {
                vertical = bar;
            }
        }
        QVERIFY(vertical);

        vertical->setValue(vertical->maximum() / 2);
        QVERIFY(viewport->fitController()->isSuspended());
        QVERIFY(viewport->camera().scrollY > 0.0);
    }

    // Settings push constraints into the store
    void testApplySettings() {
        ViewportSettings s = testSettings();
        s.minScale = 0.5;
        s.maxScale = 2.0;
        s.enableZoom = false;
        PageViewport viewport(s);

        QCOMPARE(viewport.store()->constraints().minScale, 0.5);
        QCOMPARE(viewport.store()->constraints().maxScale, 2.0);

        QVERIFY(showAndSettle(viewport));
        QVERIFY(!viewport.setScale(1.5));
        QVERIFY(!viewport.zoomIn());
    }
};

#endif // PAGEVIEWPORTTESTS_H
