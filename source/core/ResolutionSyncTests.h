#ifndef RESOLUTIONSYNCTESTS_H
#define RESOLUTIONSYNCTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QRegularExpression>

#include "CameraStore.h"
#include "ResolutionSync.h"

/**
 * Unit tests for ResolutionSync.
 * Run with: folioview --test-resolution
 */
class ResolutionSyncTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        qRegisterMetaType<PhysicalResolution>("PhysicalResolution");
    }

    // Sizes inside the device limits are page * scale * dpr
    void testUnclamped() {
        const PhysicalResolution r = ResolutionSync::compute(QSizeF(1200, 2200), 1.5, 2.0);
        QCOMPARE(r.width, 3600);
        QCOMPARE(r.height, 6600);
        QVERIFY(!r.clamped);
        QCOMPARE(r.effectiveDpr, 3.0);
        QCOMPARE(r.scale, 1.5);
    }

    // Oversized requests shrink proportionally under every limit
    void testPixelBudgetClamp() {
        const DeviceLimits limits;
        const PhysicalResolution r = ResolutionSync::compute(QSizeF(1200, 2200), 1.0, 10.0, limits);

        QVERIFY(r.clamped);
        QVERIFY(r.width <= limits.maxWidth);
        QVERIFY(r.height <= limits.maxHeight);
        QVERIFY(qreal(r.width) * qreal(r.height) <= limits.maxPixels);
        QCOMPARE(r.width, 11816);
        QCOMPARE(r.height, 21664);

        // Aspect ratio is kept within rounding
        const qreal aspect = qreal(r.width) / qreal(r.height);
        QVERIFY(qAbs(aspect - 1200.0 / 2200.0) < 1e-3);
        QVERIFY(r.effectiveDpr < 10.0);
    }

    // A single dimension over its limit is the binding constraint
    void testWidthClamp() {
        const PhysicalResolution r = ResolutionSync::compute(QSizeF(4096, 1024), 8.0, 1.0);
        QVERIFY(r.clamped);
        QCOMPARE(r.width, 16384);
        QCOMPARE(r.height, 4096);
    }

    void testInvalidInputs() {
        PhysicalResolution r = ResolutionSync::compute(QSizeF(1200, 2200), 0.0, -1.0);
        QCOMPARE(r.width, 1200);
        QCOMPARE(r.height, 2200);

        r = ResolutionSync::compute(QSizeF(0, 0), 2.0, 1.0);
        QCOMPARE(r.width, 0);
        QCOMPARE(r.height, 0);
    }

    // Identical results are published once
    void testDedupe() {
        CameraStore store;
        ResolutionSync sync(&store);
        QSignalSpy spy(&sync, &ResolutionSync::resolutionChanged);

        QVERIFY(!sync.hasPublished());
        QVERIFY(sync.refresh());
        QVERIFY(sync.hasPublished());
        QVERIFY(!sync.refresh());
        QCOMPARE(spy.count(), 1);

        // Same DPR within tolerance is ignored
        sync.setDevicePixelRatio(1.0 + 1e-12);
        QCOMPARE(spy.count(), 1);

        // Scroll-only camera changes do not affect the backing store
        store.setViewportSize(QSizeF(800, 600));
        store.pan(0.0, 100.0);
        QCOMPARE(spy.count(), 1);
    }

    // Scale and DPR changes republish
    void testRepublish() {
        CameraStore store;
        ResolutionSync sync(&store);
        sync.refresh();
        QSignalSpy spy(&sync, &ResolutionSync::resolutionChanged);

        sync.setDevicePixelRatio(2.0);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(sync.current().size(), QSize(2400, 4400));

        store.setScale(1.5);
        QCOMPARE(spy.count(), 2);
        QCOMPARE(sync.current().size(), QSize(3600, 6600));

        store.setPageSize(QSizeF(1000, 1000));
        QCOMPARE(spy.count(), 3);
        QCOMPARE(sync.current().size(), QSize(3000, 3000));
    }

    // The clamp warning is logged once per clamped streak
    void testClampWarning() {
        CameraStore store;
        ResolutionSync sync(&store);
        QSignalSpy spy(&sync, &ResolutionSync::resolutionChanged);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("clamped to"));
        sync.setDevicePixelRatio(10.0);
        QVERIFY(sync.current().clamped);

        // Still clamped: the new scale is republished without a second warning
        store.setScale(1.2);
        QVERIFY(sync.current().clamped);
        QCOMPARE(sync.current().size(), QSize(11816, 21664));
        QCOMPARE(spy.count(), 2);
    }

    // Zooming inside the clamped range keeps publishing the camera scale
    void testClampedZoomRepublishes() {
        CameraStore store;
        ResolutionSync sync(&store);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("clamped to"));
        sync.setDevicePixelRatio(3.0);
        store.setScale(4.0);
        QVERIFY(sync.current().clamped);
        QCOMPARE(sync.current().scale, 4.0);
        const QSize clampedSize = sync.current().size();

        QSignalSpy spy(&sync, &ResolutionSync::resolutionChanged);
        store.setScale(4.5);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.takeFirst().at(0).value<PhysicalResolution>().scale, 4.5);
        QCOMPARE(sync.current().size(), clampedSize);

        store.setScale(6.0);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(sync.current().scale, 6.0);
        QCOMPARE(sync.current().size(), clampedSize);
    }
};

#endif // RESOLUTIONSYNCTESTS_H
