// ============================================================================
// FolioView - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QSettings>
#include <QTest>

#include "MainWindow.h"
#include "viewport/PageViewport.h"

// Test includes (desktop only)
#ifndef Q_OS_ANDROID
#include "core/ViewportMathTests.h"
#include "core/CameraStoreTests.h"
#include "core/FitControllerTests.h"
#include "core/ResolutionSyncTests.h"
#include "core/ViewportSettingsTests.h"
#include "input/InputArbiterTests.h"
#include "viewport/PageViewportTests.h"
#endif

// ============================================================================
// Command Line Helpers
// ============================================================================

/**
 * @brief Parse "WxH" into a size. Returns an empty size on malformed input.
 */
static QSizeF parsePageSize(const QString& text)
{
    const QStringList parts = text.toLower().split('x');
    if (parts.size() != 2) {
        return QSizeF();
    }
    bool okW = false;
    bool okH = false;
    const qreal w = parts[0].toDouble(&okW);
    const qreal h = parts[1].toDouble(&okH);
    if (!okW || !okH || w <= 0 || h <= 0) {
        return QSizeF();
    }
    return QSizeF(w, h);
}

// ============================================================================
// Test Runners (Desktop Only)
// ============================================================================

#ifndef Q_OS_ANDROID
static int runTests(const QString& testType)
{
    if (testType == "math") {
        return ViewportMathTests::runAllTests() ? 0 : 1;
    } else if (testType == "store") {
        CameraStoreTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "fit") {
        FitControllerTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "resolution") {
        ResolutionSyncTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "settings") {
        ViewportSettingsTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "input") {
        InputArbiterTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "viewport") {
        PageViewportTests tests;
        return QTest::qExec(&tests);
    }

    qWarning() << "Unknown test suite:" << testType;
    return 2;
}
#endif

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("FolioView");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QSizeF pageOverride;
    qreal dprOverride = 0.0;

#ifndef Q_OS_ANDROID
    QString testToRun;
#endif

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--page" && i + 1 < argc) {
            pageOverride = parsePageSize(QString::fromLocal8Bit(argv[++i]));
            if (pageOverride.isEmpty()) {
                qWarning() << "Ignoring malformed --page value, expected WxH";
            }
        } else if (arg == "--dpr-override" && i + 1 < argc) {
            bool ok = false;
            dprOverride = QString::fromLocal8Bit(argv[++i]).toDouble(&ok);
            if (!ok || dprOverride <= 0) {
                qWarning() << "Ignoring malformed --dpr-override value";
                dprOverride = 0.0;
            }
        }
#ifndef Q_OS_ANDROID
        else if (arg.startsWith("--test-")) {
            testToRun = arg.mid(int(qstrlen("--test-")));
        }
#endif
    }

#ifndef Q_OS_ANDROID
    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }
#endif

    // ========== Settings ==========
    MainWindow window(ViewportSettings::load());
    // Command-line overrides apply to this run and are not saved on close
    if (!pageOverride.isEmpty()) {
        window.viewport()->setPageSize(pageOverride);
    }
    if (dprOverride > 0) {
        window.viewport()->setDevicePixelRatioOverride(dprOverride);
    }
    window.show();

    return app.exec();
}
