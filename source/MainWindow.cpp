#include "MainWindow.h"
#include "viewport/PageViewport.h"
#include "core/CameraStore.h"
#include "core/FitController.h"

#include <QAction>
#include <QCloseEvent>
#include <QDebug>
#include <QGridLayout>
#include <QLabel>
#include <QScrollBar>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QToolBar>

MainWindow::MainWindow(const ViewportSettings& settings, QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("FolioView"));
    resize(1100, 800);

    m_viewport = new PageViewport(settings, this);
    setupUi();
    setupToolbar();

    connect(m_viewport, &PageViewport::zoomPercentChanged, this, &MainWindow::updateZoomDisplay);
    connect(m_viewport, &PageViewport::physicalResolutionChanged, this, &MainWindow::updateResolutionDisplay);
    connect(m_viewport, &PageViewport::scrollFractionsChanged, this, &MainWindow::updateScrollBars);
    connect(m_viewport, &PageViewport::fitModeChanged, this, [this](FitMode mode) {
        m_modeLabel->setText(mode == FitMode::FitWidth ? tr("Fit width") : tr("Free"));
    });

    updateZoomDisplay(m_viewport->zoomPercent());
    updateResolutionDisplay(m_viewport->physicalResolution());
}

void MainWindow::setupUi()
{
    auto* central = new QWidget(this);
    auto* layout = new QGridLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    // Scroll bars are indicators driven by the camera; dragging them pans
    m_hScroll = new QScrollBar(Qt::Horizontal, central);
    m_vScroll = new QScrollBar(Qt::Vertical, central);
    m_hScroll->setRange(0, SCROLLBAR_RANGE);
    m_vScroll->setRange(0, SCROLLBAR_RANGE);

    layout->addWidget(m_viewport, 0, 0);
    layout->addWidget(m_vScroll, 0, 1);
    layout->addWidget(m_hScroll, 1, 0);
    setCentralWidget(central);

    auto scrollTo = [this](Qt::Orientation orientation, int value) {
        const CameraState& s = m_viewport->cameraState();
        const qreal scale = s.scale > 0 ? s.scale : 1.0;
        const qreal fraction = static_cast<qreal>(value) / SCROLLBAR_RANGE;
        ViewState view = s.viewState();
        if (orientation == Qt::Horizontal) {
            view.scrollX = fraction * qMax<qreal>(0.0, s.virtualSize.width() - s.viewportSize.width() / scale);
        } else {
            view.scrollY = fraction * qMax<qreal>(0.0, s.virtualSize.height() - s.viewportSize.height() / scale);
        }
        // Scroll-bar drags suspend auto-fit like any other user scroll
        m_viewport->fitController()->suspend(QStringLiteral("scrollbar"));
        m_viewport->setViewState(view);
    };
    connect(m_hScroll, &QScrollBar::valueChanged, this, [scrollTo](int v) { scrollTo(Qt::Horizontal, v); });
    connect(m_vScroll, &QScrollBar::valueChanged, this, [scrollTo](int v) { scrollTo(Qt::Vertical, v); });

    m_modeLabel = new QLabel(tr("Fit width"), this);
    m_resolutionLabel = new QLabel(this);
    statusBar()->addWidget(m_modeLabel);
    statusBar()->addPermanentWidget(m_resolutionLabel);
}

void MainWindow::setupToolbar()
{
    QToolBar* toolbar = addToolBar(tr("View"));
    toolbar->setMovable(false);

    // Shortcuts for these keys are owned by the viewport's input arbiter
    QAction* zoomOut = toolbar->addAction(tr("Zoom Out"));
    connect(zoomOut, &QAction::triggered, m_viewport, &PageViewport::zoomOut);

    m_zoomLabel = new QLabel(toolbar);
    m_zoomLabel->setMinimumWidth(56);
    m_zoomLabel->setAlignment(Qt::AlignCenter);
    toolbar->addWidget(m_zoomLabel);

    QAction* zoomIn = toolbar->addAction(tr("Zoom In"));
    connect(zoomIn, &QAction::triggered, m_viewport, &PageViewport::zoomIn);

    toolbar->addSeparator();

    QAction* fit = toolbar->addAction(tr("Fit Width"));
    connect(fit, &QAction::triggered, m_viewport, &PageViewport::fitWidth);

    QAction* recenter = toolbar->addAction(tr("Recenter"));
    recenter->setToolTip(tr("Resume auto-fit and recenter the page (Ctrl+0)"));
    connect(recenter, &QAction::triggered, m_viewport, &PageViewport::recenter);

    toolbar->addSeparator();

    m_panToolAction = toolbar->addAction(tr("Pan"));
    m_panToolAction->setCheckable(true);
    m_panToolAction->setToolTip(tr("Drag to pan (hold Space for a temporary pan)"));
    connect(m_panToolAction, &QAction::toggled, this, [this](bool checked) {
        m_viewport->setActiveTool(checked ? ToolType::Pan : ToolType::Select);
    });
}

// ===== Display updates =====

void MainWindow::updateZoomDisplay(int percent)
{
    const QString text = QStringLiteral("%1%").arg(percent);
    m_zoomLabel->setText(text);
    // Screen readers pick up the change through the accessible name
    m_zoomLabel->setAccessibleName(tr("Zoom %1 percent").arg(percent));
}

void MainWindow::updateResolutionDisplay(const PhysicalResolution& resolution)
{
    QString text = QStringLiteral("%1 x %2 @ %3")
                       .arg(resolution.width)
                       .arg(resolution.height)
                       .arg(resolution.effectiveDpr, 0, 'f', 2);
    if (resolution.clamped) {
        text += tr(" (clamped)");
    }
    m_resolutionLabel->setText(text);
}

void MainWindow::updateScrollBars(qreal horizontal, qreal vertical)
{
    const QSignalBlocker blockH(m_hScroll);
    const QSignalBlocker blockV(m_vScroll);
    m_hScroll->setValue(qRound(horizontal * SCROLLBAR_RANGE));
    m_vScroll->setValue(qRound(vertical * SCROLLBAR_RANGE));
}

// ===== Lifecycle =====

void MainWindow::closeEvent(QCloseEvent* event)
{
    m_viewport->settings().save();
    QMainWindow::closeEvent(event);
}
