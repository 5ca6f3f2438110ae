#include "PageViewport.h"
#include "PageSurface.h"
#include "core/CameraStore.h"
#include "core/FitController.h"
#include "core/ViewportMath.h"
#include "input/InputArbiter.h"

#include <QApplication>
#include <QDebug>
#include <QResizeEvent>
#include <QScreen>
#include <QShowEvent>
#include <QWheelEvent>
#include <QWindow>
#include <cmath>

// ============================================================================
// Construction
// ============================================================================

PageViewport::PageViewport(QWidget* parent)
    : PageViewport(ViewportSettings(), parent)
{
}

PageViewport::PageViewport(const ViewportSettings& settings, QWidget* parent)
    : QWidget(parent)
    , m_settings(settings)
{
    init();
    applySettings(settings);
}

PageViewport::~PageViewport()
{
    // Tear input down first: its filters point at this widget and its children
    if (m_arbiter) {
        m_arbiter->detach();
    }
    if (m_fit) {
        m_fit->stopAnimation();
    }
}

void PageViewport::init()
{
    setObjectName(QStringLiteral("PageViewport"));
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_AcceptTouchEvents, true);

    m_store = new CameraStore(this);
    m_fit = new FitController(m_store, this);
    m_resolution = new ResolutionSync(m_store, this);
    m_arbiter = new InputArbiter(m_store, m_fit, this);

    m_surface = new PageSurface(this);
    m_surface->setGeometry(rect());
    m_engine = m_surface;

    connect(m_store, &CameraStore::changed, this, &PageViewport::onCameraChanged);
    connect(m_store, &CameraStore::geometryChanged, this, &PageViewport::onGeometryChanged);
    connect(m_store, &CameraStore::fitModeChanged, this, &PageViewport::fitModeChanged);

    connect(m_resolution, &ResolutionSync::resolutionChanged, this, [this](const PhysicalResolution& r) {
        if (m_engine) {
            m_engine->applyPhysicalResolution(r);
        }
        emit physicalResolutionChanged(r);
    });

    // Attach after the surface exists so it is filtered from the start
    m_arbiter->attach(this);

    syncDevicePixelRatio();
    publishTransform(m_store->state());
}

// ============================================================================
// Configuration
// ============================================================================

void PageViewport::applySettings(const ViewportSettings& settings)
{
    m_settings = settings;
    m_settings.sanitize();

    CameraPatch patch;
    patch.constraints = m_settings.constraints();
    patch.pageSize = m_settings.pageSize();
    patch.pageMargin = m_settings.pageMargin;
    patch.scrollGutter = m_settings.scrollGutter;
    m_store->set(patch, WriteOptions{true, WriteOrigin::User});

    m_fit->setConfig(m_settings.fitConfig());

    m_arbiter->setWheelBaseSensitivity(m_settings.wheelBaseSensitivity);
    m_arbiter->setKeyboardBaseStep(m_settings.keyboardBaseStep);
    m_arbiter->setSignificanceEpsilon(m_settings.significanceEpsilon);
    m_arbiter->setResizeDebounceMs(m_settings.resizeDebounceMs);

    onGeometryChanged();
}

void PageViewport::setDevicePixelRatioOverride(qreal dpr)
{
    m_dprOverride = (std::isfinite(dpr) && dpr > 0) ? dpr : 0.0;
    syncDevicePixelRatio();
}

qreal PageViewport::effectiveDevicePixelRatio() const
{
    return m_dprOverride > 0 ? m_dprOverride : devicePixelRatioF();
}

// ============================================================================
// Read
// ============================================================================

ViewState PageViewport::camera() const
{
    return m_store->viewState();
}

const CameraState& PageViewport::cameraState() const
{
    return m_store->state();
}

FitMode PageViewport::fitMode() const
{
    return m_store->fitMode();
}

int PageViewport::zoomPercent() const
{
    return m_store->zoomPercent();
}

QSizeF PageViewport::scaledPageSize() const
{
    return m_store->scaledPageSize();
}

PhysicalResolution PageViewport::physicalResolution() const
{
    return m_resolution->current();
}

QPointF PageViewport::scrollFractions() const
{
    const CameraState& s = m_store->state();
    const qreal scale = ViewportMath::sanitizeScale(s.scale);

    auto fraction = [](qreal scroll, qreal maxScroll) {
        if (maxScroll <= 0) {
            return 0.0;
        }
        return qBound<qreal>(0.0, scroll / maxScroll, 1.0);
    };

    const qreal maxX = qMax<qreal>(0.0, s.virtualSize.width() - s.viewportSize.width() / scale);
    const qreal maxY = qMax<qreal>(0.0, s.virtualSize.height() - s.viewportSize.height() / scale);
    return QPointF(fraction(s.scrollX, maxX), fraction(s.scrollY, maxY));
}

// ============================================================================
// Commands
// ============================================================================

bool PageViewport::setScale(qreal scale)
{
    return m_arbiter->zoomTo(scale, QRectF(rect()).center());
}

bool PageViewport::zoomIn()
{
    const CameraConstraints& c = m_store->constraints();
    const qreal target = ViewportMath::applyZoomTicks(m_store->scale(), 1, c.minScale, c.maxScale,
                                                      m_settings.keyboardBaseStep);
    return setScale(target);
}

bool PageViewport::zoomOut()
{
    const CameraConstraints& c = m_store->constraints();
    const qreal target = ViewportMath::applyZoomTicks(m_store->scale(), -1, c.minScale, c.maxScale,
                                                      m_settings.keyboardBaseStep);
    return setScale(target);
}

bool PageViewport::pan(qreal dx, qreal dy)
{
    return m_store->pan(dx, dy);
}

bool PageViewport::setViewState(const ViewState& view)
{
    return m_store->setViewState(view);
}

bool PageViewport::fitWidth()
{
    return m_fit->fitWidth();
}

bool PageViewport::recenter()
{
    return m_fit->recenter();
}

void PageViewport::setActiveTool(ToolType tool)
{
    m_arbiter->setActiveTool(tool);
}

ToolType PageViewport::activeTool() const
{
    return m_arbiter->activeTool();
}

void PageViewport::setPageSize(QSizeF size)
{
    m_store->setPageSize(size);
}

void PageViewport::setDrawingEngine(DrawingEngine* engine)
{
    m_engine = engine ? engine : m_surface;
    m_surface->setVisible(m_engine == m_surface);

    const CameraState& s = m_store->state();
    m_engine->setPageGeometry(s.pageSize, s.pageMargin);
    m_engine->setViewTransform(m_transform);
    if (m_resolution->hasPublished()) {
        m_engine->applyPhysicalResolution(m_resolution->current());
    }
}

// ============================================================================
// Events
// ============================================================================

bool PageViewport::event(QEvent* event)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 6, 0)
    if (event->type() == QEvent::DevicePixelRatioChange) {
        syncDevicePixelRatio();
    }
#endif
    return QWidget::event(event);
}

void PageViewport::showEvent(QShowEvent* event)
{
    QWidget::showEvent(event);

    connectScreenTracking();
    syncDevicePixelRatio();

    // Mount as soon as there is a real viewport; an empty one mounts on the first resize frame
    m_store->setViewportSize(size());
    m_fit->mount();
}

void PageViewport::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    // The surface tracks the widget immediately; the camera follows after the debounce
    m_surface->setGeometry(rect());
}

void PageViewport::wheelEvent(QWheelEvent* event)
{
    // Only unmodified wheel reaches here: modified wheel is consumed by the arbiter.
    const CameraState& s = m_store->state();
    const qreal scale = ViewportMath::sanitizeScale(s.scale);

    qreal dx = 0.0;
    qreal dy = 0.0;
    const QPoint pixelDelta = event->pixelDelta();
    const QPoint angleDelta = event->angleDelta();
    if (!pixelDelta.isNull()) {
        dx = -pixelDelta.x();
        dy = -pixelDelta.y();
    } else if (!angleDelta.isNull()) {
        const qreal lines = QApplication::wheelScrollLines();
        dx = ViewportMath::normalizedWheelDelta(-angleDelta.x() / 120.0 * lines,
                                                ViewportMath::DeltaMode::Line, height());
        dy = ViewportMath::normalizedWheelDelta(-angleDelta.y() / 120.0 * lines,
                                                ViewportMath::DeltaMode::Line, height());
    }

    // Shift scrolls horizontally
    if (event->modifiers().testFlag(Qt::ShiftModifier)) {
        qSwap(dx, dy);
    }

    if (qFuzzyIsNull(dx) && qFuzzyIsNull(dy)) {
        event->ignore();
        return;
    }

    CameraPatch patch;
    patch.scrollX = s.scrollX + dx / scale;
    patch.scrollY = s.scrollY + dy / scale;
    m_store->set(patch);
    event->accept();
}

// ============================================================================
// Publishing
// ============================================================================

void PageViewport::onCameraChanged(const CameraState& state)
{
    publishTransform(state);
    emit cameraChanged(state);

    const int percent = qRound(state.scale * 100.0);
    if (percent != m_lastZoomPercent) {
        m_lastZoomPercent = percent;
        emit zoomPercentChanged(percent);
    }

    const QPointF fractions = scrollFractions();
    if (fractions != m_lastScrollFractions) {
        m_lastScrollFractions = fractions;
        emit scrollFractionsChanged(fractions.x(), fractions.y());
    }
}

void PageViewport::onGeometryChanged()
{
    const CameraState& s = m_store->state();
    if (m_engine) {
        m_engine->setPageGeometry(s.pageSize, s.pageMargin);
    }
}

void PageViewport::publishTransform(const CameraState& state)
{
    m_transform = ViewportMath::viewTransform(state.viewState());

    // Readable from QSS and by child widgets
    setProperty("scale", m_transform.scale);
    setProperty("offsetX", m_transform.offsetX);
    setProperty("offsetY", m_transform.offsetY);

    if (m_engine) {
        m_engine->setViewTransform(m_transform);
    }
    emit viewTransformChanged(m_transform);
}

void PageViewport::syncDevicePixelRatio()
{
    m_resolution->setDevicePixelRatio(effectiveDevicePixelRatio());
    if (!m_resolution->hasPublished()) {
        m_resolution->refresh();
    }
}

void PageViewport::connectScreenTracking()
{
    if (m_screenConnection) {
        return;
    }
    QWidget* top = window();
    QWindow* handle = top ? top->windowHandle() : nullptr;
    if (!handle) {
        return;
    }
    m_screenConnection = connect(handle, &QWindow::screenChanged, this, [this](QScreen*) {
#if FOLIOVIEW_DEBUG
        qDebug() << "[CanvasResolution] screen changed, dpr" << effectiveDevicePixelRatio();
#endif
        syncDevicePixelRatio();
    });
}
