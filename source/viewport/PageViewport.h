#pragma once

// ============================================================================
// PageViewport - The scroll container hosting one fixed-size page
// ============================================================================
// PageViewport is a QWidget that:
// - Owns the camera engine (store, fit controller, input arbiter, resolution sync)
// - Publishes one ViewTransform per camera change (signal + dynamic properties)
// - Hosts a DrawingEngine (PageSurface by default) and feeds it transform,
//   page geometry and physical resolution
// - Exposes the command surface used by chrome (zoom buttons, fit, recenter)
// - Performs plain container scrolling for unmodified wheel events
// ============================================================================

#include "DrawingEngine.h"
#include "core/CameraState.h"
#include "core/ResolutionSync.h"
#include "core/ToolType.h"
#include "core/ViewportSettings.h"

#include <QMetaObject>
#include <QWidget>

class CameraStore;
class FitController;
class InputArbiter;
class PageSurface;

class PageViewport : public QWidget
{
    Q_OBJECT

public:
    explicit PageViewport(QWidget* parent = nullptr);
    explicit PageViewport(const ViewportSettings& settings, QWidget* parent = nullptr);
    ~PageViewport() override;

    // ===== Configuration =====

    /**
     * @brief Push constraints, page geometry and tuning into every component.
     */
    void applySettings(const ViewportSettings& settings);
    const ViewportSettings& settings() const { return m_settings; }

    /**
     * @brief Use a fixed device pixel ratio instead of the screen's (0 = screen).
     */
    void setDevicePixelRatioOverride(qreal dpr);
    qreal effectiveDevicePixelRatio() const;

    // ===== Read =====

    ViewState camera() const;
    const CameraState& cameraState() const;
    FitMode fitMode() const;
    int zoomPercent() const;
    QSizeF scaledPageSize() const;
    ViewTransform viewTransform() const { return m_transform; }
    PhysicalResolution physicalResolution() const;

    /**
     * @brief Horizontal and vertical scroll position as fractions in [0, 1].
     */
    QPointF scrollFractions() const;

    // ===== Commands =====

    /**
     * @brief Zoom to scale, anchored at the viewport centre.
     */
    bool setScale(qreal scale);

    /**
     * @brief One adaptive zoom step in or out, anchored at the viewport centre.
     */
    bool zoomIn();
    bool zoomOut();

    /**
     * @brief Translate the camera by a world-space delta.
     */
    bool pan(qreal dx, qreal dy);

    /**
     * @brief Restore a camera. Clamped; fit mode is untouched.
     */
    bool setViewState(const ViewState& view);

    bool fitWidth();
    bool recenter();

    void setActiveTool(ToolType tool);
    ToolType activeTool() const;

    /**
     * @brief Page geometry for this session only. settings() keeps the
     * stored default page size.
     */
    void setPageSize(QSizeF size);

    // ===== Collaborators =====

    /**
     * @brief Replace the drawing engine. Ownership is not taken.
     * Passing nullptr restores the built-in PageSurface.
     */
    void setDrawingEngine(DrawingEngine* engine);
    DrawingEngine* drawingEngine() const { return m_engine; }

    CameraStore* store() const { return m_store; }
    FitController* fitController() const { return m_fit; }
    InputArbiter* arbiter() const { return m_arbiter; }
    ResolutionSync* resolutionSync() const { return m_resolution; }
    PageSurface* surface() const { return m_surface; }

signals:
    void cameraChanged(const CameraState& state);
    void viewTransformChanged(const ViewTransform& transform);
    void physicalResolutionChanged(const PhysicalResolution& resolution);
    void fitModeChanged(FitMode mode);
    void zoomPercentChanged(int percent);
    void scrollFractionsChanged(qreal horizontal, qreal vertical);

protected:
    bool event(QEvent* event) override;
    void showEvent(QShowEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    void init();
    void onCameraChanged(const CameraState& state);
    void onGeometryChanged();
    void publishTransform(const CameraState& state);
    void syncDevicePixelRatio();
    void connectScreenTracking();

    ViewportSettings m_settings;

    // ===== Engine =====
    CameraStore* m_store = nullptr;
    FitController* m_fit = nullptr;
    InputArbiter* m_arbiter = nullptr;
    ResolutionSync* m_resolution = nullptr;

    // ===== Drawing =====
    PageSurface* m_surface = nullptr;
    DrawingEngine* m_engine = nullptr;

    // ===== Published state =====
    ViewTransform m_transform;
    int m_lastZoomPercent = -1;
    QPointF m_lastScrollFractions = QPointF(-1, -1);
    qreal m_dprOverride = 0.0;
    QMetaObject::Connection m_screenConnection;
};
