#pragma once

// ============================================================================
// CameraState - Value types shared by the camera engine
// ============================================================================
// World space is the virtual canvas: the page sits at (pageMargin, pageMargin)
// and virtualSize = pageSize + 2 * pageMargin. Scroll values are world units
// (unscaled); scale maps world units to viewport pixels.
// ============================================================================

#include <QMetaType>
#include <QPointF>
#include <QSizeF>
#include <QTransform>
#include <optional>

/**
 * @brief Whether the camera is driven by the fit controller or by the user.
 */
enum class FitMode {
    FitWidth,   ///< Camera is auto-computed to fit the page width
    Free        ///< User controls scale and scroll directly
};

/**
 * @brief Bounds enforced on every camera write.
 *
 * minScale <= maxScale, both > 0. The store repairs violating values.
 */
struct CameraConstraints {
    qreal minScale = 0.25;
    qreal maxScale = 6.0;
    bool enablePan = true;
    bool enableZoom = true;

    bool operator==(const CameraConstraints& other) const {
        return qFuzzyCompare(minScale, other.minScale) &&
               qFuzzyCompare(maxScale, other.maxScale) &&
               enablePan == other.enablePan &&
               enableZoom == other.enableZoom;
    }
    bool operator!=(const CameraConstraints& other) const { return !(*this == other); }
};

/**
 * @brief The camera triple: scale plus the world point at the viewport's top-left.
 */
struct ViewState {
    qreal scale = 1.0;
    qreal scrollX = 0.0;
    qreal scrollY = 0.0;

    QPointF scroll() const { return QPointF(scrollX, scrollY); }
};

/**
 * @brief The complete camera model. One instance per mounted viewport.
 */
struct CameraState {
    qreal scale = 1.0;
    qreal scrollX = 0.0;
    qreal scrollY = 0.0;

    QSizeF viewportSize;                    ///< Last measured viewport size (logical px)
    QSizeF pageSize = QSizeF(1200, 2200);   ///< Fixed logical page size
    qreal pageMargin = 64.0;                ///< Virtual padding around the page (world units)
    QSizeF virtualSize = QSizeF(1200 + 2 * 64.0, 2200 + 2 * 64.0);
    qreal scrollGutter = 0.0;               ///< Scroll slack beyond the clamp range

    FitMode fitMode = FitMode::FitWidth;
    CameraConstraints constraints;

    bool viewportReady = false;             ///< Set once a non-empty viewport was measured

    ViewState viewState() const { return ViewState{scale, scrollX, scrollY}; }

    /**
     * @brief Top-left of the page in world coordinates.
     */
    QPointF pageOrigin() const { return QPointF(pageMargin, pageMargin); }
};

/**
 * @brief Partial update for CameraStore::set(). Unset fields keep their value.
 */
struct CameraPatch {
    std::optional<qreal> scale;
    std::optional<qreal> scrollX;
    std::optional<qreal> scrollY;
    std::optional<QSizeF> viewportSize;
    std::optional<QSizeF> pageSize;
    std::optional<qreal> pageMargin;
    std::optional<qreal> scrollGutter;
    std::optional<FitMode> fitMode;
    std::optional<CameraConstraints> constraints;

    static CameraPatch fromViewState(const ViewState& v) {
        CameraPatch p;
        p.scale = v.scale;
        p.scrollX = v.scrollX;
        p.scrollY = v.scrollY;
        return p;
    }
};

/**
 * @brief The visual camera transform, computed once per camera change.
 *
 * Viewport pixel = world point * scale + offset. This is the only channel
 * through which the camera is applied to what is drawn.
 */
struct ViewTransform {
    qreal scale = 1.0;
    qreal offsetX = 0.0;    ///< -scrollX * scale
    qreal offsetY = 0.0;    ///< -scrollY * scale

    QTransform toTransform() const {
        return QTransform(scale, 0, 0, scale, offsetX, offsetY);
    }
    QPointF worldToViewport(QPointF worldPt) const {
        return QPointF(worldPt.x() * scale + offsetX, worldPt.y() * scale + offsetY);
    }
};

Q_DECLARE_METATYPE(CameraState)
Q_DECLARE_METATYPE(ViewState)
Q_DECLARE_METATYPE(ViewTransform)
Q_DECLARE_METATYPE(FitMode)
