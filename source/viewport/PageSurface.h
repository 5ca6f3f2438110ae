// ============================================================================
// PageSurface - Reference drawing engine: a ruled paper page
// ============================================================================
// Paints the virtual canvas through the published ViewTransform. The page
// itself is rasterized into a cache image sized from the published physical
// resolution, so it stays crisp at any zoom without the widget measuring
// anything itself.
//
// Cache is rebuilt when:
// - The physical resolution changes (scale or DPR)
// - Page geometry changes
// When the physical size exceeds the cache budget the page is painted
// directly through the transform instead.
// ============================================================================

#pragma once

#include "DrawingEngine.h"

#include <QColor>
#include <QImage>
#include <QWidget>

class PageSurface : public QWidget, public DrawingEngine {
    Q_OBJECT

public:
    explicit PageSurface(QWidget* parent = nullptr);
    ~PageSurface() override = default;

    // ===== DrawingEngine =====

    void setViewTransform(const ViewTransform& transform) override;
    void applyPhysicalResolution(const PhysicalResolution& resolution) override;
    void setPageGeometry(QSizeF pageSize, qreal pageMargin) override;

    const ViewTransform& viewTransform() const { return m_transform; }
    const PhysicalResolution& physicalResolution() const { return m_resolution; }

    // ===== Appearance =====

    /**
     * @brief Distance between ruled lines in world units (0 = blank page).
     */
    void setLineSpacing(qreal spacing);
    qreal lineSpacing() const { return m_lineSpacing; }

    // ===== Cache Management =====

    void invalidateCache();
    bool isCacheValid() const { return !m_cacheDirty && !m_cache.isNull(); }

    /**
     * @brief Size of the cached page raster in physical pixels (empty if none).
     */
    QSize cacheSize() const { return m_cache.size(); }

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    void rebuildCache();
    void paintPage(QPainter& painter, const QRectF& pageRect) const;

    // Data
    ViewTransform m_transform;
    PhysicalResolution m_resolution;
    QSizeF m_pageSize = QSizeF(1200, 2200);
    qreal m_pageMargin = 64.0;
    qreal m_lineSpacing = 32.0;

    QColor m_canvasColor = QColor(64, 64, 64);
    QColor m_paperColor = QColor(255, 255, 255);
    QColor m_ruleColor = QColor(200, 215, 235);
    QColor m_marginColor = QColor(235, 170, 170);

    // Cache
    QImage m_cache;
    bool m_cacheDirty = true;

    // Above this many physical pixels the page is painted directly
    static constexpr qint64 CACHE_PIXEL_BUDGET = 24'000'000;
};
