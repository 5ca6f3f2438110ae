// ============================================================================
// PageSurface - Implementation
// ============================================================================

#include "PageSurface.h"

#include <QDebug>
#include <QPaintEvent>
#include <QPainter>

PageSurface::PageSurface(QWidget* parent)
    : QWidget(parent)
{
    // Opaque widget - no transparency needed
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setObjectName(QStringLiteral("PageSurface"));
}

void PageSurface::setViewTransform(const ViewTransform& transform)
{
    m_transform = transform;
    update();
}

void PageSurface::applyPhysicalResolution(const PhysicalResolution& resolution)
{
    if (resolution.width == m_resolution.width &&
        resolution.height == m_resolution.height &&
        qFuzzyCompare(resolution.effectiveDpr, m_resolution.effectiveDpr)) {
        return;
    }

    m_resolution = resolution;
    invalidateCache();
    update();
}

void PageSurface::setPageGeometry(QSizeF pageSize, qreal pageMargin)
{
    if (pageSize == m_pageSize && qFuzzyCompare(pageMargin + 1.0, m_pageMargin + 1.0)) {
        return;
    }

    m_pageSize = pageSize;
    m_pageMargin = pageMargin;
    invalidateCache();
    update();
}

void PageSurface::setLineSpacing(qreal spacing)
{
    if (qFuzzyCompare(spacing + 1.0, m_lineSpacing + 1.0)) {
        return;
    }
    m_lineSpacing = qMax<qreal>(0.0, spacing);
    invalidateCache();
    update();
}

void PageSurface::invalidateCache()
{
    m_cacheDirty = true;
}

void PageSurface::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), m_canvasColor);

    if (m_pageSize.isEmpty()) {
        return;
    }

    if (m_cacheDirty) {
        rebuildCache();
    }

    painter.setTransform(m_transform.toTransform());
    const QRectF pageRect(QPointF(m_pageMargin, m_pageMargin), m_pageSize);

    if (!m_cache.isNull()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.drawImage(pageRect, m_cache);
    } else {
        // Over budget (or nothing published yet): paint vectors straight through the transform
        painter.setRenderHint(QPainter::Antialiasing, true);
        paintPage(painter, pageRect);
    }

    // Page border, always a hairline in device pixels
    painter.setPen(QPen(QColor(180, 180, 180), 0));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(pageRect);
}

void PageSurface::rebuildCache()
{
    m_cacheDirty = false;
    m_cache = QImage();

    const QSize physical = m_resolution.size();
    if (physical.isEmpty()) {
        return;
    }
    if (static_cast<qint64>(physical.width()) * physical.height() > CACHE_PIXEL_BUDGET) {
#if FOLIOVIEW_DEBUG
        qDebug() << "[PageSurface] cache skipped, physical size" << physical << "over budget";
#endif
        return;
    }

    // Opaque image: blitting without alpha is cheaper
    QImage image(physical, QImage::Format_RGB32);

    QPainter cachePainter(&image);
    cachePainter.setRenderHint(QPainter::Antialiasing, true);
    cachePainter.scale(physical.width() / m_pageSize.width(),
                       physical.height() / m_pageSize.height());
    paintPage(cachePainter, QRectF(QPointF(0, 0), m_pageSize));
    cachePainter.end();

    m_cache = image;

#if FOLIOVIEW_DEBUG
    qDebug() << "[PageSurface] cache rebuilt at" << physical;
#endif
}

void PageSurface::paintPage(QPainter& painter, const QRectF& pageRect) const
{
    painter.save();

    // 1. Paper
    painter.fillRect(pageRect, m_paperColor);

    // 2. Ruled lines (cosmetic pens stay one device pixel wide at any zoom)
    if (m_lineSpacing > 0) {
        painter.setPen(QPen(m_ruleColor, 0));
        for (qreal y = pageRect.top() + m_lineSpacing * 3; y < pageRect.bottom(); y += m_lineSpacing) {
            painter.drawLine(QPointF(pageRect.left(), y), QPointF(pageRect.right(), y));
        }

        // 3. Margin line
        const qreal marginX = pageRect.left() + m_lineSpacing * 3;
        painter.setPen(QPen(m_marginColor, 0));
        painter.drawLine(QPointF(marginX, pageRect.top()), QPointF(marginX, pageRect.bottom()));
    }

    painter.restore();
}
