#pragma once

// ============================================================================
// ResolutionSync - Physical backing-store size for the drawing engine
// ============================================================================
// size = round(pageSize * scale * devicePixelRatio), scaled down proportionally
// when it would exceed the device limits. Always derived from the logical page
// size, never read back from the drawing engine.
// ============================================================================

#include <QMetaType>
#include <QObject>
#include <QPointer>
#include <QSizeF>

class CameraStore;

/**
 * @brief Published backing-store hint.
 */
struct PhysicalResolution {
    int width = 0;
    int height = 0;
    qreal scale = 1.0;          ///< Camera scale the size was computed for
    qreal effectiveDpr = 1.0;   ///< Physical pixels per world unit
    bool clamped = false;       ///< True if device limits reduced the size

    QSize size() const { return QSize(width, height); }
};

/**
 * @brief Device limits for a single backing store.
 */
struct DeviceLimits {
    int maxWidth = 16384;
    int maxHeight = 32768;
    qreal maxPixels = 256e6;
};

class ResolutionSync : public QObject
{
    Q_OBJECT

public:
    explicit ResolutionSync(CameraStore* store, QObject* parent = nullptr);
    ~ResolutionSync() override = default;

    /**
     * @brief Pure computation, exposed for tests and callers without a store.
     */
    static PhysicalResolution compute(QSizeF pageSize, qreal scale, qreal devicePixelRatio,
                                      const DeviceLimits& limits = DeviceLimits());

    void setDevicePixelRatio(qreal dpr);
    qreal devicePixelRatio() const { return m_dpr; }

    void setLimits(const DeviceLimits& limits);
    const DeviceLimits& limits() const { return m_limits; }

    /**
     * @brief The last published resolution.
     */
    const PhysicalResolution& current() const { return m_current; }
    bool hasPublished() const { return m_hasPublished; }

    /**
     * @brief Recompute from the store and publish if the result changed.
     * @return true if resolutionChanged was emitted.
     */
    bool refresh();

signals:
    void resolutionChanged(const PhysicalResolution& resolution);

private:
    QPointer<CameraStore> m_store;
    DeviceLimits m_limits;
    qreal m_dpr = 1.0;

    PhysicalResolution m_current;
    bool m_hasPublished = false;
    bool m_warnedClamp = false;
};

Q_DECLARE_METATYPE(PhysicalResolution)
