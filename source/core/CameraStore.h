#pragma once

// ============================================================================
// CameraStore - Single source of truth for the viewport camera
// ============================================================================
// Owns one CameraState. Every write goes through set(), which sanitizes the
// patch, re-clamps scale against the constraints and scroll against the
// virtual canvas, and notifies subscribers synchronously when (and only when)
// something observable changed.
//
// Writers tag themselves with a WriteOrigin. Automatic writes (fit controller)
// are dropped while auto writes are suspended, unless forced.
// ============================================================================

#include "CameraState.h"

#include <QObject>
#include <functional>

/**
 * @brief Who is writing to the store.
 */
enum class WriteOrigin {
    User,   ///< Input arbitration or a programmatic command
    Auto    ///< Fit controller (mount, resize re-fit)
};

/**
 * @brief Options for CameraStore::set().
 */
struct WriteOptions {
    bool force = false;                     ///< Bypass suspension gating (never the numeric invariants)
    WriteOrigin origin = WriteOrigin::User;
};

class CameraStore : public QObject
{
    Q_OBJECT

public:
    explicit CameraStore(QObject* parent = nullptr);
    explicit CameraStore(const CameraState& initial, QObject* parent = nullptr);
    ~CameraStore() override = default;

    // ===== Read =====

    /**
     * @brief Read-only snapshot of the full camera model.
     */
    const CameraState& state() const { return m_state; }

    ViewState viewState() const { return m_state.viewState(); }
    qreal scale() const { return m_state.scale; }
    FitMode fitMode() const { return m_state.fitMode; }
    const CameraConstraints& constraints() const { return m_state.constraints; }

    /**
     * @brief round(scale * 100), for zoom displays.
     */
    int zoomPercent() const;

    /**
     * @brief Page size in viewport pixels at the current scale.
     */
    QSizeF scaledPageSize() const;

    // ===== Write =====

    /**
     * @brief Merge a partial update into the camera.
     *
     * @return true if subscribers were notified, false if the write was gated
     *         (auto write while suspended) or produced no observable change.
     */
    bool set(const CameraPatch& patch, const WriteOptions& options = WriteOptions());

    bool setScale(qreal scale, WriteOrigin origin = WriteOrigin::User);
    bool setViewState(const ViewState& view, const WriteOptions& options = WriteOptions());

    /**
     * @brief Translate the camera by a world-space delta.
     * No-op when constraints.enablePan is false.
     */
    bool pan(qreal dx, qreal dy);

    bool setViewportSize(QSizeF size);
    bool setPageSize(QSizeF size);
    bool setPageMargin(qreal margin);
    bool setScrollGutter(qreal gutter);
    bool setConstraints(const CameraConstraints& constraints);
    bool setFitMode(FitMode mode);

    // ===== Suspension gate =====

    /**
     * @brief Gate for WriteOrigin::Auto writes. Maintained by FitController.
     */
    void setAutoWritesSuspended(bool suspended) { m_autoSuspended = suspended; }
    bool autoWritesSuspended() const { return m_autoSuspended; }

    // ===== Subscription =====

    /**
     * @brief Register a callback invoked after every published write.
     *
     * Callbacks run synchronously in registration order. The connection is
     * dropped automatically when context is destroyed.
     */
    QMetaObject::Connection subscribe(QObject* context,
                                      std::function<void(const CameraState&)> callback);
    void unsubscribe(const QMetaObject::Connection& connection);

signals:
    /**
     * @brief Emitted after every write that changed the camera model.
     */
    void changed(const CameraState& state);

    void scaleChanged(qreal scale);
    void fitModeChanged(FitMode mode);

    /**
     * @brief Emitted when page size, margin or gutter changed.
     */
    void geometryChanged();

    /**
     * @brief Emitted once, when the first non-empty viewport size is stored.
     */
    void viewportReady();

private:
    static CameraConstraints repairedConstraints(const CameraConstraints& requested,
                                                 const CameraConstraints& previous);
    static bool sameValue(qreal a, qreal b);
    static bool sameSize(const QSizeF& a, const QSizeF& b);

    CameraState m_state;
    bool m_autoSuspended = false;
};
