#pragma once

// ============================================================================
// ViewportSettings - Persistent camera constraints and tuning constants
// ============================================================================
// Stored in QSettings under the "viewport" group. Values that fail validation
// are replaced by their defaults (with a warning) when loaded.
// ============================================================================

#include "CameraState.h"
#include "FitController.h"

#include <QSizeF>

class QSettings;

struct ViewportSettings {
    // ===== Constraints =====
    qreal minScale = 0.25;
    qreal maxScale = 6.0;
    bool enablePan = true;
    bool enableZoom = true;

    // ===== Page geometry =====
    qreal pageWidth = 1200.0;
    qreal pageHeight = 2200.0;
    qreal pageMargin = 64.0;
    qreal scrollGutter = 0.0;

    // ===== Fit and hysteresis =====
    qreal fitPadding = 80.0;
    qreal deviationEpsilon = 0.02;
    int nudgeThreshold = 3;
    int nudgeWindowMs = 2000;

    // ===== Zoom feel =====
    qreal significanceEpsilon = 0.002;
    qreal wheelBaseSensitivity = 0.0005;
    qreal keyboardBaseStep = 0.08;

    // ===== Timing =====
    int resizeDebounceMs = 120;
    int fitAnimationMs = 200;

    /**
     * @brief Load from the "viewport" group, validating every value.
     */
    static ViewportSettings load(QSettings& settings);

    /**
     * @brief Load from QSettings("FolioView", "App").
     */
    static ViewportSettings load();

    void save(QSettings& settings) const;
    void save() const;

    /**
     * @brief Replace invalid fields by their defaults.
     * @return Number of fields that were replaced.
     */
    int sanitize();

    CameraConstraints constraints() const;
    QSizeF pageSize() const { return QSizeF(pageWidth, pageHeight); }
    FitConfig fitConfig() const;
};
