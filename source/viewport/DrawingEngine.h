#pragma once

// ============================================================================
// DrawingEngine - What the camera engine needs from whoever draws the page
// ============================================================================
// The camera engine never reads sizes back from the drawing engine. It pushes
// the view transform and the physical backing-store size; the engine applies
// them to its own rendering.
// ============================================================================

#include "core/CameraState.h"
#include "core/ResolutionSync.h"

class DrawingEngine
{
public:
    virtual ~DrawingEngine() = default;

    /**
     * @brief World -> viewport transform for the current camera.
     */
    virtual void setViewTransform(const ViewTransform& transform) = 0;

    /**
     * @brief Size the backing store for the current scale and DPR.
     */
    virtual void applyPhysicalResolution(const PhysicalResolution& resolution) = 0;

    /**
     * @brief Page geometry in world units. The page sits at (margin, margin).
     */
    virtual void setPageGeometry(QSizeF pageSize, qreal pageMargin) = 0;
};
