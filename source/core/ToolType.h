#pragma once

// ============================================================================
// ToolType - Active tool as seen by the viewport
// ============================================================================
// The camera engine only cares whether pointer-down should start a drag pan.
// Other tools belong to the drawing engine and pass pointer events through.
// ============================================================================

/**
 * @brief Tools the chrome can activate.
 */
enum class ToolType {
    Select,     ///< Pointer events go to the drawing engine
    Pen,        ///< Pointer events go to the drawing engine
    Eraser,     ///< Pointer events go to the drawing engine
    Pan         ///< Pointer drag pans the camera
};
