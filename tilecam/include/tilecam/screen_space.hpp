#pragma once
#include <tilecam/projection.hpp>
#include <optional>

namespace tilecam {
///
/// \brief Map a window pixel position (origin top-left, y down) to a world position (y up).
/// \param fit Fitted viewport
/// \param projection Projection derived from fit
/// \param screen Position in window pixels
/// \param camera_position World position of the camera
/// \returns World position, or std::nullopt if screen lies outside the visible part of the viewport
///
std::optional<glm::vec2> screen_to_world(FitResult const& fit, ProjectionResult const& projection, glm::vec2 screen, glm::vec2 camera_position = {});

///
/// \brief Map a world position to window pixels; inverse of screen_to_world.
///
/// The result may lie outside the window.
///
glm::vec2 world_to_screen(FitResult const& fit, ProjectionResult const& projection, glm::vec2 world, glm::vec2 camera_position = {});
} // namespace tilecam
