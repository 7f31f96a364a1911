#include <tilecam/screen_space.hpp>

namespace tilecam {
std::optional<glm::vec2> screen_to_world(FitResult const& fit, ProjectionResult const& projection, glm::vec2 const screen, glm::vec2 const camera_position) {
	if (!fit.visible_rect().contains(screen)) { return {}; }
	auto const uv = (screen - glm::vec2{fit.viewport_origin}) / glm::vec2{fit.viewport_size};
	auto const extent = projection.extent();
	auto const local = glm::vec2{projection.left + uv.x * extent.x, projection.top - uv.y * extent.y};
	return local + camera_position;
}

glm::vec2 world_to_screen(FitResult const& fit, ProjectionResult const& projection, glm::vec2 const world, glm::vec2 const camera_position) {
	auto const local = world - camera_position;
	auto const uv = glm::vec2{(local.x - projection.left) / projection.extent().x, (projection.top - local.y) / projection.extent().y};
	return glm::vec2{fit.viewport_origin} + uv * glm::vec2{fit.viewport_size};
}
} // namespace tilecam
