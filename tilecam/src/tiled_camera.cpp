#include <glm/gtc/matrix_transform.hpp>
#include <tilecam/screen_space.hpp>
#include <tilecam/tiled_camera.hpp>
#include <tilecam/util/error.hpp>

namespace tilecam {
void TiledCamera::set_config(GridConfig config) {
	m_config = config;
	if (!m_view) { return; }
	auto const window = m_view->fit.window;
	m_view.reset();
	refit(window);
}

bool TiledCamera::refit(WindowSize const window) {
	auto next = View{};
	try {
		next.fit = fit(window, m_config);
	} catch (InvalidWindowSize const& e) {
		log.warn("{}; keeping last view", e.what());
		return false;
	}
	next.projection = project(next.fit, m_config);
	if (m_view == next) { return false; }
	log.debug("window [{}x{}] => scale {}, viewport [{}x{}] at [{}, {}]", window.x, window.y, next.fit.scale, next.fit.viewport_size.x,
			  next.fit.viewport_size.y, next.fit.viewport_origin.x, next.fit.viewport_origin.y);
	m_view = next;
	return true;
}

glm::mat4 TiledCamera::view_matrix() const { return glm::translate(glm::mat4{1.0f}, glm::vec3{-position, 0.0f}); }

glm::mat4 TiledCamera::projection_matrix() const {
	if (!m_view) { return glm::mat4{1.0f}; }
	return m_view->projection.matrix();
}

std::optional<glm::vec2> TiledCamera::screen_to_world(glm::vec2 const screen) const {
	if (!m_view) { return {}; }
	return tilecam::screen_to_world(m_view->fit, m_view->projection, screen, position);
}
} // namespace tilecam
