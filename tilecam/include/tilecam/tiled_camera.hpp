#pragma once
#include <tilecam/projection.hpp>
#include <tilecam/util/logger.hpp>
#include <optional>

namespace tilecam {
///
/// \brief Host-side owner of a GridConfig and the last valid fit / projection pair.
///
/// fit() and project() stay pure; this class only caches their output and decides what to keep when a
/// resize delivers an unusable window size. Callers drive it explicitly: call refit() on every resize notification.
///
class TiledCamera {
  public:
	///
	/// \brief Fit and projection computed for the same window.
	///
	struct View {
		FitResult fit{};
		ProjectionResult projection{};

		bool operator==(View const&) const = default;
	};

	explicit TiledCamera(GridConfig config = {}) : m_config(config) {}

	GridConfig const& config() const { return m_config; }
	///
	/// \brief Replace the grid configuration.
	///
	/// Re-fits against the last valid window, if any.
	///
	void set_config(GridConfig config);

	///
	/// \brief Recompute the view for a new window size.
	/// \param window Window size in physical pixels
	/// \returns true if the cached view changed
	///
	/// An invalid window size is logged and skipped; the previous view is retained.
	///
	bool refit(WindowSize window);

	///
	/// \brief Last valid view, if any window has been fitted yet.
	///
	std::optional<View> const& view() const { return m_view; }

	///
	/// \brief World-space transform of the camera.
	///
	glm::mat4 view_matrix() const;
	///
	/// \brief Projection matrix of the cached view (identity if none).
	///
	glm::mat4 projection_matrix() const;

	///
	/// \brief Convert a cursor position in window pixels to a world position.
	/// \returns std::nullopt if no view is cached or the cursor is outside the viewport
	///
	std::optional<glm::vec2> screen_to_world(glm::vec2 screen) const;

	glm::vec2 position{};
	Logger log{"TiledCamera"};

  private:
	GridConfig m_config{};
	std::optional<View> m_view{};
};
} // namespace tilecam
