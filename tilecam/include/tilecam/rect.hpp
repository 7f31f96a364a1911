#pragma once
#include <glm/vec2.hpp>
#include <algorithm>

namespace tilecam {
///
/// \brief Axis-aligned rectangle in window space (origin at the top-left, y down).
///
/// lt is inclusive and rb is exclusive.
///
template <typename Type = int>
struct Rect2D {
	glm::tvec2<Type> lt{};
	glm::tvec2<Type> rb{};

	static constexpr Rect2D from_origin_extent(glm::tvec2<Type> origin, glm::tvec2<Type> extent) { return {.lt = origin, .rb = origin + extent}; }

	constexpr glm::tvec2<Type> top_left() const { return lt; }
	constexpr glm::tvec2<Type> bottom_right() const { return rb; }

	constexpr glm::tvec2<Type> extent() const { return rb - lt; }
	constexpr bool empty() const { return rb.x <= lt.x || rb.y <= lt.y; }

	template <typename T>
	constexpr bool contains(glm::tvec2<T> const point) const {
		return static_cast<T>(lt.x) <= point.x && point.x < static_cast<T>(rb.x) && static_cast<T>(lt.y) <= point.y && point.y < static_cast<T>(rb.y);
	}

	///
	/// \brief Obtain the overlap of two rects.
	/// \returns Intersection (empty with zero extent if there is no overlap)
	///
	constexpr Rect2D intersect(Rect2D const& rhs) const {
		auto ret = Rect2D{.lt = {std::max(lt.x, rhs.lt.x), std::max(lt.y, rhs.lt.y)}, .rb = {std::min(rb.x, rhs.rb.x), std::min(rb.y, rhs.rb.y)}};
		if (ret.empty()) { return {.lt = ret.lt, .rb = ret.lt}; }
		return ret;
	}

	bool operator==(Rect2D const&) const = default;
};

using PixelRect = Rect2D<int>;
} // namespace tilecam
