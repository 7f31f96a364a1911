#pragma once
#include <djson/json.hpp>
#include <tilecam/projection.hpp>

namespace tilecam {
template <glm::length_t Dim, typename T = float>
glm::vec<Dim, T> glm_vec_from_json(dj::Json const& json, glm::vec<Dim, T> const& fallback = {}) {
	auto ret = glm::vec<Dim, T>{};
	ret.x = json[0].as<T>(fallback.x);
	if constexpr (Dim > 1) { ret.y = json[1].as<T>(fallback.y); }
	if constexpr (Dim > 2) { ret.z = json[2].as<T>(fallback.z); }
	return ret;
}

template <glm::length_t Dim, typename T = float>
void to_json(dj::Json& out, glm::vec<Dim, T> const& vec) {
	out.push_back(vec.x);
	if constexpr (Dim > 1) { out.push_back(vec.y); }
	if constexpr (Dim > 2) { out.push_back(vec.z); }
}

///
/// \brief Parse a world space name ("units" / "pixels").
/// \throws InvalidGridConfig on any other value
///
WorldSpace to_world_space(std::string_view name);

void from_json(dj::Json const& json, DepthRange& out);
void to_json(dj::Json& out, DepthRange const& depth_range);

///
/// \brief Read a grid configuration; absent keys keep the values already in out.
/// \throws InvalidGridConfig if the result does not validate
///
void from_json(dj::Json const& json, GridConfig& out);
void to_json(dj::Json& out, GridConfig const& config);

void to_json(dj::Json& out, FitResult const& fit);
void to_json(dj::Json& out, ProjectionResult const& projection);

///
/// \brief Load a grid configuration from a JSON file.
/// \throws Error if the file cannot be read or parsed
/// \throws InvalidGridConfig if its contents do not validate
///
GridConfig load_grid_config(char const* path);
} // namespace tilecam
