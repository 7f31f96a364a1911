#pragma once

namespace tilecam {
constexpr bool debug_v =
#if defined(TILECAM_DEBUG)
	true;
#else
	false;
#endif
} // namespace tilecam
