#pragma once

#include "tile_segment/core/types.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace tile_segment::tiling {

// Number of tile origins along one axis: 1 if length <= tile_size,
// otherwise ceil((length - tile_size) / stride) + 1.
int tiles_per_axis(int length, int tile_size, int stride);

// Smallest (height, width) >= the image that an integer number of strided
// tiles covers exactly.
std::pair<int, int> calculate_extended_dimensions(int height, int width, int tile_size, int stride);

// Full tile_size x tile_size windows at multiples of stride, row-major.
// Windows may extend past (height, width); reads must be boundless.
std::vector<Window> generate_windows(int height, int width, int tile_size, int stride);

// Same grid as generate_windows but every window is clipped to the image.
std::vector<Window> generate_postprocess_windows(int height, int width, int tile_size, int stride);

bool validate_full_coverage(int height, int width, const std::vector<Window>& windows);

std::optional<Window> clip_window_to_image(const Window& window, int height, int width);

EdgeFlags classify_edges(const Window& window, int height, int width);

} // namespace tile_segment::tiling
