#pragma once

#include "tile_segment/core/types.hpp"
#include "tile_segment/io/raster_io.hpp"

#include <functional>

namespace tile_segment::pipeline {

struct PostprocessSettings {
    int blur_kernel_size = 5;    // median blur, enabled when > 1
    int morph_kernel_size = 0;   // open then close, enabled when > 1
    int max_tile_size = 512;

    bool enabled() const { return blur_kernel_size > 1 || morph_kernel_size > 1; }
};

// Pixels of context each window needs on every side.
int postprocess_overlap(const PostprocessSettings& settings);

// Stride of the post-process window grid, tile = min(max_tile_size,
// segmentation_tile_size) minus the overlap on both sides. 0 when the pass
// is disabled or needs no context. Throws ConfigError when nothing is left.
int postprocess_stride(const PostprocessSettings& settings, int segmentation_tile_size);

// Median blur (even sizes bumped to odd) followed by morphological open and
// close with a square kernel of ones.
LabelMap filter_labels(const LabelMap& labels, const PostprocessSettings& settings);

using PassProgress = std::function<void(int done, int total)>;

// Filters the finished label raster window by window, writing back each
// window minus `overlap` on every side that is not an image border.
// Returns the number of windows processed (0 when disabled).
int apply_postprocess_pass(io::RasterWriter& writer, int segmentation_tile_size,
                           const PostprocessSettings& settings, const PassProgress& progress = {});

} // namespace tile_segment::pipeline
