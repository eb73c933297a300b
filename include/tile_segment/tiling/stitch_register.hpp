#pragma once

#include "tile_segment/core/types.hpp"
#include "tile_segment/tiling/weight_kernel.hpp"

namespace tile_segment::tiling {

struct StitchResult {
    ScoreMap scores;   // depth planes, window.height x window.width
    Window window;     // image coordinates of the emitted region
};

// Streaming accumulator for overlapping tiles at 50% overlap.
//
// The buffer is one tile row high (depth x S x RW, RW = ceil(W/S)*S + S/2)
// and holds the weighted sum of every tile written but not yet emitted.
// Tiles must arrive in row-major order with stride S/2. Each step adds one
// weighted tile at columns [col, col+S) and returns the part of it that no
// later tile can touch:
//
//   |a|b|    none          -> a         (c moves up, b|d kept)
//   |c|d|    right         -> a|b       (c|d moves up, bottom zeroed)
//            bottom        -> a over c  (left half cleared, b|d kept)
//            bottom+right  -> a|b over c|d
//
// Emitted sizes are clipped to the window passed in, which callers clip to
// the true image bounds.
class StitchRegister {
public:
    StitchRegister(int image_width, int depth, int window_size,
                   KernelFamily family = KernelFamily::BARTLETT_HANN);

    int depth() const { return depth_; }
    int window_size() const { return ws_; }
    int half_window() const { return hws_; }
    int height() const { return ws_; }
    int width() const { return width_; }
    const WeightKernel& kernel() const { return kernel_; }
    const ScoreMap& buffer() const { return buffer_; }

    // scores: depth planes of window_size x window_size raw (unweighted) values.
    StitchResult step(const ScoreMap& scores, const Window& window, const EdgeFlags& edges);

    void reset();

private:
    int depth_;
    int ws_;
    int hws_;
    int width_;
    WeightKernel kernel_;
    ScoreMap buffer_;
};

} // namespace tile_segment::tiling
