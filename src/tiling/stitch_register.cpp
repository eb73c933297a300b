#include "tile_segment/tiling/stitch_register.hpp"
#include "tile_segment/core/errors.hpp"

#include <algorithm>
#include <string>

namespace tile_segment::tiling {

StitchRegister::StitchRegister(int image_width, int depth, int window_size, KernelFamily family)
    : depth_(depth),
      ws_(window_size),
      hws_(window_size / 2),
      width_(0),
      kernel_(family, std::max(1, window_size)) {
    if (image_width < 1) {
        throw PipelineError("register image width must be >= 1");
    }
    if (depth < 1) {
        throw PipelineError("register depth must be >= 1");
    }
    if (window_size < 2) {
        throw PipelineError("register window size must be >= 2");
    }

    const int tiles = (image_width + ws_ - 1) / ws_;
    width_ = tiles * ws_ + hws_;

    buffer_.reserve(static_cast<size_t>(depth_));
    for (int k = 0; k < depth_; ++k) {
        buffer_.push_back(Matrix2Df::Zero(ws_, width_));
    }
}

void StitchRegister::reset() {
    for (auto& plane : buffer_) {
        plane.setZero();
    }
}

StitchResult StitchRegister::step(const ScoreMap& scores, const Window& window,
                                  const EdgeFlags& edges) {
    if (static_cast<int>(scores.size()) != depth_) {
        throw PipelineError("register expects " + std::to_string(depth_) + " score planes, got " +
                            std::to_string(scores.size()));
    }
    const int col = window.col_off;
    if (col < 0 || col + ws_ > width_) {
        throw PipelineError("window columns [" + std::to_string(col) + ", " +
                            std::to_string(col + ws_) + ") outside register width " +
                            std::to_string(width_));
    }
    if (window.height < 1 || window.width < 1) {
        throw PipelineError("cannot step an empty window");
    }

    ScoreMap weighted = scores;
    kernel_.apply(weighted, edges);

    const int tail_rows = ws_ - hws_;
    const int tail_cols = ws_ - hws_;

    StitchResult out;
    if (edges.right && edges.bottom) {
        out.window = Window{window.row_off, col, std::min(ws_, window.height), std::min(ws_, window.width)};
    } else if (edges.right) {
        out.window = Window{window.row_off, col, std::min(hws_, window.height), std::min(ws_, window.width)};
    } else if (edges.bottom) {
        out.window = Window{window.row_off, col, std::min(ws_, window.height), std::min(hws_, window.width)};
    } else {
        out.window = Window{window.row_off, col, std::min(hws_, window.height), std::min(hws_, window.width)};
    }
    out.scores.reserve(static_cast<size_t>(depth_));

    for (int k = 0; k < depth_; ++k) {
        Matrix2Df abcd = buffer_[static_cast<size_t>(k)].block(0, col, ws_, ws_) + weighted[static_cast<size_t>(k)];
        auto strip = buffer_[static_cast<size_t>(k)].block(0, col, ws_, ws_);

        out.scores.push_back(abcd.topLeftCorner(out.window.height, out.window.width));

        if (edges.right && edges.bottom) {
            // Last tile of the run: everything it touched has been emitted.
            strip.setZero();
        } else if (edges.right) {
            // |c|d| + pop a|b
            // |0|0|
            strip.topRows(tail_rows) = abcd.bottomRows(tail_rows);
            strip.bottomRows(ws_ - tail_rows).setZero();
        } else if (edges.bottom) {
            // |0|b| + pop a over c
            // |0|d|
            strip.leftCols(hws_).setZero();
            strip.rightCols(tail_cols) = abcd.rightCols(tail_cols);
        } else {
            // |c|b| + pop a
            // |0|d|
            strip.block(0, 0, tail_rows, hws_) = abcd.block(hws_, 0, tail_rows, hws_);
            strip.block(tail_rows, 0, ws_ - tail_rows, hws_).setZero();
            strip.rightCols(tail_cols) = abcd.rightCols(tail_cols);
        }
    }

    return out;
}

} // namespace tile_segment::tiling
