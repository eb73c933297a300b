#include "tile_segment/tiling/window_planner.hpp"
#include "tile_segment/core/errors.hpp"

#include <algorithm>
#include <string>

namespace tile_segment::tiling {

static void check_grid_args(int tile_size, int stride) {
    if (tile_size < 1) {
        throw ValidationError("tile_size must be >= 1, got " + std::to_string(tile_size));
    }
    if (stride < 1) {
        throw ValidationError("stride must be >= 1, got " + std::to_string(stride));
    }
}

int tiles_per_axis(int length, int tile_size, int stride) {
    check_grid_args(tile_size, stride);
    if (length <= tile_size) {
        return 1;
    }
    return (length - tile_size + stride - 1) / stride + 1;
}

std::pair<int, int> calculate_extended_dimensions(int height, int width, int tile_size, int stride) {
    const int tiles_y = tiles_per_axis(height, tile_size, stride);
    const int tiles_x = tiles_per_axis(width, tile_size, stride);

    const int extended_height = (tiles_y - 1) * stride + tile_size;
    const int extended_width = (tiles_x - 1) * stride + tile_size;

    return {std::max(extended_height, height), std::max(extended_width, width)};
}

std::vector<Window> generate_windows(int height, int width, int tile_size, int stride) {
    std::vector<Window> windows;
    if (height <= 0 || width <= 0) return windows;

    const int tiles_y = tiles_per_axis(height, tile_size, stride);
    const int tiles_x = tiles_per_axis(width, tile_size, stride);
    windows.reserve(static_cast<size_t>(tiles_y) * static_cast<size_t>(tiles_x));

    for (int y = 0; y < tiles_y; ++y) {
        for (int x = 0; x < tiles_x; ++x) {
            const int row_start = y * stride;
            const int col_start = x * stride;
            if (row_start >= height || col_start >= width) continue;
            windows.push_back(Window{row_start, col_start, tile_size, tile_size});
        }
    }
    return windows;
}

std::vector<Window> generate_postprocess_windows(int height, int width, int tile_size, int stride) {
    std::vector<Window> windows;
    if (height <= 0 || width <= 0) return windows;

    const int tiles_y = tiles_per_axis(height, tile_size, stride);
    const int tiles_x = tiles_per_axis(width, tile_size, stride);

    for (int y = 0; y < tiles_y; ++y) {
        for (int x = 0; x < tiles_x; ++x) {
            const int row_start = y * stride;
            const int col_start = x * stride;
            const int row_end = std::min(row_start + tile_size, height);
            const int col_end = std::min(col_start + tile_size, width);

            if (row_start >= height || col_start >= width) continue;
            if (row_end <= row_start || col_end <= col_start) continue;

            windows.push_back(Window{row_start, col_start, row_end - row_start, col_end - col_start});
        }
    }
    return windows;
}

bool validate_full_coverage(int height, int width, const std::vector<Window>& windows) {
    if (height <= 0 || width <= 0) return true;

    Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> coverage =
        Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>::Zero(height, width);

    for (const auto& w : windows) {
        const int row_start = std::max(0, w.row_off);
        const int row_end = std::min(height, w.row_off + w.height);
        const int col_start = std::max(0, w.col_off);
        const int col_end = std::min(width, w.col_off + w.width);
        if (row_end <= row_start || col_end <= col_start) continue;

        coverage.block(row_start, col_start, row_end - row_start, col_end - col_start).setConstant(1);
    }

    return (coverage.array() != 0).all();
}

std::optional<Window> clip_window_to_image(const Window& window, int height, int width) {
    const int clipped_height = std::max(0, std::min(window.height, height - window.row_off));
    const int clipped_width = std::max(0, std::min(window.width, width - window.col_off));

    if (clipped_height <= 0 || clipped_width <= 0 ||
        window.row_off >= height || window.col_off >= width) {
        return std::nullopt;
    }
    return Window{window.row_off, window.col_off, clipped_height, clipped_width};
}

EdgeFlags classify_edges(const Window& window, int height, int width) {
    EdgeFlags e;
    e.top = window.row_off == 0;
    e.bottom = window.row_off + window.height >= height;
    e.left = window.col_off == 0;
    e.right = window.col_off + window.width >= width;
    return e;
}

} // namespace tile_segment::tiling
