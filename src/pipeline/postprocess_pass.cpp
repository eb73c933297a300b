#include "tile_segment/pipeline/postprocess_pass.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/tiling/window_planner.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstring>

namespace tile_segment::pipeline {

int postprocess_overlap(const PostprocessSettings& settings) {
    int overlap = 0;
    if (settings.blur_kernel_size > 1) {
        overlap = std::max(overlap, (settings.blur_kernel_size - 1) / 2);
    }
    if (settings.morph_kernel_size > 1) {
        overlap = std::max(overlap, (settings.morph_kernel_size - 1) / 2);
    }
    return overlap;
}

int postprocess_stride(const PostprocessSettings& settings, int segmentation_tile_size) {
    if (!settings.enabled()) {
        return 0;
    }
    const int overlap = postprocess_overlap(settings);
    if (overlap == 0) {
        return 0;
    }
    const int tile = std::min(settings.max_tile_size, segmentation_tile_size);
    const int stride = tile - 2 * overlap;
    if (stride <= 0) {
        throw ConfigError("post-process tile " + std::to_string(tile) + " is too small for kernel overlap " +
                          std::to_string(overlap));
    }
    return stride;
}

LabelMap filter_labels(const LabelMap& labels, const PostprocessSettings& settings) {
    const int h = static_cast<int>(labels.rows());
    const int w = static_cast<int>(labels.cols());
    if (h <= 0 || w <= 0) return labels;

    cv::Mat current = cv::Mat(h, w, CV_8U, const_cast<uint8_t*>(labels.data())).clone();

    if (settings.blur_kernel_size > 1) {
        int k = settings.blur_kernel_size;
        if (k % 2 == 0) ++k;
        cv::Mat blurred;
        cv::medianBlur(current, blurred, k);
        current = blurred;
    }

    if (settings.morph_kernel_size > 1) {
        const int k = settings.morph_kernel_size;
        cv::Mat kernel = cv::Mat::ones(k, k, CV_8U);
        cv::Mat opened;
        cv::Mat closed;
        cv::morphologyEx(current, opened, cv::MORPH_OPEN, kernel);
        cv::morphologyEx(opened, closed, cv::MORPH_CLOSE, kernel);
        current = closed;
    }

    LabelMap out(h, w);
    if (current.isContinuous()) {
        std::memcpy(out.data(), current.ptr<uint8_t>(), static_cast<size_t>(out.size()));
    } else {
        for (int r = 0; r < h; ++r) {
            std::memcpy(out.data() + static_cast<size_t>(r) * w, current.ptr<uint8_t>(r),
                        static_cast<size_t>(w));
        }
    }
    return out;
}

int apply_postprocess_pass(io::RasterWriter& writer, int segmentation_tile_size,
                           const PostprocessSettings& settings, const PassProgress& progress) {
    const int stride = postprocess_stride(settings, segmentation_tile_size);
    if (stride == 0) {
        return 0;
    }
    const int overlap = postprocess_overlap(settings);
    const int tile = std::min(settings.max_tile_size, segmentation_tile_size);

    const int height = writer.height();
    const int width = writer.width();
    const auto windows = tiling::generate_postprocess_windows(height, width, tile, stride);

    int done = 0;
    for (const auto& win : windows) {
        LabelMap filtered = filter_labels(writer.read_window(win), settings);

        const int top = win.row_off > 0 ? overlap : 0;
        const int left = win.col_off > 0 ? overlap : 0;
        const int bottom = win.row_off + win.height < height ? overlap : 0;
        const int right = win.col_off + win.width < width ? overlap : 0;

        Window inner{win.row_off + top, win.col_off + left,
                     win.height - top - bottom, win.width - left - right};
        if (inner.height > 0 && inner.width > 0) {
            LabelMap block = filtered.block(top, left, inner.height, inner.width);
            writer.write(block, inner);
        }

        ++done;
        if (progress) progress(done, static_cast<int>(windows.size()));
    }
    return done;
}

} // namespace tile_segment::pipeline
