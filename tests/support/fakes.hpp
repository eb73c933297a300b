#pragma once

#include "tile_segment/core/errors.hpp"
#include "tile_segment/io/raster_io.hpp"
#include "tile_segment/model/inference_model.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <vector>

namespace tile_segment::testing {

// Whole raster held in memory as one plane per band.
class MemoryRasterReader : public io::RasterReader {
public:
    MemoryRasterReader(BandStack bands, PixelType pixel_type) : bands_(std::move(bands)) {
        info_.height = bands_.empty() ? 0 : static_cast<int>(bands_[0].rows());
        info_.width = bands_.empty() ? 0 : static_cast<int>(bands_[0].cols());
        info_.band_count = static_cast<int>(bands_.size());
        info_.pixel_type = pixel_type;
    }

    const io::RasterInfo& info() const override { return info_; }

    BandStack read_window(const Window& window, const std::vector<int>& band_order,
                          bool boundless, float fill_value) override {
        if (!boundless) {
            io::require_window_in_bounds(window, info_.height, info_.width, "memory raster");
        }
        std::vector<int> order = band_order;
        if (order.empty()) {
            for (int b = 1; b <= info_.band_count; ++b) order.push_back(b);
        }
        ++reads;

        BandStack out;
        for (int b : order) {
            if (b < 1 || b > info_.band_count) {
                throw ConfigError("band " + std::to_string(b) + " out of range");
            }
            const Matrix2Df& src = bands_[static_cast<size_t>(b - 1)];
            Matrix2Df plane = Matrix2Df::Constant(window.height, window.width, fill_value);
            const int r0 = std::max(window.row_off, 0);
            const int c0 = std::max(window.col_off, 0);
            const int r1 = std::min(window.row_off + window.height, info_.height);
            const int c1 = std::min(window.col_off + window.width, info_.width);
            if (r1 > r0 && c1 > c0) {
                plane.block(r0 - window.row_off, c0 - window.col_off, r1 - r0, c1 - c0) =
                    src.block(r0, c0, r1 - r0, c1 - c0);
            }
            out.push_back(std::move(plane));
        }
        return out;
    }

    int reads = 0;

private:
    BandStack bands_;
    io::RasterInfo info_;
};

// Label raster in memory; counts how often each pixel was written.
class MemoryRasterWriter : public io::RasterWriter {
public:
    MemoryRasterWriter(int height, int width, uint8_t nodata = 0)
        : labels(LabelMap::Constant(height, width, nodata)),
          write_counts(Eigen::MatrixXi::Zero(height, width)) {}

    int height() const override { return static_cast<int>(labels.rows()); }
    int width() const override { return static_cast<int>(labels.cols()); }

    void write(const LabelMap& data, const Window& window) override {
        io::require_window_in_bounds(window, height(), width(), "memory writer");
        if (data.rows() != window.height || data.cols() != window.width) {
            throw IOError("block does not match window");
        }
        labels.block(window.row_off, window.col_off, window.height, window.width) = data;
        write_counts.block(window.row_off, window.col_off, window.height, window.width).array() += 1;
        windows.push_back(window);
    }

    LabelMap read_window(const Window& window) override {
        io::require_window_in_bounds(window, height(), width(), "memory writer");
        return labels.block(window.row_off, window.col_off, window.height, window.width);
    }

    void close() override { closed = true; }

    LabelMap labels;
    Eigen::MatrixXi write_counts;
    std::vector<Window> windows;
    bool closed = false;
};

// Backend that scores each tile with a caller-supplied function.
class FakeBackend : public model::InferenceBackend {
public:
    using ScoreFn = std::function<ScoreMap(const BandStack&)>;

    FakeBackend(ScoreFn fn, std::optional<int> channels_hint = std::nullopt,
                std::optional<int> tile_size = std::nullopt,
                std::optional<int> out_channels = std::nullopt)
        : fn_(std::move(fn)), channels_hint_(channels_hint), tile_size_(tile_size),
          out_channels_(out_channels) {}

    std::vector<ScoreMap> predict(const model::TileBatch& batch) override {
        ++calls;
        batch_sizes.push_back(static_cast<int>(batch.size()));
        std::vector<ScoreMap> out;
        for (const auto& tile : batch) {
            out.push_back(fn_(tile));
        }
        return out;
    }

    std::optional<int> input_channels_hint() const override { return channels_hint_; }
    std::optional<int> preferred_tile_size() const override { return tile_size_; }
    std::optional<int> output_channels() const override { return out_channels_; }

    int calls = 0;
    std::vector<int> batch_sizes;

private:
    ScoreFn fn_;
    std::optional<int> channels_hint_;
    std::optional<int> tile_size_;
    std::optional<int> out_channels_;
};

// K planes where plane `label` is 1 and the rest 0.
inline ScoreMap constant_scores(int num_classes, int rows, int cols, int label) {
    ScoreMap scores(static_cast<size_t>(num_classes), Matrix2Df::Zero(rows, cols));
    scores[static_cast<size_t>(label)].setOnes();
    return scores;
}

inline model::ModelConfig make_model_config(int input_channels = 3) {
    model::ModelConfig cfg;
    cfg.name = "test-model";
    cfg.revision = "20240101";
    cfg.dependencies = {"/models/test.onnx"};
    cfg.model_filename = "test.onnx";
    cfg.input_channels = input_channels;
    cfg.normalization = model::Normalization::NONE;
    cfg.mean.clear();
    cfg.stddev.clear();
    return cfg;
}

} // namespace tile_segment::testing
