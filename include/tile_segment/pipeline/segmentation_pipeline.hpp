#pragma once

#include "tile_segment/config/configuration.hpp"
#include "tile_segment/core/events.hpp"
#include "tile_segment/core/types.hpp"
#include "tile_segment/io/raster_io.hpp"
#include "tile_segment/model/inference_model.hpp"
#include "tile_segment/pipeline/postprocess_pass.hpp"
#include "tile_segment/tiling/weight_kernel.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tile_segment::pipeline {

constexpr int kDefaultTileSize = 1024;

struct SegmentationOptions {
    int tile_size = 0;                     // 0 -> model preferred or kDefaultTileSize
    int batch_size = 1;
    std::vector<int> band_order;           // 1-based; empty -> 1..input_channels
    tiling::KernelFamily kernel = tiling::KernelFamily::BARTLETT_HANN;
    PostprocessSettings postprocess;

    static SegmentationOptions from_config(const config::Config& cfg);
};

struct SegmentationReport {
    int tile_size = 0;
    int window_count = 0;
    int batch_count = 0;
    int tiles_inferred = 0;
    int tiles_shortcut = 0;
    int num_classes = 0;
    int postprocess_windows = 0;
};

// uint8 -> 255, uint16 -> 65535, float32 -> 1.0. A configured value wins.
// Throws ConfigError for unsupported pixel types.
float resolve_max_pixel_value(const std::optional<float>& configured, PixelType pixel_type);

// Requested 0 -> preferred or kDefaultTileSize; a preferred size overrides
// a different request. Throws ConfigError unless the result is positive and even.
int resolve_tile_size(int requested, const std::optional<int>& preferred);

// 1-based band indices to read. Throws ConfigError when an index exceeds
// band_count or the count differs from input_channels.
std::vector<int> resolve_band_order(const std::vector<int>& band_order, int band_count, int input_channels);

// True when every sample of every band equals the first one.
bool is_uniform_tile(const BandStack& tile);

class TiledSegmentationPipeline {
public:
    TiledSegmentationPipeline(std::string run_id, std::ostream& event_out);

    SegmentationReport run(io::RasterReader& reader, io::RasterWriter& writer,
                           const model::SegmentationModel& model, const SegmentationOptions& options);

private:
    std::string run_id_;
    std::ostream& out_;
    core::EventEmitter emitter_;
};

} // namespace tile_segment::pipeline
