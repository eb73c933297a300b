#pragma once

#include "tile_segment/core/types.hpp"
#include "tile_segment/model/model_config.hpp"

#include <vector>

namespace tile_segment::model {

// N tiles, each C planes of H x W.
using TileBatch = std::vector<BandStack>;

struct Preprocessing {
    Normalization normalization = Normalization::STANDARD;
    std::vector<float> mean;
    std::vector<float> stddev;

    static Preprocessing from_config(const ModelConfig& cfg);

    // Divides by max_pixel_value, then normalizes each tile in place.
    // Standard normalization needs one mean/std entry per channel.
    void apply(TileBatch& batch, float max_pixel_value) const;
};

} // namespace tile_segment::model
