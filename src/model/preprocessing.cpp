#include "tile_segment/model/preprocessing.hpp"
#include "tile_segment/core/errors.hpp"

#include <algorithm>
#include <limits>

namespace tile_segment::model {

namespace {

constexpr float kEps = 1e-8f;

void min_max_tile(BandStack& tile) {
    float lo = std::numeric_limits<float>::max();
    float hi = std::numeric_limits<float>::lowest();
    for (const auto& plane : tile) {
        if (plane.size() == 0) continue;
        lo = std::min(lo, plane.minCoeff());
        hi = std::max(hi, plane.maxCoeff());
    }
    const float scale = 1.0f / (hi - lo + kEps);
    for (auto& plane : tile) {
        plane = (plane.array() - lo) * scale;
    }
}

void min_max_per_channel(BandStack& tile) {
    for (auto& plane : tile) {
        if (plane.size() == 0) continue;
        const float lo = plane.minCoeff();
        const float hi = plane.maxCoeff();
        plane = (plane.array() - lo) / (hi - lo + kEps);
    }
}

} // namespace

Preprocessing Preprocessing::from_config(const ModelConfig& cfg) {
    Preprocessing p;
    p.normalization = cfg.normalization;
    p.mean = cfg.mean;
    p.stddev = cfg.stddev;
    return p;
}

void Preprocessing::apply(TileBatch& batch, float max_pixel_value) const {
    if (max_pixel_value <= 0.0f) {
        throw ConfigError("max_pixel_value must be > 0");
    }
    const float inv_max = 1.0f / max_pixel_value;

    for (auto& tile : batch) {
        for (auto& plane : tile) {
            plane *= inv_max;
        }

        switch (normalization) {
            case Normalization::NONE:
                break;
            case Normalization::STANDARD: {
                if (mean.size() != tile.size() || stddev.size() != tile.size()) {
                    throw ConfigError("standard normalization has " + std::to_string(mean.size()) +
                                      " mean and " + std::to_string(stddev.size()) +
                                      " std values for " + std::to_string(tile.size()) + " channels");
                }
                for (size_t c = 0; c < tile.size(); ++c) {
                    tile[c] = (tile[c].array() - mean[c]) / stddev[c];
                }
                break;
            }
            case Normalization::MIN_MAX:
                min_max_tile(tile);
                break;
            case Normalization::MIN_MAX_PER_CHANNEL:
                min_max_per_channel(tile);
                break;
        }
    }
}

} // namespace tile_segment::model
