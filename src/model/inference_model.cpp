#include "tile_segment/model/inference_model.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/model/postprocessing.hpp"

namespace tile_segment::model {

SegmentationModel SegmentationModel::create(ModelConfig cfg, std::shared_ptr<InferenceBackend> backend,
                                            int class_count) {
    if (!backend) {
        throw ModelError("model " + cfg.name + " has no inference backend");
    }

    auto hint = backend->input_channels_hint();
    if (hint && *hint != cfg.input_channels) {
        throw ModelError("model " + cfg.name + " expects " + std::to_string(*hint) +
                         " input channels but its config declares " + std::to_string(cfg.input_channels));
    }

    SegmentationModel m;
    m.preprocessing = Preprocessing::from_config(cfg);
    m.kind = cfg.postprocess;
    m.config = std::move(cfg);
    m.backend = std::move(backend);
    if (class_count > 0) {
        m.num_classes = class_count;
    } else {
        m.num_classes = m.backend->output_channels();
    }
    return m;
}

std::vector<ScoreMap> SegmentationModel::predict(TileBatch batch, float max_pixel_value) const {
    if (batch.empty()) {
        return {};
    }
    for (const auto& tile : batch) {
        if (static_cast<int>(tile.size()) != config.input_channels) {
            throw ModelError("model " + config.name + " expects " + std::to_string(config.input_channels) +
                             " channels, got " + std::to_string(tile.size()));
        }
    }

    preprocessing.apply(batch, max_pixel_value);
    std::vector<ScoreMap> out = backend->predict(batch);

    if (out.size() != batch.size()) {
        throw ModelError("backend returned " + std::to_string(out.size()) + " score maps for " +
                         std::to_string(batch.size()) + " tiles");
    }
    for (size_t i = 0; i < out.size(); ++i) {
        const auto rows = batch[i][0].rows();
        const auto cols = batch[i][0].cols();
        if (out[i].empty()) {
            throw ModelError("backend returned an empty score map");
        }
        if (num_classes && static_cast<int>(out[i].size()) != *num_classes) {
            throw ModelError("backend returned " + std::to_string(out[i].size()) +
                             " classes, expected " + std::to_string(*num_classes));
        }
        for (const auto& plane : out[i]) {
            if (plane.rows() != rows || plane.cols() != cols) {
                throw ModelError("score map shape " + std::to_string(plane.rows()) + "x" +
                                 std::to_string(plane.cols()) + " does not match tile " +
                                 std::to_string(rows) + "x" + std::to_string(cols));
            }
        }
    }
    return out;
}

LabelMap SegmentationModel::postprocess(const ScoreMap& scores) const {
    return postprocess_scores(scores, kind, config.activation);
}

std::optional<int> SegmentationModel::preferred_tile_size() const {
    return backend ? backend->preferred_tile_size() : std::nullopt;
}

ScoreMap SegmentationModel::shortcut(int tile_size) const {
    if (!num_classes) {
        throw ModelError("class count of model " + config.name + " is unknown");
    }
    return shortcut(tile_size, *num_classes);
}

ScoreMap SegmentationModel::shortcut(int tile_size, int classes) const {
    return make_shortcut_scores(kind, classes, tile_size, config.default_output_value);
}

} // namespace tile_segment::model
