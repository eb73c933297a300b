#pragma once

#include "tile_segment/core/types.hpp"
#include "tile_segment/model/model_config.hpp"
#include "tile_segment/model/preprocessing.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace tile_segment::model {

// Stateless batch classifier. predict takes N preprocessed tiles of C x S x S
// and returns N score maps of K x S x S.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    virtual std::vector<ScoreMap> predict(const TileBatch& batch) = 0;

    virtual std::optional<int> input_channels_hint() const = 0;
    virtual std::optional<int> preferred_tile_size() const = 0;
    virtual std::optional<int> output_channels() const = 0;
};

struct SegmentationModel {
    ModelConfig config;
    Preprocessing preprocessing;
    std::shared_ptr<InferenceBackend> backend;
    PostprocessKind kind = PostprocessKind::ARGMAX;
    std::optional<int> num_classes;   // K when known before the first prediction

    // Builds the record; num_classes falls back to backend->output_channels()
    // when class_count is 0.
    static SegmentationModel create(ModelConfig cfg, std::shared_ptr<InferenceBackend> backend,
                                    int class_count = 0);

    const std::string& name() const { return config.name; }
    const std::string& revision() const { return config.revision; }

    // Preprocesses a copy of batch and runs the backend. Throws ModelError
    // when the backend returns the wrong number or shape of score maps.
    std::vector<ScoreMap> predict(TileBatch batch, float max_pixel_value) const;

    LabelMap postprocess(const ScoreMap& scores) const;

    std::optional<int> preferred_tile_size() const;

    // Score map for a uniform tile; postprocesses to default_output_value.
    ScoreMap shortcut(int tile_size) const;
    ScoreMap shortcut(int tile_size, int classes) const;
};

} // namespace tile_segment::model
