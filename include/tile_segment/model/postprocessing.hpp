#pragma once

#include "tile_segment/core/types.hpp"
#include "tile_segment/model/model_config.hpp"

namespace tile_segment::model {

// Softmax across planes [first, last) at every pixel.
ScoreMap softmax(const ScoreMap& scores, size_t first = 0, size_t last = 0);
Matrix2Df sigmoid(const Matrix2Df& logits);

// Index of the largest plane at each pixel, plus offset. Ties go to the
// lowest index.
LabelMap argmax(const ScoreMap& scores, size_t first = 0, size_t last = 0, int offset = 0);

LabelMap postprocess_scores(const ScoreMap& scores, PostprocessKind kind, Activation activation);

// Score map of num_classes planes that postprocess_scores maps to
// default_value at every pixel.
ScoreMap make_shortcut_scores(PostprocessKind kind, int num_classes, int size, int default_value);

} // namespace tile_segment::model
