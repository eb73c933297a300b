#include "tile_segment/model/postprocessing.hpp"
#include "tile_segment/core/errors.hpp"

#include <algorithm>

namespace tile_segment::model {

namespace {

void check_planes(const ScoreMap& scores, size_t first, size_t last) {
    if (first >= last || last > scores.size()) {
        throw ModelError("score planes [" + std::to_string(first) + ", " + std::to_string(last) +
                         ") out of range for " + std::to_string(scores.size()) + " channels");
    }
    for (size_t k = first + 1; k < last; ++k) {
        if (scores[k].rows() != scores[first].rows() || scores[k].cols() != scores[first].cols()) {
            throw ModelError("score planes differ in size");
        }
    }
}

} // namespace

ScoreMap softmax(const ScoreMap& scores, size_t first, size_t last) {
    if (last == 0) last = scores.size();
    check_planes(scores, first, last);

    Matrix2Df peak = scores[first];
    for (size_t k = first + 1; k < last; ++k) {
        peak = peak.cwiseMax(scores[k]);
    }

    ScoreMap out;
    out.reserve(last - first);
    Matrix2Df total = Matrix2Df::Zero(peak.rows(), peak.cols());
    for (size_t k = first; k < last; ++k) {
        Matrix2Df e = (scores[k] - peak).array().exp().matrix();
        total += e;
        out.push_back(std::move(e));
    }
    for (auto& plane : out) {
        plane = plane.cwiseQuotient(total);
    }
    return out;
}

Matrix2Df sigmoid(const Matrix2Df& logits) {
    return (1.0f / (1.0f + (-logits.array()).exp())).matrix();
}

LabelMap argmax(const ScoreMap& scores, size_t first, size_t last, int offset) {
    if (last == 0) last = scores.size();
    check_planes(scores, first, last);

    const auto rows = scores[first].rows();
    const auto cols = scores[first].cols();
    LabelMap labels(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            size_t best = first;
            float best_v = scores[first](r, c);
            for (size_t k = first + 1; k < last; ++k) {
                if (scores[k](r, c) > best_v) {
                    best_v = scores[k](r, c);
                    best = k;
                }
            }
            labels(r, c) = static_cast<uint8_t>(static_cast<int>(best - first) + offset);
        }
    }
    return labels;
}

LabelMap postprocess_scores(const ScoreMap& scores, PostprocessKind kind, Activation activation) {
    if (scores.empty()) {
        throw ModelError("cannot postprocess an empty score map");
    }

    switch (kind) {
        case PostprocessKind::ARGMAX: {
            ScoreMap probs;
            if (activation == Activation::SOFTMAX) {
                probs = softmax(scores);
            } else if (activation == Activation::SIGMOID) {
                for (const auto& plane : scores) probs.push_back(sigmoid(plane));
            } else {
                probs = scores;
            }
            if (probs.size() == 1) {
                Matrix2Df p = probs[0];
                Matrix2Df q = (1.0f - p.array()).matrix();
                probs = ScoreMap{q, p};
            }
            return argmax(probs);
        }
        case PostprocessKind::PRESENCE_SPECIES_SIGMOID: {
            if (scores.size() < 2) {
                throw ModelError("presence_species_sigmoid needs at least 2 channels, got " +
                                 std::to_string(scores.size()));
            }
            Matrix2Df presence = sigmoid(scores[0]);
            LabelMap species = argmax(softmax(scores, 1, scores.size()), 0, 0, 1);
            LabelMap labels = LabelMap::Zero(species.rows(), species.cols());
            for (Eigen::Index i = 0; i < labels.size(); ++i) {
                if (presence.data()[i] > 0.5f) labels.data()[i] = species.data()[i];
            }
            return labels;
        }
        case PostprocessKind::PRESENCE_SPECIES_SOFTMAX: {
            if (scores.size() < 3) {
                throw ModelError("presence_species_softmax needs at least 3 channels, got " +
                                 std::to_string(scores.size()));
            }
            LabelMap presence = argmax(softmax(scores, 0, 2));
            LabelMap species = argmax(softmax(scores, 2, scores.size()), 0, 0, 1);
            return presence.cwiseProduct(species);
        }
    }
    throw ModelError("unknown postprocess kind");
}

ScoreMap make_shortcut_scores(PostprocessKind kind, int num_classes, int size, int default_value) {
    if (num_classes < 1 || size < 1) {
        throw ModelError("shortcut needs at least one class and a positive tile size");
    }

    ScoreMap scores(static_cast<size_t>(num_classes), Matrix2Df::Zero(size, size));
    const int d = std::max(default_value, 0);

    switch (kind) {
        case PostprocessKind::ARGMAX:
            if (num_classes == 1) {
                scores[0].setConstant(d >= 1 ? 1.0f : 0.0f);
            } else {
                scores[static_cast<size_t>(std::min(d, num_classes - 1))].setOnes();
            }
            break;
        case PostprocessKind::PRESENCE_SPECIES_SIGMOID:
            if (num_classes < 2) {
                throw ModelError("presence_species_sigmoid needs at least 2 channels");
            }
            if (d == 0) {
                scores[0].setConstant(-1.0f);
            } else {
                scores[0].setOnes();
                scores[static_cast<size_t>(1 + std::min(d - 1, num_classes - 2))].setOnes();
            }
            break;
        case PostprocessKind::PRESENCE_SPECIES_SOFTMAX:
            if (num_classes < 3) {
                throw ModelError("presence_species_softmax needs at least 3 channels");
            }
            if (d == 0) {
                scores[0].setOnes();
            } else {
                scores[1].setOnes();
                scores[static_cast<size_t>(2 + std::min(d - 1, num_classes - 3))].setOnes();
            }
            break;
    }
    return scores;
}

} // namespace tile_segment::model
