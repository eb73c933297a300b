#pragma once

#include "tile_segment/model/inference_model.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tile_segment::model {

namespace fs = std::filesystem;

struct OnnxOptions {
    int intra_op_threads = 0;   // 0 -> runtime default
    bool use_cuda = false;
};

// Input shape [N, C, H, W]. Returns the static side (H == W, or one side
// dynamic), nullopt when both are dynamic. Throws ModelError otherwise.
std::optional<int> tile_size_from_input_shape(const std::vector<int64_t>& shape);

// InferenceBackend over an ONNX Runtime session with one float input and
// one float output of [N, K, H, W].
class OnnxBackend : public InferenceBackend {
public:
    OnnxBackend(const fs::path& model_path, const OnnxOptions& options = {});
    ~OnnxBackend() override;

    OnnxBackend(const OnnxBackend&) = delete;
    OnnxBackend& operator=(const OnnxBackend&) = delete;

    std::vector<ScoreMap> predict(const TileBatch& batch) override;

    std::optional<int> input_channels_hint() const override;
    std::optional<int> preferred_tile_size() const override;
    std::optional<int> output_channels() const override;

    const std::vector<int64_t>& input_shape() const { return input_shape_; }
    const std::vector<int64_t>& output_shape() const { return output_shape_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    fs::path model_path_;
    std::vector<int64_t> input_shape_;
    std::vector<int64_t> output_shape_;
    std::optional<int> tile_size_;
};

} // namespace tile_segment::model
