#include "tile_segment/model/onnx_backend.hpp"
#include "tile_segment/core/errors.hpp"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <array>

namespace tile_segment::model {

namespace {

std::string shape_to_string(const std::vector<int64_t>& shape) {
    std::string s = "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += shape[i] < 0 ? std::string("?") : std::to_string(shape[i]);
    }
    return s + "]";
}

Ort::Env& shared_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_ERROR, "tile_segment");
    return env;
}

} // namespace

struct OnnxBackend::Impl {
    std::unique_ptr<Ort::Session> session;
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    std::string input_name;
    std::string output_name;
};

std::optional<int> tile_size_from_input_shape(const std::vector<int64_t>& shape) {
    if (shape.size() != 4) {
        throw ModelError("model input must be [batch, channels, height, width], got " +
                         shape_to_string(shape));
    }
    const int64_t h = shape[2];
    const int64_t w = shape[3];
    if (h < 0 && w < 0) {
        return std::nullopt;
    }
    if (h > 0 && (w == h || w < 0)) {
        return static_cast<int>(h);
    }
    if (w > 0 && h < 0) {
        return static_cast<int>(w);
    }
    throw ModelError("model input shape must be square or dynamic, got " + shape_to_string(shape));
}

OnnxBackend::OnnxBackend(const fs::path& model_path, const OnnxOptions& options)
    : impl_(std::make_unique<Impl>()), model_path_(model_path) {
    if (!fs::exists(model_path)) {
        throw IOError("Model file not found: " + model_path.string());
    }

    try {
        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(options.intra_op_threads > 0 ? options.intra_op_threads : 0);
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        if (options.use_cuda) {
            OrtCUDAProviderOptions cuda_options;
            cuda_options.device_id = 0;
            session_options.AppendExecutionProvider_CUDA(cuda_options);
        }

        impl_->session = std::make_unique<Ort::Session>(shared_env(), model_path.string().c_str(),
                                                        session_options);

        if (impl_->session->GetInputCount() < 1 || impl_->session->GetOutputCount() < 1) {
            throw ModelError("model " + model_path.string() + " needs at least one input and output");
        }

        Ort::AllocatorWithDefaultOptions allocator;
        impl_->input_name = impl_->session->GetInputNameAllocated(0, allocator).get();
        impl_->output_name = impl_->session->GetOutputNameAllocated(0, allocator).get();
        input_shape_ = impl_->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        output_shape_ = impl_->session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    } catch (const Ort::Exception& e) {
        throw ModelError("cannot load " + model_path.string() + ": " + e.what());
    }

    tile_size_ = tile_size_from_input_shape(input_shape_);
}

OnnxBackend::~OnnxBackend() = default;

std::optional<int> OnnxBackend::input_channels_hint() const {
    if (input_shape_.size() > 1 && input_shape_[1] > 0) {
        return static_cast<int>(input_shape_[1]);
    }
    return std::nullopt;
}

std::optional<int> OnnxBackend::preferred_tile_size() const {
    return tile_size_;
}

std::optional<int> OnnxBackend::output_channels() const {
    if (output_shape_.size() == 4 && output_shape_[1] > 0) {
        return static_cast<int>(output_shape_[1]);
    }
    return std::nullopt;
}

std::vector<ScoreMap> OnnxBackend::predict(const TileBatch& batch) {
    if (batch.empty()) {
        return {};
    }
    const int64_t n = static_cast<int64_t>(batch.size());
    const int64_t c = static_cast<int64_t>(batch[0].size());
    if (c == 0) {
        throw ModelError("tiles have no channels");
    }
    const int64_t h = batch[0][0].rows();
    const int64_t w = batch[0][0].cols();
    const size_t plane = static_cast<size_t>(h * w);

    // NCHW; Matrix2Df is row-major so each plane copies contiguously.
    std::vector<float> input(static_cast<size_t>(n * c) * plane);
    for (size_t i = 0; i < batch.size(); ++i) {
        if (static_cast<int64_t>(batch[i].size()) != c) {
            throw ModelError("tiles in one batch differ in channel count");
        }
        for (size_t k = 0; k < batch[i].size(); ++k) {
            const auto& m = batch[i][k];
            if (m.rows() != h || m.cols() != w) {
                throw ModelError("tiles in one batch differ in size");
            }
            std::copy(m.data(), m.data() + plane, input.begin() + (i * c + k) * plane);
        }
    }

    std::vector<ScoreMap> out;
    try {
        std::array<int64_t, 4> dims{n, c, h, w};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            impl_->memory_info, input.data(), input.size(), dims.data(), dims.size());

        const char* input_names[] = {impl_->input_name.c_str()};
        const char* output_names[] = {impl_->output_name.c_str()};
        auto outputs = impl_->session->Run(Ort::RunOptions{nullptr}, input_names, &input_tensor, 1,
                                           output_names, 1);
        if (outputs.empty()) {
            throw ModelError("inference returned no outputs");
        }

        auto info = outputs[0].GetTensorTypeAndShapeInfo();
        auto shape = info.GetShape();
        if (shape.size() != 4 || shape[0] != n || shape[2] != h || shape[3] != w) {
            throw ModelError("unexpected output shape " + shape_to_string(shape) + " for input " +
                             shape_to_string({n, c, h, w}));
        }
        const int64_t k = shape[1];
        const float* data = outputs[0].GetTensorData<float>();

        out.resize(batch.size());
        for (int64_t i = 0; i < n; ++i) {
            out[static_cast<size_t>(i)].reserve(static_cast<size_t>(k));
            for (int64_t j = 0; j < k; ++j) {
                Matrix2Df scores(h, w);
                const float* src = data + (i * k + j) * static_cast<int64_t>(plane);
                std::copy(src, src + plane, scores.data());
                out[static_cast<size_t>(i)].push_back(std::move(scores));
            }
        }
    } catch (const Ort::Exception& e) {
        throw ModelError("inference failed for " + model_path_.string() + ": " + e.what());
    }
    return out;
}

} // namespace tile_segment::model
