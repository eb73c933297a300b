#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tile_segment::model {

namespace fs = std::filesystem;
using json = nlohmann::json;

// How raw scores become labels.
enum class PostprocessKind {
    ARGMAX,
    PRESENCE_SPECIES_SIGMOID,   // ch 0 presence logit, ch 1.. species logits
    PRESENCE_SPECIES_SOFTMAX    // ch 0..1 presence logits, ch 2.. species logits
};

enum class Activation {
    NONE,
    SIGMOID,
    SOFTMAX
};

enum class Normalization {
    NONE,
    STANDARD,
    MIN_MAX,
    MIN_MAX_PER_CHANNEL
};

std::string postprocess_kind_to_string(PostprocessKind kind);
PostprocessKind string_to_postprocess_kind(const std::string& name);
std::string activation_to_string(Activation activation);
Activation string_to_activation(const std::string& name);
std::string normalization_to_string(Normalization normalization);
Normalization string_to_normalization(const std::string& name);

struct ModelConfig {
    std::string name;
    std::string revision;
    std::string description;
    std::vector<std::string> dependencies;   // URLs or local paths
    std::string model_filename;              // file name of the ONNX dependency
    int input_channels = 3;
    PostprocessKind postprocess = PostprocessKind::ARGMAX;
    Activation activation = Activation::NONE;
    Normalization normalization = Normalization::STANDARD;
    std::vector<float> mean{0.485f, 0.456f, 0.406f};
    std::vector<float> stddev{0.229f, 0.224f, 0.225f};
    std::optional<float> max_pixel_value;    // nullopt -> "auto"
    int default_output_value = 0;
    int nodata_value = 0;
    std::map<std::string, std::string> sha256;   // dependency file name -> hex digest

    static ModelConfig load(const fs::path& path);
    static ModelConfig from_json(const json& j);
    json to_json() const;

    void validate() const;

    // Dependency whose file name equals model_filename.
    std::string model_dependency() const;
};

} // namespace tile_segment::model
