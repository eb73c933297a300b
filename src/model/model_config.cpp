#include "tile_segment/model/model_config.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/utils.hpp"

namespace tile_segment::model {

std::string postprocess_kind_to_string(PostprocessKind kind) {
    switch (kind) {
        case PostprocessKind::ARGMAX: return "argmax";
        case PostprocessKind::PRESENCE_SPECIES_SIGMOID: return "presence_species_sigmoid";
        case PostprocessKind::PRESENCE_SPECIES_SOFTMAX: return "presence_species_softmax";
    }
    return "argmax";
}

PostprocessKind string_to_postprocess_kind(const std::string& name) {
    std::string n = core::to_lower(core::trim(name));
    if (n == "argmax") return PostprocessKind::ARGMAX;
    if (n == "presence_species_sigmoid") return PostprocessKind::PRESENCE_SPECIES_SIGMOID;
    if (n == "presence_species_softmax") return PostprocessKind::PRESENCE_SPECIES_SOFTMAX;
    throw ConfigError("Unknown postprocess kind: " + name);
}

std::string activation_to_string(Activation activation) {
    switch (activation) {
        case Activation::NONE: return "none";
        case Activation::SIGMOID: return "sigmoid";
        case Activation::SOFTMAX: return "softmax";
    }
    return "none";
}

Activation string_to_activation(const std::string& name) {
    std::string n = core::to_lower(core::trim(name));
    if (n.empty() || n == "none") return Activation::NONE;
    if (n == "sigmoid") return Activation::SIGMOID;
    if (n == "softmax") return Activation::SOFTMAX;
    throw ConfigError("Unknown activation: " + name);
}

std::string normalization_to_string(Normalization normalization) {
    switch (normalization) {
        case Normalization::NONE: return "none";
        case Normalization::STANDARD: return "standard";
        case Normalization::MIN_MAX: return "min_max";
        case Normalization::MIN_MAX_PER_CHANNEL: return "min_max_per_channel";
    }
    return "none";
}

Normalization string_to_normalization(const std::string& name) {
    std::string n = core::to_lower(core::trim(name));
    if (n.empty() || n == "none") return Normalization::NONE;
    if (n == "standard") return Normalization::STANDARD;
    if (n == "min_max") return Normalization::MIN_MAX;
    if (n == "min_max_per_channel") return Normalization::MIN_MAX_PER_CHANNEL;
    throw ConfigError("Unknown normalization: " + name);
}

ModelConfig ModelConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Model config not found: " + path.string());
    }
    json j;
    try {
        j = json::parse(core::read_text(path));
    } catch (const json::exception& e) {
        throw ConfigError("Cannot parse model config " + path.string() + ": " + e.what());
    }
    return from_json(j);
}

ModelConfig ModelConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Model config must be a JSON object");
    }

    ModelConfig cfg;
    try {
        cfg.name = j.at("name").get<std::string>();
        cfg.revision = j.at("revision").get<std::string>();
        cfg.description = j.value("description", std::string());
        cfg.dependencies = j.at("dependencies").get<std::vector<std::string>>();
        cfg.model_filename = j.at("model_filename").get<std::string>();
        cfg.input_channels = j.value("input_channels", 3);

        if (j.contains("postprocess")) {
            cfg.postprocess = string_to_postprocess_kind(j["postprocess"].get<std::string>());
        }
        if (j.contains("activation") && !j["activation"].is_null()) {
            cfg.activation = string_to_activation(j["activation"].get<std::string>());
        }
        if (j.contains("normalization")) {
            cfg.normalization = j["normalization"].is_null()
                                    ? Normalization::NONE
                                    : string_to_normalization(j["normalization"].get<std::string>());
        }
        if (j.contains("mean") && !j["mean"].is_null()) {
            cfg.mean = j["mean"].get<std::vector<float>>();
        }
        if (j.contains("std") && !j["std"].is_null()) {
            cfg.stddev = j["std"].get<std::vector<float>>();
        }
        if (j.contains("max_pixel_value")) {
            const auto& v = j["max_pixel_value"];
            if (v.is_number()) {
                cfg.max_pixel_value = v.get<float>();
            } else if (!(v.is_string() && v.get<std::string>() == "auto")) {
                throw ConfigError("max_pixel_value must be a number or \"auto\"");
            }
        }
        cfg.default_output_value = j.value("default_output_value", 0);
        cfg.nodata_value = j.value("nodata_value", 0);
        if (j.contains("sha256")) {
            cfg.sha256 = j["sha256"].get<std::map<std::string, std::string>>();
        }
    } catch (const json::exception& e) {
        throw ConfigError("Invalid model config: " + std::string(e.what()));
    }

    cfg.validate();
    return cfg;
}

json ModelConfig::to_json() const {
    json j;
    j["name"] = name;
    j["revision"] = revision;
    j["description"] = description;
    j["dependencies"] = dependencies;
    j["model_filename"] = model_filename;
    j["input_channels"] = input_channels;
    j["postprocess"] = postprocess_kind_to_string(postprocess);
    j["activation"] = activation_to_string(activation);
    j["normalization"] = normalization_to_string(normalization);
    j["mean"] = mean;
    j["std"] = stddev;
    if (max_pixel_value) {
        j["max_pixel_value"] = *max_pixel_value;
    } else {
        j["max_pixel_value"] = "auto";
    }
    j["default_output_value"] = default_output_value;
    j["nodata_value"] = nodata_value;
    if (!sha256.empty()) {
        j["sha256"] = sha256;
    }
    return j;
}

void ModelConfig::validate() const {
    if (core::trim(name).empty()) {
        throw ValidationError("model name must not be empty");
    }
    if (core::trim(revision).empty()) {
        throw ValidationError("model " + name + ": revision must not be empty");
    }
    if (dependencies.empty()) {
        throw ValidationError("model " + name + ": dependencies must not be empty");
    }
    if (input_channels < 1) {
        throw ValidationError("model " + name + ": input_channels must be >= 1");
    }
    if (normalization == Normalization::STANDARD) {
        if (mean.size() != stddev.size()) {
            throw ValidationError("model " + name + ": mean and std must have the same length");
        }
        for (float s : stddev) {
            if (s == 0.0f) {
                throw ValidationError("model " + name + ": std entries must be non-zero");
            }
        }
    }
    if (max_pixel_value && *max_pixel_value <= 0.0f) {
        throw ValidationError("model " + name + ": max_pixel_value must be > 0");
    }
    if (default_output_value < 0 || default_output_value > 255) {
        throw ValidationError("model " + name + ": default_output_value must be in [0,255]");
    }
    if (nodata_value < 0 || nodata_value > 255) {
        throw ValidationError("model " + name + ": nodata_value must be in [0,255]");
    }
    model_dependency();
}

std::string ModelConfig::model_dependency() const {
    std::vector<std::string> names;
    for (const auto& dep : dependencies) {
        std::string file = core::is_url(dep) ? core::url_filename(dep) : fs::path(dep).filename().string();
        if (file == model_filename) {
            return dep;
        }
        names.push_back(file);
    }
    throw ValidationError("model " + name + ": model file '" + model_filename +
                          "' not found in dependencies [" + core::join(names, ", ") + "]");
}

} // namespace tile_segment::model
