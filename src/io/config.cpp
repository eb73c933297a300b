#include "tile_segment/config/configuration.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/pipeline/postprocess_pass.hpp"
#include "tile_segment/tiling/weight_kernel.hpp"

#include <fstream>

namespace tile_segment::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

static void read_int_list(const YAML::Node& n, std::vector<int>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<int>());
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse config file " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["model"]) {
            auto m = node["model"];
            if (m["name"]) cfg.model.name = m["name"].as<std::string>();
            if (m["revision"]) cfg.model.revision = m["revision"].as<std::string>();
            if (m["registry_dir"]) cfg.model.registry_dir = m["registry_dir"].as<std::string>();
            if (m["cache_dir"]) cfg.model.cache_dir = m["cache_dir"].as<std::string>();
        }

        if (node["processing"]) {
            auto p = node["processing"];
            if (p["tile_size"]) cfg.processing.tile_size = p["tile_size"].as<int>();
            if (p["batch_size"]) cfg.processing.batch_size = p["batch_size"].as<int>();
            read_int_list(p["band_order"], cfg.processing.band_order);
            if (p["kernel"]) cfg.processing.kernel = p["kernel"].as<std::string>();
            if (p["num_classes"]) cfg.processing.num_classes = p["num_classes"].as<int>();
        }

        if (node["postprocess"]) {
            auto pp = node["postprocess"];
            if (pp["blur_kernel_size"]) cfg.postprocess.blur_kernel_size = pp["blur_kernel_size"].as<int>();
            if (pp["morph_kernel_size"]) cfg.postprocess.morph_kernel_size = pp["morph_kernel_size"].as<int>();
            if (pp["max_tile_size"]) cfg.postprocess.max_tile_size = pp["max_tile_size"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["events_log"]) cfg.output.events_log = o["events_log"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["inference_threads"]) cfg.runtime.inference_threads = r["inference_threads"].as<int>();
            if (r["use_cuda"]) cfg.runtime.use_cuda = r["use_cuda"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value in config: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["model"]["name"] = model.name;
    node["model"]["revision"] = model.revision;
    node["model"]["registry_dir"] = model.registry_dir;
    node["model"]["cache_dir"] = model.cache_dir;

    node["processing"]["tile_size"] = processing.tile_size;
    node["processing"]["batch_size"] = processing.batch_size;
    node["processing"]["band_order"] = YAML::Node(YAML::NodeType::Sequence);
    for (int b : processing.band_order) {
        node["processing"]["band_order"].push_back(b);
    }
    node["processing"]["kernel"] = processing.kernel;
    node["processing"]["num_classes"] = processing.num_classes;

    node["postprocess"]["blur_kernel_size"] = postprocess.blur_kernel_size;
    node["postprocess"]["morph_kernel_size"] = postprocess.morph_kernel_size;
    node["postprocess"]["max_tile_size"] = postprocess.max_tile_size;

    node["output"]["events_log"] = output.events_log;

    node["runtime"]["inference_threads"] = runtime.inference_threads;
    node["runtime"]["use_cuda"] = runtime.use_cuda;

    return node;
}

void Config::validate() const {
    if (processing.tile_size < 0 || is_odd(processing.tile_size)) {
        throw ValidationError("processing.tile_size must be 0 or a positive even number");
    }
    if (processing.batch_size < 1) {
        throw ValidationError("processing.batch_size must be >= 1");
    }
    for (int b : processing.band_order) {
        if (b < 1) {
            throw ValidationError("processing.band_order entries are 1-based and must be >= 1");
        }
    }
    try {
        tiling::string_to_kernel_family(processing.kernel);
    } catch (const ConfigError&) {
        throw ValidationError("processing.kernel must be bartlett_hann or triangular");
    }
    if (processing.num_classes < 0) {
        throw ValidationError("processing.num_classes must be >= 0");
    }

    if (postprocess.blur_kernel_size < 0 ||
        (postprocess.blur_kernel_size > 1 && !is_odd(postprocess.blur_kernel_size))) {
        throw ValidationError("postprocess.blur_kernel_size must be 0 or odd");
    }
    if (postprocess.morph_kernel_size < 0 ||
        (postprocess.morph_kernel_size > 1 && !is_odd(postprocess.morph_kernel_size))) {
        throw ValidationError("postprocess.morph_kernel_size must be 0 or odd");
    }
    if (postprocess.max_tile_size < 2) {
        throw ValidationError("postprocess.max_tile_size must be >= 2");
    }
    pipeline::PostprocessSettings settings;
    settings.blur_kernel_size = postprocess.blur_kernel_size;
    settings.morph_kernel_size = postprocess.morph_kernel_size;
    settings.max_tile_size = postprocess.max_tile_size;
    const int segmentation_tile = processing.tile_size > 0 ? processing.tile_size : postprocess.max_tile_size;
    try {
        pipeline::postprocess_stride(settings, segmentation_tile);
    } catch (const ConfigError&) {
        throw ValidationError("postprocess tile (min of max_tile_size and processing.tile_size) must exceed "
                              "the kernel size minus one");
    }

    if (runtime.inference_threads < 0) {
        throw ValidationError("runtime.inference_threads must be >= 0");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "model": {
      "type": "object",
      "properties": {
        "name": {"type": "string"},
        "revision": {"type": "string"},
        "registry_dir": {"type": "string"},
        "cache_dir": {"type": "string"}
      }
    },
    "processing": {
      "type": "object",
      "properties": {
        "tile_size": {"type": "integer", "minimum": 0, "multipleOf": 2},
        "batch_size": {"type": "integer", "minimum": 1},
        "band_order": {"type": "array", "items": {"type": "integer", "minimum": 1}},
        "kernel": {"type": "string", "enum": ["bartlett_hann", "triangular"]},
        "num_classes": {"type": "integer", "minimum": 0}
      }
    },
    "postprocess": {
      "type": "object",
      "properties": {
        "blur_kernel_size": {"type": "integer", "minimum": 0},
        "morph_kernel_size": {"type": "integer", "minimum": 0},
        "max_tile_size": {"type": "integer", "minimum": 2}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "events_log": {"type": "string"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "inference_threads": {"type": "integer", "minimum": 0},
        "use_cuda": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace tile_segment::config
