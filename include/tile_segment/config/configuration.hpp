#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tile_segment::config {

namespace fs = std::filesystem;

struct ModelSection {
  std::string name;
  std::string revision;              // empty -> latest
  std::string registry_dir = "models";
  std::string cache_dir;             // empty -> default_cache_dir()
};

struct ProcessingConfig {
  int tile_size = 0;                 // 0 -> model preferred or 1024
  int batch_size = 1;
  std::vector<int> band_order;       // 1-based; empty -> 1..input_channels
  std::string kernel = "bartlett_hann";
  int num_classes = 0;               // 0 -> backend output shape
};

struct PostprocessConfig {
  int blur_kernel_size = 5;
  int morph_kernel_size = 0;
  int max_tile_size = 512;
};

struct OutputConfig {
  std::string events_log;
};

struct RuntimeConfig {
  int inference_threads = 0;
  bool use_cuda = false;
};

struct Config {
  ModelSection model;
  ProcessingConfig processing;
  PostprocessConfig postprocess;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace tile_segment::config
