#include "tile_segment/config/configuration.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/events.hpp"
#include "tile_segment/core/utils.hpp"
#include "tile_segment/io/fits_raster.hpp"
#include "tile_segment/model/inference_model.hpp"
#include "tile_segment/model/model_cache.hpp"
#include "tile_segment/model/model_fetcher.hpp"
#include "tile_segment/model/model_registry.hpp"
#include "tile_segment/model/onnx_backend.hpp"
#include "tile_segment/pipeline/segmentation_pipeline.hpp"

#include <QCoreApplication>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

namespace core = tile_segment::core;
namespace config = tile_segment::config;
namespace io = tile_segment::io;
namespace model = tile_segment::model;
namespace pipeline = tile_segment::pipeline;

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

void print_json(const json &j) { std::cout << j.dump(2) << std::endl; }

fs::path resolve_cache_dir(const std::string &cache_dir) {
  return cache_dir.empty() ? core::default_cache_dir()
                           : core::expand_user(cache_dir);
}

struct SegmentArgs {
  std::string model_name;
  std::string revision;
  std::string input;
  std::string output;
  std::string config_path;
  std::string registry_dir;
  std::string cache_dir;
  std::string kernel;
  std::string events_log;
  int batch_size = 1;
  int crop_size = 0;
  int blur_kernel = 5;
  int morph_kernel = 0;
  std::vector<int> band_order;
};

struct SegmentFlags {
  CLI::Option *revision = nullptr;
  CLI::Option *registry_dir = nullptr;
  CLI::Option *cache_dir = nullptr;
  CLI::Option *batch_size = nullptr;
  CLI::Option *crop_size = nullptr;
  CLI::Option *blur_kernel = nullptr;
  CLI::Option *morph_kernel = nullptr;
  CLI::Option *band_order = nullptr;
  CLI::Option *kernel = nullptr;
  CLI::Option *events_log = nullptr;
};

// File values first, then any flag given on the command line.
config::Config build_config(const SegmentArgs &args, const SegmentFlags &flags) {
  config::Config cfg = args.config_path.empty()
                           ? config::Config{}
                           : config::Config::load(args.config_path);

  if (!args.model_name.empty())
    cfg.model.name = args.model_name;
  if (flags.revision->count())
    cfg.model.revision = args.revision;
  if (flags.registry_dir->count())
    cfg.model.registry_dir = args.registry_dir;
  if (flags.cache_dir->count())
    cfg.model.cache_dir = args.cache_dir;
  if (flags.batch_size->count())
    cfg.processing.batch_size = args.batch_size;
  if (flags.crop_size->count())
    cfg.processing.tile_size = args.crop_size;
  if (flags.blur_kernel->count())
    cfg.postprocess.blur_kernel_size = args.blur_kernel;
  if (flags.morph_kernel->count())
    cfg.postprocess.morph_kernel_size = args.morph_kernel;
  if (flags.band_order->count())
    cfg.processing.band_order = args.band_order;
  if (flags.kernel->count())
    cfg.processing.kernel = args.kernel;
  if (flags.events_log->count())
    cfg.output.events_log = args.events_log;

  if (cfg.model.name.empty()) {
    throw tile_segment::ConfigError("no model given; pass -m or set model.name");
  }
  cfg.validate();
  return cfg;
}

int segment_command(const SegmentArgs &args, const SegmentFlags &flags) {
  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter;

  config::Config cfg;
  try {
    cfg = build_config(args, flags);
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), std::cout);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file;
  if (!cfg.output.events_log.empty()) {
    event_log_file.open(cfg.output.events_log);
    if (!event_log_file) {
      std::cerr << "Error: cannot open events log " << cfg.output.events_log
                << std::endl;
      return 1;
    }
  }
  TeeBuf tee_buf(std::cout.rdbuf(),
                 event_log_file.is_open() ? event_log_file.rdbuf() : nullptr);
  std::ostream log_file(&tee_buf);

  emitter.run_start(run_id,
                    {{"model", cfg.model.name},
                     {"revision", cfg.model.revision},
                     {"input", args.input},
                     {"output", args.output},
                     {"config", args.config_path}},
                    log_file);

  try {
    auto registry = model::ModelRegistry::from_config_dir(cfg.model.registry_dir);
    const model::ModelConfig &model_cfg =
        cfg.model.revision.empty()
            ? registry.get(cfg.model.name)
            : registry.get(cfg.model.name, cfg.model.revision);

    model::ModelCache cache(resolve_cache_dir(cfg.model.cache_dir),
                            std::make_shared<model::HttpModelFetcher>());
    int last_percent = -1;
    const fs::path model_path =
        cache.ensure(model_cfg, [&](int64_t received, int64_t total) {
          if (total <= 0)
            return;
          const int percent = static_cast<int>(received * 100 / total);
          if (percent != last_percent) {
            last_percent = percent;
            core::emit_event("download_progress", run_id,
                             {{"received", received}, {"total", total}},
                             log_file);
          }
        });

    model::OnnxOptions onnx_options;
    onnx_options.intra_op_threads = cfg.runtime.inference_threads;
    onnx_options.use_cuda = cfg.runtime.use_cuda;
    auto seg_model = model::SegmentationModel::create(
        model_cfg, std::make_shared<model::OnnxBackend>(model_path, onnx_options),
        cfg.processing.num_classes);

    io::FitsRasterReader reader(args.input);
    const auto &info = reader.info();

    io::WriterOptions writer_options;
    writer_options.height = info.height;
    writer_options.width = info.width;
    writer_options.nodata = static_cast<uint8_t>(model_cfg.nodata_value);
    writer_options.crs = info.crs;
    writer_options.transform = info.transform;
    writer_options.metadata = info.metadata;
    io::FitsRasterWriter writer(args.output, writer_options);

    pipeline::TiledSegmentationPipeline runner(run_id, log_file);
    auto report = runner.run(reader, writer,
                             seg_model,
                             pipeline::SegmentationOptions::from_config(cfg));
    writer.close();

    core::emit_event("summary", run_id,
                     {{"tile_size", report.tile_size},
                      {"windows", report.window_count},
                      {"tiles_inferred", report.tiles_inferred},
                      {"tiles_shortcut", report.tiles_shortcut},
                      {"num_classes", report.num_classes},
                      {"postprocess_windows", report.postprocess_windows}},
                     log_file);
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  emitter.run_end(run_id, true, "ok", log_file);
  return 0;
}

int models_command(const std::string &registry_dir, const std::string &cache_dir) {
  try {
    auto registry = model::ModelRegistry::from_config_dir(registry_dir);
    model::ModelCache cache(resolve_cache_dir(cache_dir));

    json out = json::array();
    for (const auto &name : registry.list_model_names()) {
      const auto &cfg = registry.get(name);
      out.push_back({{"name", name},
                     {"revision", cfg.revision},
                     {"description", cfg.description},
                     {"status", model::cache_status_to_string(cache.status(cfg))}});
    }
    print_json(out);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int revisions_command(const std::string &name, const std::string &registry_dir,
                      const std::string &cache_dir) {
  try {
    auto registry = model::ModelRegistry::from_config_dir(registry_dir);
    model::ModelCache cache(resolve_cache_dir(cache_dir));
    const std::string latest = registry.get_latest_revision(name);

    auto revs = registry.revisions(name);
    json out = json::array();
    for (auto it = revs.rbegin(); it != revs.rend(); ++it) {
      const auto &cfg = registry.get(name, *it);
      out.push_back({{"revision", *it},
                     {"latest", *it == latest},
                     {"description", cfg.description},
                     {"status", model::cache_status_to_string(cache.status(cfg))}});
    }
    print_json({{"model", name}, {"revisions", out}});
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int clean_command(const std::string &cache_dir, bool yes) {
  try {
    model::ModelCache cache(resolve_cache_dir(cache_dir));
    const uint64_t size = cache.cache_size();
    if (size == 0) {
      print_json({{"cache_dir", cache.cache_dir().string()},
                  {"freed_bytes", 0},
                  {"status", "empty"}});
      return 0;
    }

    if (!yes) {
      std::cerr << "Clear model cache at " << cache.cache_dir().string() << " ("
                << core::format_bytes(size) << ")? [y/N] " << std::flush;
      std::string answer;
      std::getline(std::cin, answer);
      answer = core::to_lower(core::trim(answer));
      if (answer != "y" && answer != "yes") {
        print_json({{"cache_dir", cache.cache_dir().string()},
                    {"freed_bytes", 0},
                    {"status", "aborted"}});
        return 0;
      }
    }

    const uint64_t freed = cache.clean();
    print_json({{"cache_dir", cache.cache_dir().string()},
                {"freed_bytes", freed},
                {"freed", core::format_bytes(freed)},
                {"status", "ok"}});
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int validate_config_command(const std::string &path) {
  json out;
  out["path"] = path;
  json errors = json::array();
  try {
    config::Config::load(path).validate();
  } catch (const std::exception &e) {
    errors.push_back(e.what());
  }
  out["valid"] = errors.empty();
  out["errors"] = errors;
  print_json(out);
  return errors.empty() ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qapp(argc, argv);  // needed for Qt6::Network event loop

  CLI::App app{"Tiled semantic segmentation of large rasters"};
  app.require_subcommand(1);

  std::string registry_dir = "models";
  std::string cache_dir;
  app.add_option("--registry-dir", registry_dir, "Directory of model config JSON files")
      ->default_val("models");
  app.add_option("--cache-dir", cache_dir, "Model cache directory");

  SegmentArgs seg;
  SegmentFlags flags;
  auto segment_cmd = app.add_subcommand("segment", "Segment a raster with a model");
  segment_cmd->add_option("-m,--model", seg.model_name, "Model name (see `models`)");
  segment_cmd->add_option("-i,--input", seg.input, "Input FITS raster")->required();
  segment_cmd->add_option("-o,--output", seg.output, "Output label raster")->required();
  flags.revision = segment_cmd->add_option("--revision", seg.revision, "Model revision (default latest)");
  segment_cmd->add_option("--config", seg.config_path, "Path to config.yaml");
  flags.batch_size = segment_cmd->add_option("--batch-size", seg.batch_size, "Tiles per inference call");
  flags.crop_size = segment_cmd->add_option("-z,--crop-size", seg.crop_size,
                                            "Tile size (even; default model preferred or 1024)");
  flags.blur_kernel = segment_cmd->add_option("--blur-kernel", seg.blur_kernel,
                                              "Median blur kernel size (0 disables)");
  flags.morph_kernel = segment_cmd->add_option("--morph-kernel", seg.morph_kernel,
                                               "Morphological kernel size (0 disables)");
  flags.band_order = segment_cmd->add_option("-b,--band-order", seg.band_order,
                                             "1-based band indices in model channel order");
  flags.kernel = segment_cmd->add_option("--kernel", seg.kernel,
                                         "Stitching kernel: bartlett_hann|triangular");
  flags.events_log = segment_cmd->add_option("--events-log", seg.events_log, "Also write events to this file");

  // Global registry/cache options feed segment too.
  flags.registry_dir = app.get_option("--registry-dir");
  flags.cache_dir = app.get_option("--cache-dir");

  auto models_cmd = app.add_subcommand("models", "List models with their latest revision");

  std::string revisions_model;
  auto revisions_cmd = app.add_subcommand("revisions", "List all revisions of a model");
  revisions_cmd->add_option("-m,--model", revisions_model, "Model name")->required();

  bool clean_yes = false;
  auto clean_cmd = app.add_subcommand("clean", "Clear the model cache");
  clean_cmd->add_flag("--yes", clean_yes, "Do not ask for confirmation");

  std::string validate_path;
  auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("--path", validate_path, "Path to config.yaml")->required();

  auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  if (segment_cmd->parsed()) {
    seg.registry_dir = registry_dir;
    seg.cache_dir = cache_dir;
    return segment_command(seg, flags);
  }
  if (models_cmd->parsed()) {
    return models_command(registry_dir, cache_dir);
  }
  if (revisions_cmd->parsed()) {
    return revisions_command(revisions_model, registry_dir, cache_dir);
  }
  if (clean_cmd->parsed()) {
    return clean_command(cache_dir, clean_yes);
  }
  if (validate_cmd->parsed()) {
    return validate_config_command(validate_path);
  }
  if (schema_cmd->parsed()) {
    std::cout << tile_segment::config::get_schema_json() << std::endl;
    return 0;
  }

  std::cerr << app.help() << std::endl;
  return 2;
}
