#include "tile_segment/pipeline/segmentation_pipeline.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/tiling/stitch_register.hpp"
#include "tile_segment/tiling/window_planner.hpp"

#include <algorithm>

namespace tile_segment::pipeline {

SegmentationOptions SegmentationOptions::from_config(const config::Config& cfg) {
    SegmentationOptions opts;
    opts.tile_size = cfg.processing.tile_size;
    opts.batch_size = cfg.processing.batch_size;
    opts.band_order = cfg.processing.band_order;
    opts.kernel = tiling::string_to_kernel_family(cfg.processing.kernel);
    opts.postprocess.blur_kernel_size = cfg.postprocess.blur_kernel_size;
    opts.postprocess.morph_kernel_size = cfg.postprocess.morph_kernel_size;
    opts.postprocess.max_tile_size = cfg.postprocess.max_tile_size;
    return opts;
}

float resolve_max_pixel_value(const std::optional<float>& configured, PixelType pixel_type) {
    if (configured) {
        return *configured;
    }
    switch (pixel_type) {
        case PixelType::UINT8:
            return 255.0f;
        case PixelType::UINT16:
            return 65535.0f;
        case PixelType::FLOAT32:
            return 1.0f;
        default:
            throw ConfigError("unsupported input pixel type " + pixel_type_to_string(pixel_type) +
                              "; convert the image to uint8 or uint16");
    }
}

int resolve_tile_size(int requested, const std::optional<int>& preferred) {
    int size = requested;
    if (preferred && (requested <= 0 || requested != *preferred)) {
        size = *preferred;
    } else if (requested <= 0) {
        size = kDefaultTileSize;
    }
    if (size <= 0 || size % 2 != 0) {
        throw ConfigError("tile size must be a positive even number, got " + std::to_string(size));
    }
    return size;
}

std::vector<int> resolve_band_order(const std::vector<int>& band_order, int band_count, int input_channels) {
    std::vector<int> bands = band_order;
    if (bands.empty()) {
        if (band_count < input_channels) {
            throw ConfigError("image has " + std::to_string(band_count) + " bands but the model expects " +
                              std::to_string(input_channels) + "; pass a band order");
        }
        for (int b = 1; b <= input_channels; ++b) bands.push_back(b);
    }
    for (int b : bands) {
        if (b < 1 || b > band_count) {
            throw ConfigError("band index " + std::to_string(b) + " is outside 1.." + std::to_string(band_count));
        }
    }
    if (static_cast<int>(bands.size()) != input_channels) {
        throw ConfigError("band order selects " + std::to_string(bands.size()) +
                          " bands but the model expects " + std::to_string(input_channels));
    }
    return bands;
}

bool is_uniform_tile(const BandStack& tile) {
    if (tile.empty() || tile[0].size() == 0) {
        return true;
    }
    const float first = tile[0](0, 0);
    for (const auto& plane : tile) {
        if (!(plane.array() == first).all()) {
            return false;
        }
    }
    return true;
}

TiledSegmentationPipeline::TiledSegmentationPipeline(std::string run_id, std::ostream& event_out)
    : run_id_(std::move(run_id)), out_(event_out) {}

SegmentationReport TiledSegmentationPipeline::run(io::RasterReader& reader, io::RasterWriter& writer,
                                                  const model::SegmentationModel& model,
                                                  const SegmentationOptions& options) {
    const io::RasterInfo& info = reader.info();
    const int height = info.height;
    const int width = info.width;
    if (height < 1 || width < 1) {
        throw IOError("input raster is empty");
    }
    if (writer.height() != height || writer.width() != width) {
        throw IOError("output raster " + std::to_string(writer.height()) + "x" + std::to_string(writer.width()) +
                      " does not match input " + std::to_string(height) + "x" + std::to_string(width));
    }
    if (options.batch_size < 1) {
        throw ConfigError("batch size must be >= 1");
    }

    SegmentationReport report;

    // PLAN
    emitter_.phase_start(run_id_, Phase::PLAN, "PLAN", out_);

    const float max_pixel = resolve_max_pixel_value(model.config.max_pixel_value, info.pixel_type);
    if (!model.config.max_pixel_value && info.pixel_type == PixelType::FLOAT32) {
        emitter_.warning(run_id_, "input has float pixels; values are expected in [0,1]", out_);
    }

    const std::vector<int> bands =
        resolve_band_order(options.band_order, info.band_count, model.config.input_channels);

    const auto preferred = model.preferred_tile_size();
    const int tile_size = resolve_tile_size(options.tile_size, preferred);
    if (preferred && options.tile_size > 0 && options.tile_size != *preferred) {
        emitter_.warning(run_id_, "model requires tile size " + std::to_string(*preferred) +
                                      ", ignoring requested " + std::to_string(options.tile_size), out_);
    }
    const int stride = tile_size / 2;
    const int postprocess_stride_px = postprocess_stride(options.postprocess, tile_size);

    const auto [ext_h, ext_w] = tiling::calculate_extended_dimensions(height, width, tile_size, stride);
    const std::vector<Window> windows = tiling::generate_windows(ext_h, ext_w, tile_size, stride);
    if (!tiling::validate_full_coverage(height, width, windows)) {
        throw PipelineError("windows do not cover the image (" + std::to_string(height) + "x" +
                            std::to_string(width) + ", extended " + std::to_string(ext_h) + "x" +
                            std::to_string(ext_w) + ")");
    }

    report.tile_size = tile_size;
    report.window_count = static_cast<int>(windows.size());
    report.batch_count = static_cast<int>((windows.size() + options.batch_size - 1) / options.batch_size);

    emitter_.phase_end(run_id_, Phase::PLAN, "ok",
                       {{"tile_size", tile_size},
                        {"stride", stride},
                        {"extended_height", ext_h},
                        {"extended_width", ext_w},
                        {"windows", report.window_count},
                        {"batches", report.batch_count},
                        {"bands", bands},
                        {"max_pixel_value", max_pixel},
                        {"postprocess_stride", postprocess_stride_px}},
                       out_);

    // SEGMENT
    emitter_.phase_start(run_id_, Phase::SEGMENT, "SEGMENT", out_);

    std::optional<int> num_classes = model.num_classes;
    std::optional<tiling::StitchRegister> reg;
    if (num_classes) {
        reg.emplace(width, *num_classes, tile_size, options.kernel);
    }

    auto stitch_and_write = [&](const ScoreMap& scores, const Window& win) {
        auto clipped = tiling::clip_window_to_image(win, height, width);
        if (!clipped) {
            return;
        }
        auto result = reg->step(scores, *clipped, tiling::classify_edges(*clipped, height, width));
        writer.write(model.postprocess(result.scores), result.window);
    };

    const size_t batch_size = static_cast<size_t>(options.batch_size);
    int batch_index = 0;
    for (size_t start = 0; start < windows.size(); start += batch_size) {
        const size_t end = std::min(start + batch_size, windows.size());

        std::vector<BandStack> tiles;
        std::vector<bool> shortcut;
        model::TileBatch to_infer;
        for (size_t i = start; i < end; ++i) {
            BandStack tile = reader.read_window(windows[i], bands, true, 0.0f);
            const bool uniform = num_classes.has_value() && is_uniform_tile(tile);
            shortcut.push_back(uniform);
            if (!uniform) {
                to_infer.push_back(std::move(tile));
            }
        }

        std::vector<ScoreMap> predicted;
        if (!to_infer.empty()) {
            predicted = model.predict(std::move(to_infer), max_pixel);
            if (!reg) {
                num_classes = static_cast<int>(predicted.front().size());
                reg.emplace(width, *num_classes, tile_size, options.kernel);
            }
        }

        // Steps must follow window order, shortcut or not.
        size_t next_prediction = 0;
        for (size_t i = start; i < end; ++i) {
            if (shortcut[i - start]) {
                emitter_.tile_shortcut(run_id_, windows[i], model.config.default_output_value, out_);
                stitch_and_write(model.shortcut(tile_size, *num_classes), windows[i]);
                ++report.tiles_shortcut;
            } else {
                stitch_and_write(predicted[next_prediction++], windows[i]);
                ++report.tiles_inferred;
            }
        }

        ++batch_index;
        emitter_.phase_progress(run_id_, Phase::SEGMENT, batch_index, report.batch_count,
                                "batch " + std::to_string(batch_index), out_);
    }

    report.num_classes = num_classes.value_or(0);
    emitter_.phase_end(run_id_, Phase::SEGMENT, "ok",
                       {{"tiles_inferred", report.tiles_inferred},
                        {"tiles_shortcut", report.tiles_shortcut},
                        {"num_classes", report.num_classes}},
                       out_);

    // POSTPROCESS
    if (options.postprocess.enabled()) {
        emitter_.phase_start(run_id_, Phase::POSTPROCESS, "POSTPROCESS", out_);
        report.postprocess_windows = apply_postprocess_pass(
            writer, tile_size, options.postprocess, [&](int done, int total) {
                emitter_.phase_progress(run_id_, Phase::POSTPROCESS, done, total, "filter", out_);
            });
        emitter_.phase_end(run_id_, Phase::POSTPROCESS, "ok",
                           {{"windows", report.postprocess_windows}}, out_);
    }

    return report;
}

} // namespace tile_segment::pipeline
