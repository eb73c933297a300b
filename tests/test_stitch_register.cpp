#include "tile_segment/core/errors.hpp"
#include "tile_segment/tiling/stitch_register.hpp"
#include "tile_segment/tiling/window_planner.hpp"

#include <algorithm>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using tile_segment::EdgeFlags;
using tile_segment::Matrix2Df;
using tile_segment::ScoreMap;
using tile_segment::Window;
using tile_segment::tiling::KernelFamily;
using tile_segment::tiling::StitchRegister;

namespace {

ScoreMap random_scores(int depth, int size) {
    ScoreMap scores;
    for (int k = 0; k < depth; ++k) {
        scores.push_back(Matrix2Df::Random(size, size));
    }
    return scores;
}

void require_step(StitchRegister& reg, const ScoreMap& scores, const Window& in, const Window& expected) {
    auto result = reg.step(scores, in, EdgeFlags{});
    REQUIRE(result.window == expected);
    REQUIRE(result.scores.size() == scores.size());
    for (const auto& plane : result.scores) {
        REQUIRE(plane.rows() == expected.height);
        REQUIRE(plane.cols() == expected.width);
    }
}

// Slides an s x s tile over an h x w image at stride s/2 and sums every
// emitted region into one canvas.
Matrix2Df run_moving_window(int h, int w, int s, KernelFamily family) {
    StitchRegister reg(w, 1, s, family);
    Matrix2Df output = Matrix2Df::Zero(h, w);
    const int hs = s / 2;

    for (int row = 0; row < h - hs; row += hs) {
        for (int col = 0; col < w - hs; col += hs) {
            Window win{row, col, std::min(s, h - row), std::min(s, w - col)};
            EdgeFlags e{row == 0, row == h - s, col == 0, col == w - s};

            auto r = reg.step(ScoreMap{Matrix2Df::Ones(s, s)}, win, e);

            if (e.top) {
                REQUIRE(r.window.row_off == 0);
                REQUIRE(r.window.height == hs);
            }
            if (e.left) {
                REQUIRE(r.window.col_off == 0);
                REQUIRE(r.window.width == hs);
            }
            if (e.bottom) {
                REQUIRE(r.window.row_off == h - s);
                REQUIRE(r.window.height == s);
            }
            if (e.right) {
                REQUIRE(r.window.col_off == w - s);
                REQUIRE(r.window.width == s);
            }

            output.block(r.window.row_off, r.window.col_off, r.window.height, r.window.width) += r.scores[0];
        }
    }
    return output;
}

} // namespace

TEST_CASE("register_initialization_sizes_buffer_strip") {
    StitchRegister reg(1000, 2, 256);
    REQUIRE(reg.depth() == 2);
    REQUIRE(reg.window_size() == 256);
    REQUIRE(reg.half_window() == 128);
    REQUIRE(reg.width() == 4 * 256 + 128);
    REQUIRE(reg.buffer().size() == 2);
    REQUIRE(reg.buffer()[0].rows() == 256);
    REQUIRE(reg.buffer()[0].cols() == reg.width());
    REQUIRE(reg.buffer()[1].isZero());
}

TEST_CASE("step_emits_top_left_quadrant_and_clips_width") {
    StitchRegister reg(1000, 2, 256);
    auto scores = random_scores(2, 256);

    require_step(reg, scores, Window{0, 0, 256, 256}, Window{0, 0, 128, 128});
    require_step(reg, scores, Window{0, 768, 256, 232}, Window{0, 768, 128, 128});
    require_step(reg, scores, Window{0, 896, 256, 104}, Window{0, 896, 128, 104});
}

TEST_CASE("right_edge_step_emits_clipped_top_half") {
    StitchRegister reg(1000, 2, 256);
    auto result = reg.step(random_scores(2, 256), Window{0, 896, 256, 104},
                           EdgeFlags{true, false, false, true});
    REQUIRE(result.window == Window{0, 896, 128, 104});
    REQUIRE(result.scores[0].rows() == 128);
    REQUIRE(result.scores[0].cols() == 104);
}

TEST_CASE("small_image_steps_clip_to_image") {
    StitchRegister reg(200, 2, 256);
    auto scores = random_scores(2, 256);

    require_step(reg, scores, Window{0, 0, 200, 200}, Window{0, 0, 128, 128});
    require_step(reg, scores, Window{0, 128, 200, 72}, Window{0, 128, 128, 72});
    require_step(reg, scores, Window{128, 0, 72, 128}, Window{128, 0, 72, 128});
    require_step(reg, scores, Window{128, 128, 72, 72}, Window{128, 128, 72, 72});
}

TEST_CASE("single_tile_image_is_emitted_in_one_step") {
    StitchRegister reg(50, 2, 512);
    auto scores = random_scores(2, 512);
    auto result = reg.step(scores, Window{0, 0, 50, 50}, EdgeFlags{true, true, true, true});

    REQUIRE(result.window == Window{0, 0, 50, 50});
    REQUIRE(result.scores[0].rows() == 50);
    REQUIRE(result.scores[0].cols() == 50);
    // All edges set: kernel is all ones and the register started empty.
    REQUIRE(result.scores[1].isApprox(scores[1].topLeftCorner(50, 50)));
}

TEST_CASE("full_window_image_steps") {
    StitchRegister reg(200, 2, 200);
    auto scores = random_scores(2, 200);

    require_step(reg, scores, Window{0, 0, 200, 200}, Window{0, 0, 100, 100});
    require_step(reg, scores, Window{0, 100, 200, 100}, Window{0, 100, 100, 100});
}

TEST_CASE("odd_window_size_truncates_half_window") {
    StitchRegister reg(200, 2, 125);
    REQUIRE(reg.half_window() == 62);
    auto scores = random_scores(2, 125);

    require_step(reg, scores, Window{0, 0, 125, 125}, Window{0, 0, 62, 62});
    require_step(reg, scores, Window{0, 62, 125, 63}, Window{0, 62, 62, 62});
    require_step(reg, scores, Window{0, 124, 125, 1}, Window{0, 124, 62, 1});
    require_step(reg, scores, Window{62, 0, 63, 125}, Window{62, 0, 62, 62});
    require_step(reg, scores, Window{124, 0, 1, 125}, Window{124, 0, 1, 62});
}

TEST_CASE("odd_window_size_edge_rolls_stay_in_bounds") {
    StitchRegister reg(200, 1, 125);
    auto scores = random_scores(1, 125);
    auto right = reg.step(scores, Window{0, 62, 125, 125}, EdgeFlags{true, false, false, true});
    REQUIRE(right.window == Window{0, 62, 62, 125});
    auto bottom = reg.step(scores, Window{62, 0, 125, 125}, EdgeFlags{false, true, true, false});
    REQUIRE(bottom.window == Window{62, 0, 125, 62});
}

TEST_CASE("moving_window_counts_overlaps") {
    Matrix2Df a = run_moving_window(4, 4, 2, KernelFamily::UNIFORM);

    REQUIRE(a(0, 0) == Catch::Approx(1.0f));
    REQUIRE(a(0, 3) == Catch::Approx(1.0f));
    REQUIRE(a(3, 0) == Catch::Approx(1.0f));
    REQUIRE(a(3, 3) == Catch::Approx(1.0f));

    for (int i = 1; i < 3; ++i) {
        REQUIRE(a(0, i) == Catch::Approx(2.0f));
        REQUIRE(a(3, i) == Catch::Approx(2.0f));
        REQUIRE(a(i, 0) == Catch::Approx(2.0f));
        REQUIRE(a(i, 3) == Catch::Approx(2.0f));
    }
    for (int i = 1; i < 3; ++i) {
        for (int j = 1; j < 3; ++j) {
            REQUIRE(a(i, j) == Catch::Approx(4.0f));
        }
    }
}

TEST_CASE("kernel_sum_is_one_everywhere") {
    Matrix2Df a = run_moving_window(600, 600, 20, KernelFamily::BARTLETT_HANN);
    REQUIRE(a.minCoeff() == Catch::Approx(1.0f).margin(1e-5));
    REQUIRE(a.maxCoeff() == Catch::Approx(1.0f).margin(1e-5));
}

TEST_CASE("planner_driven_stitch_reconstructs_constant_scores") {
    namespace tiling = tile_segment::tiling;
    const int h = 77, w = 131, s = 32;
    auto [eh, ew] = tiling::calculate_extended_dimensions(h, w, s, s / 2);
    StitchRegister reg(w, 2, s);

    Matrix2Df c0 = Matrix2Df::Zero(h, w);
    Matrix2Df c1 = Matrix2Df::Zero(h, w);
    Matrix2Df hits = Matrix2Df::Zero(h, w);
    ScoreMap tile{Matrix2Df::Constant(s, s, 3.0f), Matrix2Df::Constant(s, s, -1.0f)};

    for (const auto& win : tiling::generate_windows(eh, ew, s, s / 2)) {
        auto clipped = tiling::clip_window_to_image(win, h, w);
        if (!clipped) continue;
        auto r = reg.step(tile, *clipped, tiling::classify_edges(*clipped, h, w));
        const auto& o = r.window;
        REQUIRE(o.row_off + o.height <= h);
        REQUIRE(o.col_off + o.width <= w);
        c0.block(o.row_off, o.col_off, o.height, o.width) += r.scores[0];
        c1.block(o.row_off, o.col_off, o.height, o.width) += r.scores[1];
        hits.block(o.row_off, o.col_off, o.height, o.width).array() += 1.0f;
    }

    // Every pixel emitted exactly once with a fully normalized value.
    REQUIRE((hits.array() == 1.0f).all());
    REQUIRE(c0.minCoeff() == Catch::Approx(3.0f).margin(1e-4));
    REQUIRE(c0.maxCoeff() == Catch::Approx(3.0f).margin(1e-4));
    REQUIRE(c1.minCoeff() == Catch::Approx(-1.0f).margin(1e-4));
    REQUIRE(c1.maxCoeff() == Catch::Approx(-1.0f).margin(1e-4));
}

TEST_CASE("every_selectable_kernel_stitches_constant_scores_unchanged") {
    namespace tiling = tile_segment::tiling;
    const int h = 100, w = 100, s = 32;
    auto [eh, ew] = tiling::calculate_extended_dimensions(h, w, s, s / 2);

    for (const char* name : {"bartlett_hann", "triangular"}) {
        StitchRegister reg(w, 1, s, tiling::string_to_kernel_family(name));
        Matrix2Df out = Matrix2Df::Zero(h, w);
        for (const auto& win : tiling::generate_windows(eh, ew, s, s / 2)) {
            auto clipped = tiling::clip_window_to_image(win, h, w);
            if (!clipped) continue;
            auto r = reg.step(ScoreMap{Matrix2Df::Constant(s, s, 0.8f)}, *clipped,
                              tiling::classify_edges(*clipped, h, w));
            out.block(r.window.row_off, r.window.col_off, r.window.height, r.window.width) += r.scores[0];
        }
        INFO("kernel " << name);
        REQUIRE(out.minCoeff() == Catch::Approx(0.8f).margin(1e-4));
        REQUIRE(out.maxCoeff() == Catch::Approx(0.8f).margin(1e-4));
    }
}

TEST_CASE("step_rejects_wrong_depth_and_out_of_range_columns") {
    StitchRegister reg(100, 2, 32);
    REQUIRE_THROWS_AS(reg.step(random_scores(3, 32), Window{0, 0, 32, 32}, EdgeFlags{}),
                      tile_segment::PipelineError);
    REQUIRE_THROWS_AS(reg.step(random_scores(2, 32), Window{0, 120, 32, 32}, EdgeFlags{}),
                      tile_segment::PipelineError);
}

TEST_CASE("reset_clears_buffer") {
    StitchRegister reg(100, 1, 32);
    reg.step(random_scores(1, 32), Window{0, 0, 32, 32}, EdgeFlags{});
    REQUIRE_FALSE(reg.buffer()[0].isZero());
    reg.reset();
    REQUIRE(reg.buffer()[0].isZero());
}
