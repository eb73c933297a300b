#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/events.hpp"
#include "tile_segment/core/utils.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace core = tile_segment::core;

TEST_CASE("sha256_bytes_matches_known_digests") {
    std::vector<uint8_t> abc{'a', 'b', 'c'};
    REQUIRE(core::sha256_bytes(abc) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(core::sha256_bytes({}) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sha256_file_matches_sha256_bytes") {
    auto path = core::fs::temp_directory_path() / ("tile_segment_sha_" + core::get_run_id() + ".bin");
    core::write_text(path, "abc");
    REQUIRE(core::sha256_file(path) == core::sha256_bytes({'a', 'b', 'c'}));
    core::fs::remove(path);
    REQUIRE_THROWS_AS(core::sha256_file(path), tile_segment::IOError);
}

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("Bartlett_HANN") == "bartlett_hann");
    REQUIRE(core::trim("  argmax \n") == "argmax");
    REQUIRE(core::trim("   ").empty());
    REQUIRE(core::join({"x", "y", "z"}, ", ") == "x, y, z");
    REQUIRE(core::starts_with("https://host", "https://"));
    REQUIRE_FALSE(core::starts_with("a", "abc"));
}

TEST_CASE("url_detection_and_filename") {
    REQUIRE(core::is_url("https://example.org/m/model.onnx"));
    REQUIRE(core::is_url("ftp://example.org/model.onnx"));
    REQUIRE_FALSE(core::is_url("/data/model.onnx"));
    REQUIRE_FALSE(core::is_url("models/model.onnx"));

    REQUIRE(core::url_filename("https://example.org/m/1/model.onnx") == "model.onnx");
    REQUIRE(core::url_filename("https://example.org/m/model.onnx?sig=abc#x") == "model.onnx");
}

TEST_CASE("expand_user_replaces_leading_tilde") {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        REQUIRE(core::expand_user("~/models/a.onnx") == core::fs::path(home) / "models/a.onnx");
        REQUIRE(core::expand_user("~") == core::fs::path(home) / "");
    }
    REQUIRE(core::expand_user("/abs/path") == core::fs::path("/abs/path"));
    REQUIRE(core::expand_user("rel/~x") == core::fs::path("rel/~x"));
}

TEST_CASE("format_bytes_picks_binary_units") {
    REQUIRE(core::format_bytes(0) == "0 B");
    REQUIRE(core::format_bytes(1023) == "1023 B");
    REQUIRE(core::format_bytes(1024) == "1.00 KiB");
    REQUIRE(core::format_bytes(3ull * 1024 * 1024 / 2) == "1.50 MiB");
}

TEST_CASE("events_are_json_lines_with_run_id") {
    std::ostringstream out;
    core::EventEmitter emitter;
    emitter.phase_start("run1", tile_segment::Phase::SEGMENT, "SEGMENT", out);
    emitter.tile_shortcut("run1", tile_segment::Window{0, 256, 512, 512}, 3, out);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<core::json> events;
    while (std::getline(lines, line)) {
        events.push_back(core::json::parse(line));
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0]["type"] == "phase_start");
    REQUIRE(events[0]["run_id"] == "run1");
    REQUIRE(events[0]["phase_name"] == "SEGMENT");
    REQUIRE(events[1]["type"] == "tile_shortcut");
    REQUIRE(events[1]["window"]["col_off"] == 256);
    REQUIRE(events[1].contains("ts"));
}
