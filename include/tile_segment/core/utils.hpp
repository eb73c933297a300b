#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tile_segment::core {

namespace fs = std::filesystem;

// Run identity
std::string get_iso_timestamp();
std::string get_run_id();

// Files and the model cache location
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
fs::path expand_user(const std::string& path);
fs::path default_cache_dir();
std::string format_bytes(uint64_t bytes);

// Digests checked against model configs
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Strings and dependency URIs
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
bool is_url(const std::string& uri);
std::string url_filename(const std::string& url);

} // namespace tile_segment::core
