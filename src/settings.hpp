#pragma once
/*
 * Settings
 *
 * Purpose: runtime options; defaults from config.hpp, overridden by ~/.h5forestrc.
 * Format: one command per line ("set bins 80", ":set mouse=off"); '#', '"' and
 * '//' start comments.
 */
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "config.hpp"
#include "cmd_registry.hpp"

struct Settings {
  std::size_t values_cap = H5F_VALUES_CAP;
  int poll_ms = H5F_POLL_MS;
  int hist_bins = H5F_HIST_BINS;
  std::size_t chunk_elements = H5F_CHUNK_ELEMENTS;
  int jump_step = H5F_JUMP_STEP;
  bool mouse = true;
  std::string log_file;
  std::string log_level = "info";
};

void register_setting_commands(CommandRegistry& registry, Settings& settings);
std::optional<std::filesystem::path> default_rc_path();
// applies every line; stops at the first bad one and reports it through msg
bool load_rc(const std::filesystem::path& path, Settings& settings, std::string& msg);
