#pragma once
/*
 * Settings
 *
 * Purpose: tunables for the layout engine and the app (delays, ratios, mouse).
 * Source: defaults below, then ~/.mtilerc lines executed as ex-commands,
 * then interactive ":set name value" / ":set name=value".
 */
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

struct Settings {
  int hover_delay_ms = 150;
  int keyboard_suppress_ms = 300;
  int omnibox_debounce_ms = 150;
  int find_debounce_ms = 100;
  int ratio_notify_ms = 100;
  int max_ratio_retry_frames = 120;
  int frame_interval_ms = 16;
  int omnibox_max_results = 10;
  double default_split_ratio = 0.5;
  bool enable_mouse = true;
  bool focus_follows_mouse = true;

  std::chrono::milliseconds hover_delay() const { return std::chrono::milliseconds(hover_delay_ms); }
  std::chrono::milliseconds keyboard_suppress() const { return std::chrono::milliseconds(keyboard_suppress_ms); }
};

// name/value from ":set"; msg gets the confirmation or the usage error
bool apply_setting(Settings& s, const std::string& name, const std::string& value, std::string& msg);
std::vector<std::string> setting_names();
std::string describe_setting(const Settings& s, const std::string& name);

// Strips blanks, comments and a leading ':'; false when nothing is left to run.
bool normalize_rc_line(const std::string& raw, std::string& out);
std::filesystem::path default_rc_path();
bool read_rc_commands(const std::filesystem::path& path, std::vector<std::string>& out, std::string& msg);
