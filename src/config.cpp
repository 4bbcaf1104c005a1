#include "config.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok || s.size() > 9) return false;
  out = std::stoi(s);
  return true;
}

static bool parse_bool(const std::string& s, bool& out) {
  if (s == "on" || s == "1" || s == "true") { out = true; return true; }
  if (s == "off" || s == "0" || s == "false") { out = false; return true; }
  return false;
}

static bool parse_ratio(const std::string& s, double& out) {
  if (s.empty()) return false;
  std::istringstream iss(s);
  double v = 0.0;
  if (!(iss >> v)) return false;
  char extra;
  if (iss >> extra) return false;
  out = v;
  return true;
}

struct IntSetting { const char* name; int Settings::*field; int min; };
struct BoolSetting { const char* name; bool Settings::*field; };

static const IntSetting kIntSettings[] = {
  {"hoverdelay", &Settings::hover_delay_ms, 0},
  {"keysuppress", &Settings::keyboard_suppress_ms, 0},
  {"omniboxdelay", &Settings::omnibox_debounce_ms, 0},
  {"finddelay", &Settings::find_debounce_ms, 0},
  {"ratiodelay", &Settings::ratio_notify_ms, 0},
  {"ratioframes", &Settings::max_ratio_retry_frames, 1},
  {"frame", &Settings::frame_interval_ms, 1},
  {"omniboxmax", &Settings::omnibox_max_results, 1},
};

static const BoolSetting kBoolSettings[] = {
  {"mouse", &Settings::enable_mouse},
  {"hoverfocus", &Settings::focus_follows_mouse},
};

bool apply_setting(Settings& s, const std::string& name, const std::string& value, std::string& msg) {
  for (const auto& is : kIntSettings) {
    if (name != is.name) continue;
    int v = 0;
    if (!parse_int(value, v)) { msg = std::string("set ") + is.name + ": value must be a number"; return false; }
    if (v < is.min) { msg = std::string("set ") + is.name + ": value must be >= " + std::to_string(is.min); return false; }
    s.*is.field = v;
    msg = std::string(is.name) + "=" + std::to_string(v);
    return true;
  }
  for (const auto& bs : kBoolSettings) {
    if (name != bs.name) continue;
    bool v = false;
    if (value.empty()) v = !(s.*bs.field);
    else if (!parse_bool(value, v)) { msg = std::string("set ") + bs.name + ": use on|off"; return false; }
    s.*bs.field = v;
    msg = std::string(bs.name) + (v ? " on" : " off");
    return true;
  }
  if (name == "ratio") {
    double r = 0.0;
    if (!parse_ratio(value, r) || r < 0.0 || r > 1.0) { msg = "set ratio: value must be within 0..1"; return false; }
    s.default_split_ratio = r;
    msg = "ratio=" + value;
    return true;
  }
  msg = "unknown option: " + name;
  return false;
}

std::vector<std::string> setting_names() {
  std::vector<std::string> names;
  for (const auto& is : kIntSettings) names.emplace_back(is.name);
  for (const auto& bs : kBoolSettings) names.emplace_back(bs.name);
  names.emplace_back("ratio");
  return names;
}

std::string describe_setting(const Settings& s, const std::string& name) {
  for (const auto& is : kIntSettings) if (name == is.name) return name + "=" + std::to_string(s.*is.field);
  for (const auto& bs : kBoolSettings) if (name == bs.name) return name + ((s.*bs.field) ? "=on" : "=off");
  if (name == "ratio") {
    std::ostringstream oss;
    oss << "ratio=" << s.default_split_ratio;
    return oss.str();
  }
  return "unknown option: " + name;
}

bool normalize_rc_line(const std::string& raw, std::string& out) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < raw.size() && isspace_fn((unsigned char)raw[i])) i++;
  size_t j = raw.size(); while (j > i && isspace_fn((unsigned char)raw[j-1])) j--;
  std::string s = (j > i) ? raw.substr(i, j - i) : std::string();
  if (s.empty()) return false;
  if (s[0] == '#' || s[0] == '"') return false;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return false;
  if (s[0] == ':') s.erase(s.begin());
  if (s.empty()) return false;
  out = s;
  return true;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / ".mtilerc";
}

bool read_rc_commands(const std::filesystem::path& path, std::vector<std::string>& out, std::string& msg) {
  out.clear();
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) { msg.clear(); return true; }
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  for (const auto& raw : lines) {
    std::string cmd;
    if (normalize_rc_line(raw, cmd)) out.push_back(std::move(cmd));
  }
  msg = "loaded " + path.string();
  return true;
}
