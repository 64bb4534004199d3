#pragma once
/*
 * Config
 *
 * Purpose: user settings and the ~/.mgramrc loader.
 * Design: map option name → handler (args vector); each rc line is a
 * `set <name> [value]` command routed through that map.
 */
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#define MGRAM_DEFAULT_EXPORT_WIDTH 79
#define MGRAM_DEFAULT_DISPLAY_WIDTH 79
#define MGRAM_MIN_DISPLAY_WIDTH 20
#define MGRAM_RC_NAME ".mgramrc"
#define MGRAM_LOG_NAME "mgram.log"

struct Settings {
  int export_width = MGRAM_DEFAULT_EXPORT_WIDTH;
  int display_width = MGRAM_DEFAULT_DISPLAY_WIDTH;
  bool mouse = true;
  bool color = true;
  std::string log_level = "info";
  std::filesystem::path log_file;
  std::filesystem::path save_dir = ".";
};

class Config {
public:
  Config();
  const Settings& settings() const { return settings_; }
  Settings& settings() { return settings_; }

  // False with msg set when the line is not understood; settings untouched.
  bool apply_line(const std::string& line, std::string& msg);
  // Missing file is fine; msg keeps the last error of a bad line.
  bool load_rc(const std::filesystem::path& path, std::string& msg);

  static std::optional<std::filesystem::path> default_rc_path();
  static std::filesystem::path default_log_path();

private:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_options();
  void register_option(const std::string& name, Handler h) { options_[name] = std::move(h); }
  std::unordered_map<std::string, Handler> options_;
  Settings settings_;
};
