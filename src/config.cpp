#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <spdlog/spdlog.h>
#include "file_io.hpp"

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::optional<int> parse_int(const std::string& s) {
  if (s.empty()) return std::nullopt;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) return std::nullopt;
  try { return std::stoi(s); } catch (const std::out_of_range&) { return std::nullopt; }
}

static std::optional<bool> parse_switch(const std::string& s) {
  std::string v = to_lower(s);
  if (v == "on" || v == "1" || v == "true") return true;
  if (v == "off" || v == "0" || v == "false") return false;
  return std::nullopt;
}

Config::Config() {
  settings_.log_file = default_log_path();
  register_options();
}

void Config::register_options() {
  register_option("exportwidth", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set exportwidth: use :set exportwidth <width>"; return false; }
    auto w = parse_int(args[0]);
    if (!w) { msg = "set exportwidth: width must be a number"; return false; }
    if (*w < 1) { msg = "set exportwidth: width must be >= 1"; return false; }
    settings_.export_width = *w;
    msg = "exportwidth=" + std::to_string(*w);
    return true;
  });
  register_option("displaywidth", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set displaywidth: use :set displaywidth <width>"; return false; }
    auto w = parse_int(args[0]);
    if (!w) { msg = "set displaywidth: width must be a number"; return false; }
    if (*w < MGRAM_MIN_DISPLAY_WIDTH) {
      msg = "set displaywidth: width must be >= " + std::to_string(MGRAM_MIN_DISPLAY_WIDTH);
      return false;
    }
    settings_.display_width = *w;
    msg = "displaywidth=" + std::to_string(*w);
    return true;
  });
  register_option("mouse", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) {
      settings_.mouse = !settings_.mouse;
    } else {
      auto v = parse_switch(args[0]);
      if (!v) { msg = "set mouse: use :set mouse on|off"; return false; }
      settings_.mouse = *v;
    }
    msg = settings_.mouse ? "mouse on" : "mouse off";
    return true;
  });
  register_option("color", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set color: use :set color on|off"; return false; }
    auto v = parse_switch(args[0]);
    if (!v) { msg = "set color: value must be on|off"; return false; }
    settings_.color = *v;
    msg = settings_.color ? "color on" : "color off";
    return true;
  });
  register_option("loglevel", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set loglevel: use :set loglevel trace|debug|info|warn|error|off"; return false; }
    std::string v = to_lower(args[0]);
    if (spdlog::level::from_str(v) == spdlog::level::off && v != "off") {
      msg = "set loglevel: unknown level";
      return false;
    }
    settings_.log_level = v;
    msg = "loglevel=" + v;
    return true;
  });
  register_option("logfile", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set logfile: use :set logfile <path>"; return false; }
    settings_.log_file = args[0];
    msg = "logfile=" + args[0];
    return true;
  });
  register_option("savedir", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set savedir: use :set savedir <path>"; return false; }
    settings_.save_dir = args[0];
    msg = "savedir=" + args[0];
    return true;
  });
}

bool Config::apply_line(const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set") { msg = "unknown command: " + cmd; return false; }
  if (args.empty()) { msg = "set: missing option name"; return false; }

  std::string name = args[0];
  std::vector<std::string> subargs;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
    name = name.substr(0, eq);
  }
  for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);

  auto it = options_.find(name);
  if (it == options_.end()) { msg = "unknown option: " + name; return false; }
  return it->second(subargs, msg);
}

bool Config::load_rc(const std::filesystem::path& path, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) return false;
  bool all_ok = true;
  std::string last_error;
  for (const auto& l : lines) {
    std::string m;
    if (!apply_line(l, m)) { all_ok = false; last_error = path.filename().string() + ": " + m; }
  }
  if (!all_ok) msg = last_error;
  return all_ok;
}

std::optional<std::filesystem::path> Config::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / MGRAM_RC_NAME;
}

std::filesystem::path Config::default_log_path() {
  const char* home = std::getenv("HOME");
  if (!home) return MGRAM_LOG_NAME;
  return std::filesystem::path(home) / ("." MGRAM_LOG_NAME);
}
