#include "diagram_file.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "file_io.hpp"

using nlohmann::json;

static json offset_to_json(Point p) { return json::array({p.x, p.y}); }

// Integer that fits an int without narrowing.
static bool is_int(const json& v) {
  if (v.is_number_unsigned()) {
    return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
  }
  if (!v.is_number_integer()) return false;
  std::int64_t i = v.get<std::int64_t>();
  return i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max();
}

static std::optional<Point> offset_from_json(const json& j) {
  if (!j.is_array() || j.size() != 2 || !is_int(j[0]) || !is_int(j[1])) return std::nullopt;
  return Point{j[0].get<int>(), j[1].get<int>()};
}

static bool has_int(const json& j, const char* key) {
  return j.contains(key) && is_int(j[key]);
}

std::string diagram_to_json(const Diagram& d) {
  json nodes = json::array();
  for (const auto& n : d.nodes) {
    nodes.push_back(json{
      {"id", n.id},
      {"shape", shape_name(n.shape)},
      {"x", n.x},
      {"y", n.y},
      {"width", n.width},
      {"height", n.height},
      {"text", n.text},
      {"selected", n.selected},
    });
  }
  json conns = json::array();
  for (const auto& c : d.connections) {
    conns.push_back(json{
      {"from_id", c.from_id},
      {"from_offset", offset_to_json(c.from_offset)},
      {"to_id", c.to_id},
      {"to_offset", offset_to_json(c.to_offset)},
      {"has_arrow", c.has_arrow},
    });
  }
  json j = {{"title", d.title}, {"nodes", nodes}, {"connections", conns}};
  return j.dump(2);
}

static std::optional<Diagram> parse_diagram(const json& j, std::string& msg) {
  if (!j.is_object()) { msg = "document is not an object"; return std::nullopt; }
  if (!j.contains("title") || !j["title"].is_string()) { msg = "missing title"; return std::nullopt; }
  if (!j.contains("nodes") || !j["nodes"].is_array()) { msg = "missing nodes"; return std::nullopt; }
  if (!j.contains("connections") || !j["connections"].is_array()) { msg = "missing connections"; return std::nullopt; }

  Diagram d;
  d.title = j["title"].get<std::string>();
  std::unordered_set<int> seen_ids;
  for (const auto& n : j["nodes"]) {
    if (!n.is_object()) { msg = "node is not an object"; return std::nullopt; }
    for (const char* k : {"id", "x", "y", "width", "height"}) {
      if (!has_int(n, k)) { msg = std::string("node field '") + k + "' missing or not an integer"; return std::nullopt; }
    }
    if (!n.contains("shape") || !n["shape"].is_string()) { msg = "node shape missing"; return std::nullopt; }
    auto shape = shape_from_name(n["shape"].get<std::string>());
    if (!shape) { msg = "unknown shape: " + n["shape"].get<std::string>(); return std::nullopt; }
    Node node;
    node.id = n["id"].get<int>();
    if (!seen_ids.insert(node.id).second) {
      msg = "duplicate node id: " + std::to_string(node.id); return std::nullopt;
    }
    node.shape = *shape;
    node.x = std::max(0, n["x"].get<int>());
    node.y = std::max(0, n["y"].get<int>());
    node.width = std::max(kMinNodeWidth, n["width"].get<int>());
    node.height = std::max(kMinNodeHeight, n["height"].get<int>());
    node.text = n.contains("text") && n["text"].is_string() ? n["text"].get<std::string>() : "";
    node.selected = n.contains("selected") && n["selected"].is_boolean() ? n["selected"].get<bool>() : false;
    d.nodes.push_back(std::move(node));
  }
  for (const auto& c : j["connections"]) {
    if (!c.is_object() || !has_int(c, "from_id") || !has_int(c, "to_id")) {
      msg = "connection endpoints missing"; return std::nullopt;
    }
    auto from = c.contains("from_offset") ? offset_from_json(c["from_offset"]) : std::nullopt;
    auto to = c.contains("to_offset") ? offset_from_json(c["to_offset"]) : std::nullopt;
    if (!from || !to) { msg = "connection offsets must be [x, y]"; return std::nullopt; }
    Connection conn;
    conn.from_id = c["from_id"].get<int>();
    conn.from_offset = *from;
    conn.to_id = c["to_id"].get<int>();
    conn.to_offset = *to;
    conn.has_arrow = c.contains("has_arrow") && c["has_arrow"].is_boolean() ? c["has_arrow"].get<bool>() : false;
    d.connections.push_back(conn);
  }
  return d;
}

std::optional<Diagram> diagram_from_json(const std::string& text, std::string& msg) {
  try {
    return parse_diagram(json::parse(text), msg);
  } catch (const json::exception& e) {
    msg = e.what();
    return std::nullopt;
  }
}

std::optional<Diagram> load_diagram_file(const std::filesystem::path& path, std::string& msg) {
  std::string data;
  if (!read_file(path, data, msg)) return std::nullopt;
  std::string why;
  auto d = diagram_from_json(data, why);
  if (!d) { msg = "parse " + path.string() + ": " + why; return std::nullopt; }
  msg = "opened file: " + path.string();
  return d;
}

bool save_diagram_file(const std::filesystem::path& path, const Diagram& d, std::string& msg) {
  return write_file_atomic(path, diagram_to_json(d), msg);
}

std::filesystem::path diagram_json_path(const std::filesystem::path& dir, const std::string& title) {
  return dir / (title + ".json");
}

std::filesystem::path diagram_text_path(const std::filesystem::path& dir, const std::string& title) {
  return dir / (title + ".txt");
}

bool open_or_create(const std::string& title, const std::filesystem::path& dir, Diagram& out, std::string& msg) {
  auto path = diagram_json_path(dir, title);
  out = Diagram{title, {}, {}};
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    msg = "File " + path.string() + " not found. Starting new instead.";
    return false;
  }
  std::string why;
  auto d = load_diagram_file(path, why);
  if (!d) {
    spdlog::warn("load {} failed: {}", path.string(), why);
    msg = "Failed to parse " + path.string() + ". Starting new instead.";
    return false;
  }
  out = std::move(*d);
  msg = why;
  return true;
}
