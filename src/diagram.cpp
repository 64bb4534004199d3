#include "diagram.hpp"
#include <algorithm>

const char* shape_name(ShapeType s) {
  switch (s) {
    case ShapeType::Box: return "Box";
    case ShapeType::Diamond: return "Diamond";
    case ShapeType::Text: return "Text";
    case ShapeType::Frame: return "Frame";
  }
  return "Box";
}

std::optional<ShapeType> shape_from_name(const std::string& s) {
  if (s == "Box") return ShapeType::Box;
  if (s == "Diamond") return ShapeType::Diamond;
  if (s == "Text") return ShapeType::Text;
  if (s == "Frame") return ShapeType::Frame;
  return std::nullopt;
}

static bool between(int v, int a, int b) { return v >= std::min(a, b) && v <= std::max(a, b); }

bool Route::passes(int x, int y) const {
  int m = mid();
  if (vertical_first) {
    if (x == from.x && between(y, from.y, m)) return true;
    if (y == m && between(x, from.x, to.x)) return true;
    if (x == to.x && between(y, m, to.y)) return true;
  } else {
    if (y == from.y && between(x, from.x, m)) return true;
    if (x == m && between(y, from.y, to.y)) return true;
    if (y == to.y && between(x, m, to.x)) return true;
  }
  return false;
}

bool Connection::contains(int x, int y, const std::vector<Node>& nodes) const {
  const Node* f = find_node(nodes, from_id);
  const Node* t = find_node(nodes, to_id);
  if (!f || !t) return false;
  Route r{{f->x + from_offset.x, f->y + from_offset.y},
          {t->x + to_offset.x, t->y + to_offset.y},
          vertical_first(*f, from_offset)};
  return r.passes(x, y);
}

Node make_node(int id, ShapeType shape, int x, int y) {
  Node n;
  n.id = id;
  n.shape = shape;
  n.x = std::max(0, x);
  n.y = std::max(0, y);
  switch (shape) {
    case ShapeType::Box: n.width = 20; n.height = 5; break;
    case ShapeType::Diamond: n.width = 15; n.height = 7; break;
    case ShapeType::Text: n.width = 10; n.height = 1; break;
    case ShapeType::Frame: n.width = 30; n.height = 10; break;
  }
  n.selected = true;
  return n;
}

int next_node_id(const std::vector<Node>& nodes) {
  int max_id = 0;
  for (const auto& n : nodes) max_id = std::max(max_id, n.id);
  return max_id + 1;
}

const Node* find_node(const std::vector<Node>& nodes, int id) {
  for (const auto& n : nodes) if (n.id == id) return &n;
  return nullptr;
}

Node* find_node(std::vector<Node>& nodes, int id) {
  for (auto& n : nodes) if (n.id == id) return &n;
  return nullptr;
}

std::optional<size_t> node_index(const std::vector<Node>& nodes, int id) {
  for (size_t i = 0; i < nodes.size(); ++i) if (nodes[i].id == id) return i;
  return std::nullopt;
}

const Node* topmost_node_at(const std::vector<Node>& nodes, int x, int y) {
  for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
    if (it->contains(x, y)) return &*it;
  }
  return nullptr;
}

std::optional<size_t> topmost_connection_at(const std::vector<Connection>& conns,
                                            const std::vector<Node>& nodes, int x, int y) {
  for (size_t i = conns.size(); i-- > 0;) {
    if (conns[i].contains(x, y, nodes)) return i;
  }
  return std::nullopt;
}

size_t remove_node(std::vector<Node>& nodes, std::vector<Connection>& conns, int id) {
  auto idx = node_index(nodes, id);
  if (!idx) return 0;
  nodes.erase(nodes.begin() + static_cast<long>(*idx));
  size_t before = conns.size();
  std::erase_if(conns, [id](const Connection& c) { return c.from_id == id || c.to_id == id; });
  return before - conns.size();
}

void raise_node(std::vector<Node>& nodes, int id) {
  auto idx = node_index(nodes, id);
  if (!idx) return;
  Node n = std::move(nodes[*idx]);
  nodes.erase(nodes.begin() + static_cast<long>(*idx));
  nodes.push_back(std::move(n));
}

void fit_text_node(Node& n) {
  if (n.shape != ShapeType::Text) return;
  int longest = 0;
  int lines = 1;
  int cur = 0;
  for (char c : n.text) {
    if (c == '\n') { longest = std::max(longest, cur); cur = 0; lines++; }
    else cur++;
  }
  longest = std::max(longest, cur);
  n.width = std::max(kMinNodeWidth, longest);
  n.height = std::max(kMinNodeHeight, lines);
}

void resize_node(Node& n, int dw, int dh) {
  n.width = std::max(kMinNodeWidth, n.width + dw);
  n.height = std::max(kMinNodeHeight, n.height + dh);
}

bool vertical_first(const Node& from, Point from_offset) {
  return from_offset.y == 0 || from_offset.y == from.height - 1;
}

Point anchor_offset(const Node& n, Side side) {
  switch (side) {
    case Side::Top: return {n.width / 2, 0};
    case Side::Bottom: return {n.width / 2, n.height - 1};
    case Side::Left: return {0, n.height / 2};
    case Side::Right: return {n.width - 1, n.height / 2};
  }
  return {0, 0};
}

std::optional<Side> anchor_side(const Node& n, Point offset) {
  if (offset.y == 0) return Side::Top;
  if (offset.y == n.height - 1) return Side::Bottom;
  if (offset.x == 0) return Side::Left;
  if (offset.x == n.width - 1) return Side::Right;
  return std::nullopt;
}

AnchorPair heuristic_anchors(const Node& src, const Node& dst) {
  if (dst.y >= src.y + src.height) return {anchor_offset(src, Side::Bottom), anchor_offset(dst, Side::Top)};
  if (dst.x >= src.x + src.width) return {anchor_offset(src, Side::Right), anchor_offset(dst, Side::Left)};
  if (src.y >= dst.y + dst.height) return {anchor_offset(src, Side::Top), anchor_offset(dst, Side::Bottom)};
  return {anchor_offset(src, Side::Left), anchor_offset(dst, Side::Right)};
}

Point snap_border_anchor(const Node& n, Point local) {
  if (local.y == 0) return anchor_offset(n, Side::Top);
  if (local.y == n.height - 1) return anchor_offset(n, Side::Bottom);
  if (local.x == 0) return anchor_offset(n, Side::Left);
  return anchor_offset(n, Side::Right);
}

Point nearest_edge_anchor(const Node& n, int x, int y) {
  int d_left = std::max(0, x - n.x);
  int d_right = std::max(0, n.x + n.width - 1 - x);
  int d_top = std::max(0, y - n.y);
  int d_bottom = std::max(0, n.y + n.height - 1 - y);
  int d = std::min({d_left, d_right, d_top, d_bottom});
  if (d == d_top) return anchor_offset(n, Side::Top);
  if (d == d_bottom) return anchor_offset(n, Side::Bottom);
  if (d == d_left) return anchor_offset(n, Side::Left);
  return anchor_offset(n, Side::Right);
}
