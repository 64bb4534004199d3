#include "canvas.hpp"
#include <algorithm>
#include <cstdlib>
#include "text_wrap.hpp"

Canvas::Canvas(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)),
      grid_(static_cast<size_t>(height_), std::string(static_cast<size_t>(width_), ' ')) {}

void Canvas::set(int x, int y, char c) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  grid_[static_cast<size_t>(y)][static_cast<size_t>(x)] = c;
}

char Canvas::at(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return ' ';
  return grid_[static_cast<size_t>(y)][static_cast<size_t>(x)];
}

std::string Canvas::to_string() const {
  std::string out;
  out.reserve(static_cast<size_t>((width_ + 1) * height_));
  for (const auto& r : grid_) { out += r; out += '\n'; }
  return out;
}

void Canvas::draw_outline(const Node& n) {
  int x1 = n.x, y1 = n.y;
  int x2 = x1 + n.width - 1, y2 = y1 + n.height - 1;
  char corner = n.selected ? '#' : '+';
  char horiz = n.selected ? '=' : '-';
  char vert = n.selected ? '#' : '|';
  set(x1, y1, corner); set(x2, y1, corner);
  set(x1, y2, corner); set(x2, y2, corner);
  for (int x = x1 + 1; x < x2; ++x) { set(x, y1, horiz); set(x, y2, horiz); }
  for (int y = y1 + 1; y < y2; ++y) { set(x1, y, vert); set(x2, y, vert); }
}

void Canvas::draw_box(const Node& n) {
  draw_outline(n);
  int x1 = n.x, y1 = n.y;
  int x2 = x1 + n.width - 1, y2 = y1 + n.height - 1;
  int aw = std::max(0, n.width - 2);
  int ah = std::max(0, n.height - 2);
  if (aw == 0 || ah == 0) return;
  auto lines = wrap_text(n.text, aw);
  int total = static_cast<int>(lines.size());
  int start_y = y1 + 1 + std::max(0, ah - total) / 2;
  for (int i = 0; i < std::min(total, ah); ++i) {
    int ty = start_y + i;
    if (ty <= y1 || ty >= y2) continue;
    const auto& line = lines[static_cast<size_t>(i)];
    int tx0 = x1 + 1 + std::max(0, aw - static_cast<int>(line.size())) / 2;
    for (size_t j = 0; j < line.size(); ++j) {
      int tx = tx0 + static_cast<int>(j);
      if (tx > x1 && tx < x2) set(tx, ty, line[j]);
    }
  }
}

void Canvas::draw_frame(const Node& n) {
  draw_outline(n);
  std::string title = frame_title(n);
  if (title.empty()) return;
  set(n.x + 1, n.y, ' ');
  for (size_t j = 0; j < title.size(); ++j) set(n.x + 2 + static_cast<int>(j), n.y, title[j]);
  set(n.x + 2 + static_cast<int>(title.size()), n.y, ' ');
}

void Canvas::draw_diamond(const Node& n) {
  int x1 = n.x, y1 = n.y;
  int x2 = n.x + n.width - 1, y2 = n.y + n.height - 1;
  int cx = x1 + n.width / 2;
  int cy = y1 + n.height / 2;
  char point = n.selected ? '#' : '+';
  char rising = n.selected ? '#' : '/';
  char falling = n.selected ? '#' : '\\';

  draw_line(cx, y1, x2, cy, rising);
  draw_line(x2, cy, cx, y2, falling);
  draw_line(cx, y2, x1, cy, rising);
  draw_line(x1, cy, cx, y1, falling);

  set(cx, y1, point); set(cx, y2, point);
  set(x1, cy, point); set(x2, cy, point);

  int aw = text_area_width(n);
  int ah = std::max(1, n.height - 2);
  auto lines = wrap_text(n.text, aw);
  int total = static_cast<int>(lines.size());
  int start_y = y1 + 1 + std::max(0, ah - total) / 2;
  for (int i = 0; i < std::min(total, ah); ++i) {
    int ty = start_y + i;
    const auto& line = lines[static_cast<size_t>(i)];
    int tx0 = x1 + std::max(0, n.width - static_cast<int>(line.size())) / 2;
    for (size_t j = 0; j < line.size(); ++j) {
      int tx = tx0 + static_cast<int>(j);
      if (ty > y1 && ty < y2 && tx > x1 + 1 && tx < x2 - 1) set(tx, ty, line[j]);
    }
  }
}

void Canvas::draw_text_node(const Node& n) {
  auto lines = wrap_text(n.text, n.width);
  int total = static_cast<int>(lines.size());
  int start_y = n.y + std::max(0, n.height - total) / 2;
  for (int i = 0; i < std::min(total, n.height); ++i) {
    const auto& line = lines[static_cast<size_t>(i)];
    int tx0 = n.x + std::max(0, n.width - static_cast<int>(line.size())) / 2;
    for (size_t j = 0; j < line.size(); ++j) set(tx0 + static_cast<int>(j), start_y + i, line[j]);
  }
  if (n.selected) {
    set(std::max(0, n.x - 1), n.y, '[');
    set(n.x + n.width, n.y + n.height - 1, ']');
  }
}

// Bresenham; both end points are left for the caller to mark.
void Canvas::draw_line(int x1, int y1, int x2, int y2, char c) {
  int dx = std::abs(x2 - x1);
  int dy = std::abs(y2 - y1);
  int sx = x1 < x2 ? 1 : -1;
  int sy = y1 < y2 ? 1 : -1;
  int err = dx - dy;
  int x = x1, y = y1;
  while (true) {
    if ((x != x1 || y != y1) && (x != x2 || y != y2)) set(x, y, c);
    if (x == x2 && y == y2) break;
    int e2 = 2 * err;
    if (e2 > -dy) { err -= dy; x += sx; }
    if (e2 < dx) { err += dx; y += sy; }
  }
}

void Canvas::draw_connection(const std::vector<Node>& nodes, const Connection& c, bool highlighted) {
  const Node* f = find_node(nodes, c.from_id);
  const Node* t = find_node(nodes, c.to_id);
  if (!f || !t) return;
  Route r{{f->x + c.from_offset.x, f->y + c.from_offset.y},
          {t->x + c.to_offset.x, t->y + c.to_offset.y},
          vertical_first(*f, c.from_offset)};
  if (c.has_arrow) {
    if (auto side = anchor_side(*t, c.to_offset)) {
      switch (*side) {
        case Side::Top: r.to.y = std::max(0, r.to.y - 1); break;
        case Side::Bottom: r.to.y += 1; break;
        case Side::Left: r.to.x = std::max(0, r.to.x - 1); break;
        case Side::Right: r.to.x += 1; break;
      }
    }
  }
  draw_route(r, c.has_arrow, highlighted);
}

void Canvas::draw_partial_connection(const Node& from, Point offset, Point target) {
  Route r{{from.x + offset.x, from.y + offset.y}, target, vertical_first(from, offset)};
  draw_route(r, true, true);
}

void Canvas::draw_route(const Route& r, bool arrow, bool highlighted) {
  char horiz = highlighted ? '=' : '-';
  char vert = highlighted ? '#' : '|';
  char join = highlighted ? '#' : '+';
  char end = highlighted ? '@' : 'o';
  int x1 = r.from.x, y1 = r.from.y, x2 = r.to.x, y2 = r.to.y;
  int m = r.mid();

  if (r.vertical_first) {
    for (int y = std::min(y1, m); y <= std::max(y1, m); ++y) set(x1, y, vert);
    for (int x = std::min(x1, x2); x <= std::max(x1, x2); ++x) set(x, m, horiz);
    for (int y = std::min(m, y2); y <= std::max(m, y2); ++y) set(x2, y, vert);
    if (x1 != x2) { set(x1, m, join); set(x2, m, join); }
  } else {
    for (int x = std::min(x1, m); x <= std::max(x1, m); ++x) set(x, y1, horiz);
    for (int y = std::min(y1, y2); y <= std::max(y1, y2); ++y) set(m, y, vert);
    for (int x = std::min(m, x2); x <= std::max(m, x2); ++x) set(x, y2, horiz);
    if (y1 != y2) { set(m, y1, join); set(m, y2, join); }
  }

  set(x1, y1, end);
  if (!arrow) { set(x2, y2, end); return; }
  char head;
  if (r.vertical_first) {
    if (y2 != m) head = y1 < y2 ? 'v' : '^';
    else head = x1 < x2 ? '>' : '<';
  } else {
    if (x2 != m) head = x1 < x2 ? '>' : '<';
    else head = y1 < y2 ? 'v' : '^';
  }
  set(x2, y2, head);
}

int text_area_width(const Node& n) {
  switch (n.shape) {
    case ShapeType::Box: return std::max(0, n.width - 2);
    case ShapeType::Diamond: return std::max(1, n.width - 6);
    case ShapeType::Text: return n.width;
    case ShapeType::Frame: return std::max(0, n.width - 4);
  }
  return n.width;
}

std::string frame_title(const Node& n) {
  std::string title = n.text.substr(0, n.text.find('\n'));
  size_t avail = static_cast<size_t>(std::max(0, n.width - 4));
  if (title.size() > avail) title.resize(avail);
  return title;
}

Point text_caret(const Node& n) {
  if (n.shape == ShapeType::Frame) {
    return {n.x + 2 + static_cast<int>(frame_title(n).size()), n.y};
  }
  auto lines = wrap_text(n.text, text_area_width(n));
  if (lines.empty()) lines.emplace_back();
  int total = static_cast<int>(lines.size());
  int start_y = n.y;
  if (n.shape != ShapeType::Text) {
    int ah = std::max(1, n.height - 2);
    start_y = n.y + 1 + std::max(0, ah - total) / 2;
  }
  const auto& last = lines.back();
  int len = static_cast<int>(last.size());
  int tx0 = n.x + std::max(0, n.width - len) / 2;
  return {tx0 + len, start_y + total - 1};
}

Canvas render_diagram(const EditorState& st, int width, int height) {
  Canvas canvas(width, height);

  std::vector<Node> nodes = st.nodes;
  for (auto& n : nodes) {
    n.x = std::max(0, n.x - st.camera.x);
    n.y = std::max(0, n.y - st.camera.y);
  }

  for (const auto& n : nodes) {
    switch (n.shape) {
      case ShapeType::Box: canvas.draw_box(n); break;
      case ShapeType::Diamond: canvas.draw_diamond(n); break;
      case ShapeType::Text: canvas.draw_text_node(n); break;
      case ShapeType::Frame: canvas.draw_frame(n); break;
    }
  }

  for (size_t i = 0; i < st.connections.size(); ++i) {
    canvas.draw_connection(nodes, st.connections[i], st.selected_connection == i);
  }

  if (st.partial) {
    if (const Node* from = find_node(nodes, st.partial->from_id)) {
      Point target{std::max(0, st.partial->current_pos.x - st.camera.x),
                   std::max(0, st.partial->current_pos.y - st.camera.y)};
      canvas.draw_partial_connection(*from, st.partial->from_offset, target);
    }
  }
  return canvas;
}
