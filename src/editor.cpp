#include "editor.hpp"
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>
#include "canvas.hpp"
#include "context_menu.hpp"

static std::string first_word(const std::string& text) {
  std::istringstream iss(text);
  std::string w;
  if (iss >> w) return w;
  return "Node";
}

static std::optional<ShapeType> leader_shape(char c) {
  switch (c) {
    case 'n': return ShapeType::Box;
    case 'd': return ShapeType::Diamond;
    case 't': return ShapeType::Text;
    case 'f': return ShapeType::Frame;
    default: return std::nullopt;
  }
}

Editor::Editor(EditorState state, IWorkspace& workspace, const Settings& settings)
    : st_(std::move(state)), workspace_(workspace), export_width_(settings.export_width) {}

void Editor::set_viewport(int cols, int rows) {
  view_cols_ = std::max(0, cols);
  view_rows_ = std::max(0, rows);
}

void Editor::set_mode(Mode m) {
  if (m.index() != st_.mode.index()) spdlog::debug("mode {} -> {}", mode_name(st_.mode), mode_name(m));
  st_.mode = m;
}

Point Editor::to_world(int col, int row) const {
  return {std::max(0, col + st_.camera.x), std::max(0, row + st_.camera.y)};
}

std::string Editor::export_text() const {
  return render_diagram(st_, export_width_, view_rows_).to_string();
}

void Editor::handle_event(const InputEvent& ev) {
  std::visit(Overloaded{
    [this](const KeyEvent& k) { handle_key(k); },
    [this](const MouseEvent& me) { handle_mouse(me); },
  }, ev);
}

void Editor::handle_key(const KeyEvent& k) {
  Mode current = st_.mode;
  std::visit(Overloaded{
    [&](const NormalMode&) { handle_normal_key(k); },
    [&](const InsertMode& m) { handle_insert_key(m.node_id, k); },
    [&](const LeaderMode&) { handle_leader_key(k); },
    [&](const ResizeMode& m) { handle_resize_key(m.node_id, k); },
    [&](const HelpMode&) { handle_help_key(k); },
    [&](const ContextMenuMode& m) { handle_menu_key(m, k); },
  }, current);
}

void Editor::handle_normal_key(const KeyEvent& k) {
  switch (k.key) {
    case Key::Esc:
      st_.connection_source_id.reset();
      st_.selected_connection.reset();
      st_.clear_node_selection();
      message_ = "Selection cleared";
      return;
    case Key::Tab: cycle_selection(true); return;
    case Key::BackTab: cycle_selection(false); return;
    case Key::Delete:
    case Key::Backspace:
      if (st_.selected_connection) {
        delete_connection(*st_.selected_connection);
        message_ = "Connection deleted";
      } else if (const Node* n = st_.selected_node()) {
        delete_node(n->id);
        message_ = "Shape and connections deleted";
      }
      return;
    case Key::Enter: commit_keyboard_connection(); return;
    case Key::Up: case Key::Down: case Key::Left: case Key::Right: move_or_pan(k.key); return;
    case Key::Char: break;
  }

  switch (k.ch) {
    case ' ': set_mode(LeaderMode{}); break;
    case 'q': should_quit_ = true; break;
    case 'i':
      if (const Node* n = st_.selected_node()) set_mode(InsertMode{n->id});
      break;
    case 'r':
      if (const Node* n = st_.selected_node()) {
        set_mode(ResizeMode{n->id});
        message_ = "Resize Mode: Use +/- to scale, Esc to finish";
      }
      break;
    case 'c':
      if (const Node* n = st_.selected_node()) arm_connector(*n, false);
      break;
    case 'a':
      if (st_.selected_connection) {
        Connection& c = st_.connections[*st_.selected_connection];
        c.has_arrow = !c.has_arrow;
        message_ = c.has_arrow ? "Arrow enabled" : "Arrow disabled";
      } else if (const Node* n = st_.selected_node()) {
        arm_connector(*n, true);
      } else {
        message_ = "Select a node (a) for Arrow or connection (a) to toggle";
      }
      break;
    default: break;
  }
}

void Editor::handle_insert_key(int id, const KeyEvent& k) {
  Node* n = find_node(st_.nodes, id);
  if (!n) { set_mode(NormalMode{}); return; }
  switch (k.key) {
    case Key::Esc:
      set_mode(NormalMode{});
      st_.clear_node_selection();
      return;
    case Key::Tab: {
      set_mode(NormalMode{});
      auto idx = node_index(st_.nodes, id);
      select_index(idx ? (*idx + 1) % st_.nodes.size() : 0);
      return;
    }
    case Key::Char: n->text.push_back(k.ch); break;
    case Key::Backspace: if (!n->text.empty()) n->text.pop_back(); break;
    case Key::Enter: n->text.push_back('\n'); break;
    default: return;
  }
  fit_text_node(*n);
}

void Editor::handle_leader_key(const KeyEvent& k) {
  if (k.key == Key::Esc) { set_mode(NormalMode{}); return; }
  if (k.key != Key::Char) return;
  if (auto shape = leader_shape(k.ch)) {
    spawn_below_last(*shape);
    message_ = "New shape created below previous";
    return;
  }
  switch (k.ch) {
    case 'h': set_mode(HelpMode{}); break;
    case 'w': write_artifacts(); set_mode(NormalMode{}); break;
    case 'c': copy_to_clipboard(); set_mode(NormalMode{}); break;
    case 'q': should_quit_ = true; break;
    default: break;
  }
}

void Editor::handle_resize_key(int id, const KeyEvent& k) {
  Node* n = find_node(st_.nodes, id);
  if (!n) { set_mode(NormalMode{}); return; }
  if (k.key == Key::Esc || k.key == Key::Enter) {
    set_mode(NormalMode{});
    message_ = "Resize finished";
    return;
  }
  if (k.key != Key::Char) return;
  if (k.ch == '+' || k.ch == '=') resize_node(*n, 2, 1);
  else if (k.ch == '-' || k.ch == '_') resize_node(*n, -2, -1);
  else return;
  message_ = "Resized: " + std::to_string(n->width) + "x" + std::to_string(n->height);
}

void Editor::handle_help_key(const KeyEvent& k) {
  if (k.key == Key::Esc || k.key == Key::Enter || (k.key == Key::Char && k.ch == ' ')) set_mode(NormalMode{});
}

void Editor::handle_menu_key(ContextMenuMode m, const KeyEvent& k) {
  switch (k.key) {
    case Key::Up:
      if (m.selected_index > 0) {
        m.selected_index--;
        if (menu_is_separator(m.selected_index)) m.selected_index--;
        set_mode(m);
      }
      break;
    case Key::Down:
      if (m.selected_index < kMenuItemCount - 1) {
        m.selected_index++;
        if (menu_is_separator(m.selected_index)) m.selected_index++;
        set_mode(m);
      }
      break;
    case Key::Enter: activate_menu_item(m, m.selected_index); break;
    case Key::Char: if (k.ch == ' ') activate_menu_item(m, m.selected_index); break;
    case Key::Esc: set_mode(NormalMode{}); break;
    default: break;
  }
}

void Editor::activate_menu_item(const ContextMenuMode& m, int index) {
  if (index < 0 || index >= kMenuItemCount) { set_mode(NormalMode{}); return; }
  Point world = to_world(m.x, m.y);
  switch (kMenuItems[static_cast<size_t>(index)].action) {
    case MenuAction::NewBox: spawn_node(ShapeType::Box, world); return;
    case MenuAction::NewDiamond: spawn_node(ShapeType::Diamond, world); return;
    case MenuAction::NewText: spawn_node(ShapeType::Text, world); return;
    case MenuAction::NewFrame: spawn_node(ShapeType::Frame, world); return;
    case MenuAction::StartConnector:
    case MenuAction::StartArrow:
      if (const Node* n = topmost_node_at(st_.nodes, world.x, world.y)) {
        arm_connector(*n, kMenuItems[static_cast<size_t>(index)].action == MenuAction::StartArrow);
      } else {
        message_ = "No node at click position";
      }
      break;
    case MenuAction::Delete:
      if (const Node* n = topmost_node_at(st_.nodes, world.x, world.y)) {
        delete_node(n->id);
        message_ = "Shape and connections deleted";
      } else if (auto ci = topmost_connection_at(st_.connections, st_.nodes, world.x, world.y)) {
        delete_connection(*ci);
        message_ = "Connection deleted";
      }
      break;
    case MenuAction::Separator:
    case MenuAction::Cancel:
      break;
  }
  set_mode(NormalMode{});
}

void Editor::handle_mouse(const MouseEvent& me) {
  if (std::holds_alternative<HelpMode>(st_.mode)) return;
  if (const auto* menu = std::get_if<ContextMenuMode>(&st_.mode)) {
    if (handle_menu_mouse(*menu, me)) return;
  }
  if (me.action == MouseAction::Down && me.button == MouseButton::Right) {
    set_mode(ContextMenuMode{me.col, me.row, 0});
    return;
  }
  Point world = to_world(me.col, me.row);
  switch (me.action) {
    case MouseAction::Down: if (me.button == MouseButton::Left) mouse_down(world); break;
    case MouseAction::Drag: mouse_drag(world); break;
    case MouseAction::Up: mouse_up(world); break;
    case MouseAction::Move: break;
  }
}

// True when the event was consumed by the open menu.
bool Editor::handle_menu_mouse(const ContextMenuMode& m, const MouseEvent& me) {
  MenuRect r = menu_rect(m, view_cols_, view_rows_);
  bool inside = me.col >= r.x && me.col < r.x + r.width && me.row >= r.y && me.row < r.y + r.height;
  bool left_down = me.action == MouseAction::Down && me.button == MouseButton::Left;
  bool right_down = me.action == MouseAction::Down && me.button == MouseButton::Right;
  if (!inside) {
    if (left_down) { set_mode(NormalMode{}); return true; }
    return !right_down;
  }
  int item = me.row - r.y - 1;
  if (item >= 0 && item < kMenuItemCount && !menu_is_separator(item)) {
    ContextMenuMode hovered{m.x, m.y, item};
    set_mode(hovered);
    if (left_down) { activate_menu_item(hovered, item); return true; }
  }
  return !right_down;
}

void Editor::clear_transient() {
  st_.dragging_node_id.reset();
  st_.resizing_node_id.reset();
  st_.partial.reset();
}

void Editor::mouse_down(Point world) {
  clear_transient();
  const Node* hit = topmost_node_at(st_.nodes, world.x, world.y);
  if (!hit) {
    set_mode(NormalMode{});
    st_.selected_connection.reset();
    st_.clear_node_selection();
    if (auto ci = topmost_connection_at(st_.connections, st_.nodes, world.x, world.y)) {
      st_.selected_connection = *ci;
      message_ = "Connection selected | 'a': Arrow | 'Del': Remove";
    }
    return;
  }
  int id = hit->id;
  Point local{world.x - hit->x, world.y - hit->y};
  bool right_col = local.x == hit->width - 1;
  bool bottom_row = local.y == hit->height - 1;
  if (right_col && bottom_row) {
    st_.resizing_node_id = id;
  } else if (local.x == 0 || right_col || local.y == 0 || bottom_row) {
    st_.partial = PartialConnection{id, snap_border_anchor(*hit, local), world};
  } else {
    st_.dragging_node_id = id;
    st_.drag_offset = local;
    st_.select_only(id);
    st_.selected_connection.reset();
    raise_node(st_.nodes, id);
  }
}

void Editor::mouse_drag(Point world) {
  if (st_.partial) {
    st_.partial->current_pos = world;
  } else if (st_.resizing_node_id) {
    if (Node* n = find_node(st_.nodes, *st_.resizing_node_id)) {
      n->width = std::max(3, world.x - n->x + 1);
      n->height = std::max(3, world.y - n->y + 1);
    }
  } else if (st_.dragging_node_id) {
    if (Node* n = find_node(st_.nodes, *st_.dragging_node_id)) {
      int lo_x = std::max(0, st_.camera.x);
      int lo_y = std::max(0, st_.camera.y);
      int hi_x = std::max(lo_x, st_.camera.x + view_cols_ - n->width);
      int hi_y = std::max(lo_y, st_.camera.y + view_rows_ - n->height);
      n->x = std::clamp(world.x - st_.drag_offset.x, lo_x, hi_x);
      n->y = std::clamp(world.y - st_.drag_offset.y, lo_y, hi_y);
    }
  }
}

void Editor::mouse_up(Point world) {
  if (st_.partial) {
    const PartialConnection pc = *st_.partial;
    for (auto it = st_.nodes.rbegin(); it != st_.nodes.rend(); ++it) {
      if (it->id == pc.from_id || !it->contains(world.x, world.y)) continue;
      st_.connections.push_back(Connection{pc.from_id, pc.from_offset, it->id,
                                           nearest_edge_anchor(*it, world.x, world.y), true});
      spdlog::debug("connection {} -> {} created by drag", pc.from_id, it->id);
      message_ = "Connection created";
      break;
    }
  } else if (st_.dragging_node_id) {
    if (find_node(st_.nodes, *st_.dragging_node_id)) set_mode(InsertMode{*st_.dragging_node_id});
  }
  clear_transient();
}

void Editor::spawn_node(ShapeType shape, Point world) {
  int id = next_node_id(st_.nodes);
  st_.nodes.push_back(make_node(id, shape, world.x, world.y));
  st_.select_only(id);
  st_.selected_connection.reset();
  spdlog::debug("node {} ({}) created at {},{}", id, shape_name(shape), world.x, world.y);
  set_mode(InsertMode{id});
}

void Editor::spawn_below_last(ShapeType shape) {
  Point at{10, 10};
  if (!st_.nodes.empty()) {
    const Node& last = st_.nodes.back();
    at = {last.x, last.y + last.height + 2};
  }
  spawn_node(shape, at);
}

void Editor::delete_node(int id) {
  size_t dropped = remove_node(st_.nodes, st_.connections, id);
  if (st_.connection_source_id == id) st_.connection_source_id.reset();
  if (st_.dragging_node_id == id || st_.resizing_node_id == id || (st_.partial && st_.partial->from_id == id)) clear_transient();
  st_.selected_connection.reset();
  spdlog::debug("node {} deleted with {} connection(s)", id, dropped);
}

void Editor::delete_connection(size_t idx) {
  if (idx >= st_.connections.size()) { st_.selected_connection.reset(); return; }
  st_.connections.erase(st_.connections.begin() + static_cast<long>(idx));
  st_.selected_connection.reset();
  spdlog::debug("connection #{} deleted", idx);
}

void Editor::arm_connector(const Node& source, bool arrow) {
  st_.connection_source_id = source.id;
  st_.connection_has_arrow = arrow;
  message_ = std::string(arrow ? "Arrow source: " : "Connector source: ") + first_word(source.text) +
             ". Tab to target, Enter to finish.";
}

void Editor::commit_keyboard_connection() {
  if (!st_.connection_source_id) return;
  int src_id = *st_.connection_source_id;
  const Node* target = st_.selected_node();
  if (!target || target->id == src_id) return;
  const Node* src = find_node(st_.nodes, src_id);
  if (!src) { st_.connection_source_id.reset(); return; }
  AnchorPair a = heuristic_anchors(*src, *target);
  st_.connections.push_back(Connection{src_id, a.from_offset, target->id, a.to_offset, st_.connection_has_arrow});
  spdlog::debug("connection {} -> {} created from keyboard", src_id, target->id);
  st_.connection_source_id.reset();
  message_ = "Keyboard connection created!";
}

void Editor::select_index(size_t idx) {
  if (st_.nodes.empty()) return;
  for (size_t i = 0; i < st_.nodes.size(); ++i) st_.nodes[i].selected = (i == idx);
  st_.selected_connection.reset();
}

void Editor::cycle_selection(bool forward) {
  if (st_.nodes.empty()) return;
  size_t count = st_.nodes.size();
  std::optional<size_t> cur;
  for (size_t i = 0; i < count; ++i) if (st_.nodes[i].selected) { cur = i; break; }
  size_t next;
  if (forward) next = cur ? (*cur + 1) % count : 0;
  else next = cur ? (*cur + count - 1) % count : count - 1;
  select_index(next);
}

void Editor::move_or_pan(Key k) {
  if (Node* n = st_.selected_node()) {
    switch (k) {
      case Key::Up: n->y = std::max(0, n->y - 1); break;
      case Key::Down: n->y += 1; break;
      case Key::Left: n->x = std::max(0, n->x - 1); break;
      case Key::Right: n->x += 1; break;
      default: break;
    }
    return;
  }
  switch (k) {
    case Key::Up: st_.camera.y -= 1; break;
    case Key::Down: st_.camera.y += 1; break;
    case Key::Left: st_.camera.x -= 1; break;
    case Key::Right: st_.camera.x += 1; break;
    default: break;
  }
  message_ = "Canvas Pan: " + std::to_string(st_.camera.x) + ", " + std::to_string(st_.camera.y);
}

void Editor::write_artifacts() {
  std::string msg;
  if (!workspace_.save(st_.to_diagram(), export_text(), msg)) spdlog::warn("save failed: {}", msg);
  message_ = msg;
}

void Editor::copy_to_clipboard() {
  std::string msg;
  if (!workspace_.copy_text(export_text(), msg)) spdlog::warn("clipboard failed: {}", msg);
  message_ = msg;
}
