#include "context_menu.hpp"
#include "editor.hpp"
#include "fake_workspace.hpp"
#include <cassert>

static MouseEvent down(int col, int row, MouseButton b = MouseButton::Left) {
  return {MouseAction::Down, b, col, row};
}
static MouseEvent drag(int col, int row) { return {MouseAction::Drag, MouseButton::Left, col, row}; }
static MouseEvent up(int col, int row) { return {MouseAction::Up, MouseButton::Left, col, row}; }
static MouseEvent hover(int col, int row) { return {MouseAction::Move, MouseButton::None, col, row}; }

static EditorState side_by_side() {
  EditorState st;
  st.nodes.push_back(make_test_node(1, ShapeType::Box, 2, 2, 10, 4));
  st.nodes.push_back(make_test_node(2, ShapeType::Box, 20, 2, 10, 4));
  return st;
}

static void test_drag_body() {
  FakeWorkspace ws;
  Editor ed(side_by_side(), ws, Settings{});
  ed.set_viewport(77, 20);
  ed.handle_mouse(down(5, 3));
  assert(ed.state().dragging_node_id == std::optional<int>(1));
  assert(ed.state().nodes.back().id == 1);
  assert(ed.state().nodes.back().selected);
  ed.handle_mouse(drag(7, 4));
  const Node* n = find_node(ed.state().nodes, 1);
  assert(n->x == 4 && n->y == 3);
  ed.handle_mouse(drag(200, 200));
  n = find_node(ed.state().nodes, 1);
  assert(n->x == 67 && n->y == 16);
  ed.handle_mouse(up(200, 200));
  assert(!ed.state().dragging_node_id);
  assert(std::get<InsertMode>(ed.state().mode).node_id == 1);
}

static void test_drag_connector() {
  FakeWorkspace ws;
  Editor ed(side_by_side(), ws, Settings{});
  ed.handle_mouse(down(2, 3));
  assert(ed.state().partial);
  assert(ed.state().partial->from_offset == (Point{0, 2}));
  ed.handle_mouse(drag(15, 3));
  assert(ed.state().partial->current_pos == (Point{15, 3}));
  ed.handle_mouse(up(22, 3));
  assert(!ed.state().partial);
  assert(ed.state().connections.size() == 1);
  const Connection& c = ed.state().connections[0];
  assert(c.from_id == 1 && c.to_id == 2);
  assert(c.from_offset == (Point{0, 2}));
  assert(c.to_offset == (Point{5, 0}));
  assert(c.has_arrow);

  // released over empty space or the source: nothing
  ed.handle_mouse(down(6, 2));
  ed.handle_mouse(up(50, 15));
  ed.handle_mouse(down(6, 2));
  ed.handle_mouse(up(6, 3));
  assert(ed.state().connections.size() == 1);
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
}

static void test_resize_handle() {
  FakeWorkspace ws;
  Editor ed(side_by_side(), ws, Settings{});
  ed.handle_mouse(down(11, 5));
  assert(ed.state().resizing_node_id == std::optional<int>(1));
  ed.handle_mouse(drag(15, 8));
  const Node* n = find_node(ed.state().nodes, 1);
  assert(n->width == 14 && n->height == 7);
  ed.handle_mouse(drag(0, 0));
  n = find_node(ed.state().nodes, 1);
  assert(n->width == 3 && n->height == 3);
  ed.handle_mouse(up(0, 0));
  assert(!ed.state().resizing_node_id);
}

static void test_empty_click() {
  FakeWorkspace ws;
  EditorState st = side_by_side();
  st.nodes[0].selected = true;
  st.mode = InsertMode{1};
  Editor ed(std::move(st), ws, Settings{});
  ed.handle_mouse(down(50, 15));
  assert(!ed.state().selected_node());
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(!ed.state().selected_connection);
}

static void test_camera_offset() {
  FakeWorkspace ws;
  EditorState st = side_by_side();
  st.camera = {10, 0};
  Editor ed(std::move(st), ws, Settings{});
  // screen (15, 3) is world (25, 3): inside node 2
  ed.handle_mouse(down(15, 3));
  assert(ed.state().dragging_node_id == std::optional<int>(2));
}

static void test_context_menu_keys() {
  FakeWorkspace ws;
  Editor ed(side_by_side(), ws, Settings{});
  ed.set_viewport(77, 20);
  ed.handle_mouse(down(40, 1, MouseButton::Right));
  auto m = std::get<ContextMenuMode>(ed.state().mode);
  assert(m.x == 40 && m.y == 1 && m.selected_index == 0);

  ed.handle_key(key(Key::Up));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 0);
  for (int i = 0; i < 3; ++i) ed.handle_key(key(Key::Down));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 3);
  ed.handle_key(key(Key::Down));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 5);
  ed.handle_key(key(Key::Up));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 3);
  for (int i = 0; i < 12; ++i) ed.handle_key(key(Key::Down));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 9);
  ed.handle_key(key_char('x'));
  assert(std::holds_alternative<ContextMenuMode>(ed.state().mode));
  ed.handle_key(key(Key::Esc));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));

  ed.handle_mouse(down(40, 1, MouseButton::Right));
  ed.handle_key(key(Key::Down));
  ed.handle_key(key(Key::Enter));
  const auto& st = ed.state();
  assert(st.nodes.size() == 3);
  assert(st.nodes.back().shape == ShapeType::Diamond);
  assert(st.nodes.back().x == 40 && st.nodes.back().y == 1);
  assert(st.nodes.back().id == 3);
  assert(std::get<InsertMode>(st.mode).node_id == 3);
}

// Closing the menu by clicking a node must not grab, select or raise it.
static void test_menu_close_over_node() {
  FakeWorkspace ws;
  Editor ed(side_by_side(), ws, Settings{});
  ed.set_viewport(77, 20);
  ed.handle_event(InputEvent{down(40, 5, MouseButton::Right)});
  assert(std::holds_alternative<ContextMenuMode>(ed.state().mode));

  ed.handle_event(InputEvent{down(5, 3)});
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(!ed.state().dragging_node_id);
  assert(ed.state().nodes.size() == 2);
  assert(ed.state().nodes[0].id == 1 && ed.state().nodes[1].id == 2);
  assert(!ed.state().nodes[0].selected && !ed.state().nodes[1].selected);

  ed.handle_event(InputEvent{drag(9, 6)});
  ed.handle_event(InputEvent{up(9, 6)});
  const Node* n = find_node(ed.state().nodes, 1);
  assert(n->x == 2 && n->y == 2);
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.state().connections.empty());
}

static void test_context_menu_mouse() {
  FakeWorkspace ws;
  Editor ed(side_by_side(), ws, Settings{});
  ed.set_viewport(77, 20);
  ed.handle_mouse(down(40, 5, MouseButton::Right));
  MenuRect r = menu_rect(std::get<ContextMenuMode>(ed.state().mode), 77, 20);
  assert(r.x == 40 && r.y == 5 && r.width == kMenuWidth && r.height == kMenuHeight);

  // hover highlights, separators are skipped
  ed.handle_mouse(hover(42, 5 + 1 + 1));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 1);
  ed.handle_mouse(hover(42, 5 + 1 + 4));
  assert(std::get<ContextMenuMode>(ed.state().mode).selected_index == 1);
  // clicking the border row does nothing
  ed.handle_mouse(down(42, 5));
  assert(std::holds_alternative<ContextMenuMode>(ed.state().mode));

  ed.handle_mouse(down(42, 5 + 1 + 2));
  assert(ed.state().nodes.size() == 3);
  assert(ed.state().nodes.back().shape == ShapeType::Text);
  assert(ed.state().nodes.back().x == 40 && ed.state().nodes.back().y == 5);
  assert(std::holds_alternative<InsertMode>(ed.state().mode));

  ed.handle_key(key(Key::Esc));
  ed.handle_mouse(down(40, 5, MouseButton::Right));
  ed.handle_mouse(down(0, 0));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.state().nodes.size() == 3);
  assert(!ed.state().dragging_node_id);

  // right click elsewhere reopens at the new point
  ed.handle_mouse(down(40, 5, MouseButton::Right));
  ed.handle_mouse(down(10, 10, MouseButton::Right));
  assert(std::get<ContextMenuMode>(ed.state().mode).x == 10);

  ContextMenuMode corner{70, 15, 0};
  MenuRect cr = menu_rect(corner, 77, 20);
  assert(cr.x == 56 && cr.y == 8);
}

static void test_context_menu_node_actions() {
  FakeWorkspace ws;
  EditorState st = side_by_side();
  st.connections.push_back({1, {9, 2}, 2, {0, 2}, false});
  Editor ed(std::move(st), ws, Settings{});
  ed.set_viewport(77, 20);

  // Start Arrow (index 6) on node 1
  ed.handle_mouse(down(5, 3, MouseButton::Right));
  ed.handle_mouse(down(6, 3 + 1 + 6));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.state().connection_source_id == std::optional<int>(1));
  assert(ed.state().connection_has_arrow);

  // Start Connector (index 5) on empty space
  ed.handle_mouse(down(50, 1, MouseButton::Right));
  ed.handle_mouse(down(51, 1 + 1 + 5));
  assert(ed.message() == "No node at click position");

  // Delete (index 7) over the connection, then over node 2
  ed.handle_mouse(down(15, 4, MouseButton::Right));
  ed.handle_mouse(down(16, 4 + 1 + 7));
  assert(ed.state().connections.empty());
  assert(ed.message() == "Connection deleted");
  ed.handle_mouse(down(22, 3, MouseButton::Right));
  ed.handle_mouse(down(23, 3 + 1 + 7));
  assert(ed.state().nodes.size() == 1);
  assert(ed.message() == "Shape and connections deleted");

  // Cancel (index 9)
  ed.handle_mouse(down(5, 3, MouseButton::Right));
  ed.handle_mouse(down(6, 3 + 1 + 9));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.state().nodes.size() == 1);
}

static void test_help_swallows_mouse() {
  FakeWorkspace ws;
  EditorState st = side_by_side();
  st.mode = HelpMode{};
  Editor ed(std::move(st), ws, Settings{});
  ed.handle_mouse(down(5, 3));
  ed.handle_mouse(down(5, 3, MouseButton::Right));
  assert(std::holds_alternative<HelpMode>(ed.state().mode));
  assert(!ed.state().dragging_node_id);
}

int main() {
  test_drag_body();
  test_drag_connector();
  test_resize_handle();
  test_empty_click();
  test_camera_offset();
  test_context_menu_keys();
  test_context_menu_mouse();
  test_menu_close_over_node();
  test_context_menu_node_actions();
  test_help_swallows_mouse();
  return 0;
}
