#include "editor.hpp"
#include "fake_workspace.hpp"
#include <cassert>
#include <string>

static void type(Editor& ed, const std::string& s) {
  for (char c : s) ed.handle_key(key_char(c));
}

static void test_create_box_and_type() {
  FakeWorkspace ws;
  Editor ed(EditorState{}, ws, Settings{});
  type(ed, " n");
  assert(std::holds_alternative<InsertMode>(ed.state().mode));
  type(ed, "Hi");
  ed.handle_key(key(Key::Esc));
  const auto& st = ed.state();
  assert(st.nodes.size() == 1);
  assert(st.nodes[0].text == "Hi");
  assert(st.nodes[0].shape == ShapeType::Box);
  assert(!st.nodes[0].selected);
  assert(st.nodes[0].x == 10 && st.nodes[0].y == 10);
  assert(st.nodes[0].id == 1);
  assert(std::holds_alternative<NormalMode>(st.mode));

  type(ed, " d");
  assert(ed.state().nodes.size() == 2);
  assert(ed.state().nodes[1].id == 2);
  assert(ed.state().nodes[1].x == 10 && ed.state().nodes[1].y == 17);
  assert(ed.state().nodes[1].selected);
  assert(ed.message() == "New shape created below previous");
}

static EditorState two_nodes() {
  EditorState st;
  st.title = "flow";
  st.nodes.push_back(make_test_node(1, ShapeType::Box, 0, 0, 10, 4, true));
  st.nodes.push_back(make_test_node(2, ShapeType::Box, 0, 10, 10, 4));
  st.nodes[0].text = "Start here";
  return st;
}

static void test_keyboard_connection() {
  FakeWorkspace ws;
  Editor ed(two_nodes(), ws, Settings{});
  type(ed, "c");
  assert(ed.message() == "Connector source: Start. Tab to target, Enter to finish.");
  ed.handle_key(key(Key::Tab));
  assert(ed.state().nodes[1].selected && !ed.state().nodes[0].selected);
  ed.handle_key(key(Key::Enter));
  const auto& st = ed.state();
  assert(st.connections.size() == 1);
  const Connection& c = st.connections[0];
  assert(c.from_id == 1 && c.to_id == 2);
  assert(!c.has_arrow);
  assert(c.from_offset == (Point{5, 3}));
  assert(c.to_offset == (Point{5, 0}));
  assert(!st.connection_source_id);
  assert(ed.message() == "Keyboard connection created!");

  // Enter without a pending source does nothing
  ed.handle_key(key(Key::Enter));
  assert(ed.state().connections.size() == 1);
}

static void test_arrow_connector_and_toggle() {
  FakeWorkspace ws;
  Editor ed(two_nodes(), ws, Settings{});
  type(ed, "a");
  assert(ed.message() == "Arrow source: Start. Tab to target, Enter to finish.");
  // same node as target is refused
  ed.handle_key(key(Key::Enter));
  assert(ed.state().connections.empty());
  ed.handle_key(key(Key::Tab));
  ed.handle_key(key(Key::Enter));
  assert(ed.state().connections.size() == 1);
  assert(ed.state().connections[0].has_arrow);

  ed.handle_key(key(Key::Esc));
  MouseEvent click{MouseAction::Down, MouseButton::Left, 5, 6};
  ed.handle_mouse(click);
  assert(ed.state().selected_connection == std::optional<size_t>(0));
  type(ed, "a");
  assert(!ed.state().connections[0].has_arrow);
  assert(ed.message() == "Arrow disabled");
  type(ed, "a");
  assert(ed.state().connections[0].has_arrow);
  assert(ed.message() == "Arrow enabled");

  ed.handle_key(key(Key::Delete));
  assert(ed.state().connections.empty());
  assert(!ed.state().selected_connection);
  assert(ed.message() == "Connection deleted");
}

static void test_quit_paths() {
  FakeWorkspace ws;
  Editor ed(two_nodes(), ws, Settings{});
  type(ed, " ");
  assert(std::holds_alternative<LeaderMode>(ed.state().mode));
  type(ed, "q");
  assert(ed.should_quit());
  assert(ws.saves == 0);

  Editor ed2(EditorState{}, ws, Settings{});
  type(ed2, "q");
  assert(ed2.should_quit());
}

static void test_selection_and_movement() {
  FakeWorkspace ws;
  EditorState st = two_nodes();
  st.nodes[0].selected = false;
  st.nodes.push_back(make_test_node(3, ShapeType::Text, 30, 0, 3, 1));
  Editor ed(std::move(st), ws, Settings{});

  ed.handle_key(key(Key::Tab));
  assert(ed.state().nodes[0].selected);
  ed.handle_key(key(Key::BackTab));
  assert(ed.state().nodes[2].selected && !ed.state().nodes[0].selected);
  ed.handle_key(key(Key::Tab));
  assert(ed.state().nodes[0].selected);

  ed.handle_key(key(Key::Left));
  ed.handle_key(key(Key::Up));
  assert(ed.state().nodes[0].x == 0 && ed.state().nodes[0].y == 0);
  ed.handle_key(key(Key::Right));
  ed.handle_key(key(Key::Down));
  assert(ed.state().nodes[0].x == 1 && ed.state().nodes[0].y == 1);

  ed.handle_key(key(Key::Esc));
  assert(!ed.state().selected_node());
  assert(ed.message() == "Selection cleared");
  ed.handle_key(key(Key::Right));
  assert(ed.state().camera == (Point{1, 0}));
  assert(ed.message() == "Canvas Pan: 1, 0");
  ed.handle_key(key(Key::Left));
  ed.handle_key(key(Key::Left));
  assert(ed.state().camera == (Point{-1, 0}));
}

static void test_delete_node() {
  FakeWorkspace ws;
  EditorState st = two_nodes();
  st.connections.push_back({1, {5, 3}, 2, {5, 0}, false});
  st.connections.push_back({2, {5, 3}, 1, {5, 0}, true});
  st.connection_source_id = 1;
  Editor ed(std::move(st), ws, Settings{});
  ed.handle_key(key(Key::Backspace));
  assert(ed.state().nodes.size() == 1);
  assert(ed.state().connections.empty());
  assert(!ed.state().connection_source_id);
  assert(ed.message() == "Shape and connections deleted");
  // nothing selected: no-op
  ed.handle_key(key(Key::Delete));
  assert(ed.state().nodes.size() == 1);
}

static void test_insert_mode() {
  FakeWorkspace ws;
  Editor ed(two_nodes(), ws, Settings{});
  type(ed, "i");
  assert(std::get<InsertMode>(ed.state().mode).node_id == 1);
  ed.handle_key(key(Key::Backspace));
  ed.handle_key(key(Key::Backspace));
  ed.handle_key(key(Key::Backspace));
  ed.handle_key(key(Key::Backspace));
  ed.handle_key(key(Key::Backspace));
  assert(ed.state().nodes[0].text == "Start");
  ed.handle_key(key(Key::Enter));
  type(ed, "x");
  assert(ed.state().nodes[0].text == "Start\nx");
  // box keeps its size while typing
  assert(ed.state().nodes[0].width == 10 && ed.state().nodes[0].height == 4);
  ed.handle_key(key(Key::Tab));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.state().nodes[1].selected && !ed.state().nodes[0].selected);

  Editor txt(EditorState{}, ws, Settings{});
  type(txt, " thello world");
  assert(txt.state().nodes[0].width == 11 && txt.state().nodes[0].height == 1);
  txt.handle_key(key(Key::Enter));
  type(txt, "x");
  assert(txt.state().nodes[0].width == 11 && txt.state().nodes[0].height == 2);
  for (int i = 0; i < 20; ++i) txt.handle_key(key(Key::Backspace));
  assert(txt.state().nodes[0].text.empty());
  assert(txt.state().nodes[0].width == 3 && txt.state().nodes[0].height == 1);
}

static void test_stale_ids() {
  FakeWorkspace ws;
  EditorState st;
  st.mode = InsertMode{99};
  Editor ed(std::move(st), ws, Settings{});
  type(ed, "x");
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.state().nodes.empty());

  EditorState rs;
  rs.mode = ResizeMode{5};
  Editor ed2(std::move(rs), ws, Settings{});
  type(ed2, "+");
  assert(std::holds_alternative<NormalMode>(ed2.state().mode));
}

static void test_resize_mode() {
  FakeWorkspace ws;
  EditorState st;
  st.nodes.push_back(make_test_node(1, ShapeType::Box, 0, 0, 4, 2, true));
  Editor ed(std::move(st), ws, Settings{});
  type(ed, "r");
  assert(std::holds_alternative<ResizeMode>(ed.state().mode));
  assert(ed.message() == "Resize Mode: Use +/- to scale, Esc to finish");
  type(ed, "+");
  assert(ed.state().nodes[0].width == 6 && ed.state().nodes[0].height == 3);
  assert(ed.message() == "Resized: 6x3");
  type(ed, "---");
  assert(ed.state().nodes[0].width == 3 && ed.state().nodes[0].height == 1);
  type(ed, "=");
  assert(ed.state().nodes[0].width == 5);
  ed.handle_key(key(Key::Esc));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(ed.message() == "Resize finished");

  // no selection: r does nothing
  ed.handle_key(key(Key::Esc));
  type(ed, "r");
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
}

static void test_leader_io() {
  FakeWorkspace ws;
  Settings s;
  s.export_width = 40;
  Editor ed(two_nodes(), ws, s);
  ed.set_viewport(60, 12);
  type(ed, " w");
  assert(ws.saves == 1);
  assert(ws.last_diagram.title == "flow");
  assert(ws.last_diagram.nodes.size() == 2);
  assert(ws.last_ascii.size() == 12 * 41);
  assert(ws.last_ascii.substr(0, 10) == "#========#");
  assert(ed.message() == "Saved flow.txt and flow.json!");
  assert(std::holds_alternative<NormalMode>(ed.state().mode));

  ws.ok = false;
  type(ed, " c");
  assert(ws.copies == 1);
  assert(ed.message() == "clipboard unavailable");
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
  assert(!ed.should_quit());

  type(ed, " w");
  assert(ed.message() == "write file failed: flow.txt");

  type(ed, " h");
  assert(std::holds_alternative<HelpMode>(ed.state().mode));
  type(ed, "x");
  assert(std::holds_alternative<HelpMode>(ed.state().mode));
  type(ed, " ");
  assert(std::holds_alternative<NormalMode>(ed.state().mode));

  type(ed, " ");
  ed.handle_key(key(Key::Esc));
  assert(std::holds_alternative<NormalMode>(ed.state().mode));
}

int main() {
  test_create_box_and_type();
  test_keyboard_connection();
  test_arrow_connector_and_toggle();
  test_quit_paths();
  test_selection_and_movement();
  test_delete_node();
  test_insert_mode();
  test_stale_ids();
  test_resize_mode();
  test_leader_io();
  return 0;
}
