#include "editor_state.hpp"

const char* mode_name(const Mode& m) {
  return std::visit(Overloaded{
    [](const NormalMode&) { return "NORMAL"; },
    [](const InsertMode&) { return "INSERT"; },
    [](const LeaderMode&) { return "LEADER"; },
    [](const ResizeMode&) { return "RESIZE"; },
    [](const HelpMode&) { return "HELP"; },
    [](const ContextMenuMode&) { return "MENU"; },
  }, m);
}

EditorState EditorState::from_diagram(Diagram d) {
  EditorState s;
  s.title = std::move(d.title);
  s.nodes = std::move(d.nodes);
  s.connections = std::move(d.connections);
  return s;
}

Diagram EditorState::to_diagram() const {
  return Diagram{title, nodes, connections};
}

Node* EditorState::selected_node() {
  for (auto& n : nodes) if (n.selected) return &n;
  return nullptr;
}

const Node* EditorState::selected_node() const {
  for (const auto& n : nodes) if (n.selected) return &n;
  return nullptr;
}

void EditorState::clear_node_selection() {
  for (auto& n : nodes) n.selected = false;
}

void EditorState::select_only(int id) {
  for (auto& n : nodes) n.selected = (n.id == id);
}
