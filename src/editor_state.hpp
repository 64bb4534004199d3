#pragma once
/*
 * EditorState
 *
 * Purpose: everything one editing session mutates: the diagram, the camera,
 * the current mode and the transient drag/connect state.
 * Ownership: owned by Editor; the canvas only ever sees a const reference.
 */
#include <optional>
#include <string>
#include <vector>
#include "diagram.hpp"
#include "types.hpp"

struct EditorState {
  std::string title;
  std::vector<Node> nodes;
  std::vector<Connection> connections;
  Point camera;
  Mode mode = NormalMode{};

  std::optional<int> dragging_node_id;
  Point drag_offset;
  std::optional<int> resizing_node_id;
  std::optional<PartialConnection> partial;
  std::optional<size_t> selected_connection;
  std::optional<int> connection_source_id;
  bool connection_has_arrow = false;

  static EditorState from_diagram(Diagram d);
  Diagram to_diagram() const;

  Node* selected_node();
  const Node* selected_node() const;
  void clear_node_selection();
  void select_only(int id);
};
