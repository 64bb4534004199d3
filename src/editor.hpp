#pragma once
/*
 * Editor
 *
 * Purpose: the interaction state machine. Applies key and mouse events to
 * the EditorState: create/select/move/resize/connect/delete/pan and the
 * modal Insert/Leader/Resize/Help/ContextMenu states.
 * Note: mouse events arrive in canvas-local screen cells; never renders to
 * a terminal itself (export text goes through IWorkspace).
 */
#include <string>
#include "config.hpp"
#include "diagram.hpp"
#include "editor_state.hpp"
#include "iworkspace.hpp"
#include "types.hpp"

class Editor {
public:
  Editor(EditorState state, IWorkspace& workspace, const Settings& settings);

  void handle_event(const InputEvent& ev);
  void handle_key(const KeyEvent& k);
  void handle_mouse(const MouseEvent& me);

  // Size of the canvas viewport in cells; drives drag clamping and export height.
  void set_viewport(int cols, int rows);
  int viewport_cols() const { return view_cols_; }
  int viewport_rows() const { return view_rows_; }

  const EditorState& state() const { return st_; }
  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }
  bool should_quit() const { return should_quit_; }

  // Render at the export width and current viewport height.
  std::string export_text() const;

private:
  void set_mode(Mode m);
  Point to_world(int col, int row) const;

  void handle_normal_key(const KeyEvent& k);
  void handle_insert_key(int id, const KeyEvent& k);
  void handle_leader_key(const KeyEvent& k);
  void handle_resize_key(int id, const KeyEvent& k);
  void handle_help_key(const KeyEvent& k);
  void handle_menu_key(ContextMenuMode m, const KeyEvent& k);
  bool handle_menu_mouse(const ContextMenuMode& m, const MouseEvent& me);
  void activate_menu_item(const ContextMenuMode& m, int index);

  void mouse_down(Point world);
  void mouse_drag(Point world);
  void mouse_up(Point world);
  void clear_transient();

  void spawn_node(ShapeType shape, Point world);
  void spawn_below_last(ShapeType shape);
  void delete_node(int id);
  void delete_connection(size_t idx);
  void arm_connector(const Node& source, bool arrow);
  void commit_keyboard_connection();
  void select_index(size_t idx);
  void cycle_selection(bool forward);
  void move_or_pan(Key k);

  void write_artifacts();
  void copy_to_clipboard();

  EditorState st_;
  IWorkspace& workspace_;
  int export_width_ = MGRAM_DEFAULT_EXPORT_WIDTH;
  int view_cols_ = MGRAM_DEFAULT_DISPLAY_WIDTH - 2;
  int view_rows_ = 20;
  std::string message_ = "Press <Space> for commands";
  bool should_quit_ = false;
};
