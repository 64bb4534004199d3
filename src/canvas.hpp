#pragma once
/*
 * Canvas
 *
 * Purpose: fixed-size character grid plus the ASCII drawing primitives for
 * shapes and orthogonal connector routes.
 * Constraint: render_diagram is a pure function of its arguments; it copies
 * what it needs and never touches the EditorState it reads.
 */
#include <string>
#include <vector>
#include "diagram.hpp"
#include "editor_state.hpp"

class Canvas {
public:
  Canvas(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  void set(int x, int y, char c);
  char at(int x, int y) const;
  const std::string& row(int y) const { return grid_[static_cast<size_t>(y)]; }
  std::string to_string() const;

  void draw_box(const Node& n);
  void draw_frame(const Node& n);
  void draw_diamond(const Node& n);
  void draw_text_node(const Node& n);
  void draw_connection(const std::vector<Node>& nodes, const Connection& c, bool highlighted);
  void draw_partial_connection(const Node& from, Point offset, Point target);

private:
  void draw_outline(const Node& n);
  void draw_line(int x1, int y1, int x2, int y2, char c);
  void draw_route(const Route& r, bool arrow, bool highlighted);

  int width_;
  int height_;
  std::vector<std::string> grid_;
};

// Width available to wrapped text inside a shape.
int text_area_width(const Node& n);
std::string frame_title(const Node& n);
// World cell just after the last character of the node's text.
Point text_caret(const Node& n);

Canvas render_diagram(const EditorState& st, int width, int height);
