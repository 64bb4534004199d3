#include "diagram.hpp"
#include "fake_workspace.hpp"
#include <cassert>
#include <vector>

static void test_make_and_ids() {
  Node b = make_node(1, ShapeType::Box, 4, 6);
  assert(b.width == 20 && b.height == 5 && b.selected);
  assert(make_node(1, ShapeType::Diamond, 0, 0).width == 15);
  assert(make_node(1, ShapeType::Diamond, 0, 0).height == 7);
  assert(make_node(1, ShapeType::Text, 0, 0).width == 10);
  assert(make_node(1, ShapeType::Text, 0, 0).height == 1);
  assert(make_node(1, ShapeType::Frame, 0, 0).width == 30);
  assert(make_node(1, ShapeType::Frame, 0, 0).height == 10);
  Node clamped = make_node(2, ShapeType::Box, -3, -1);
  assert(clamped.x == 0 && clamped.y == 0);

  std::vector<Node> nodes;
  assert(next_node_id(nodes) == 1);
  nodes.push_back(make_test_node(3, ShapeType::Box, 0, 0, 5, 3));
  nodes.push_back(make_test_node(7, ShapeType::Box, 0, 0, 5, 3));
  assert(next_node_id(nodes) == 8);

  assert(shape_from_name("Frame") == ShapeType::Frame);
  assert(!shape_from_name("Circle"));
  assert(std::string(shape_name(ShapeType::Diamond)) == "Diamond");
}

static void test_remove_cascade() {
  std::vector<Node> nodes = {
    make_test_node(1, ShapeType::Box, 0, 0, 5, 3),
    make_test_node(2, ShapeType::Box, 10, 0, 5, 3),
    make_test_node(3, ShapeType::Box, 20, 0, 5, 3),
  };
  std::vector<Connection> conns = {
    {1, {4, 1}, 2, {0, 1}, false},
    {2, {4, 1}, 3, {0, 1}, true},
    {1, {2, 2}, 3, {2, 0}, false},
  };
  assert(remove_node(nodes, conns, 2) == 2);
  assert(nodes.size() == 2);
  assert(conns.size() == 1);
  assert(conns[0].from_id == 1 && conns[0].to_id == 3);
  assert(remove_node(nodes, conns, 42) == 0);
  assert(next_node_id(nodes) == 4);
}

static void test_z_order() {
  std::vector<Node> nodes = {
    make_test_node(1, ShapeType::Box, 0, 0, 10, 5),
    make_test_node(2, ShapeType::Box, 5, 2, 10, 5),
  };
  assert(topmost_node_at(nodes, 6, 3)->id == 2);
  raise_node(nodes, 1);
  assert(nodes.back().id == 1);
  assert(topmost_node_at(nodes, 6, 3)->id == 1);
  assert(topmost_node_at(nodes, 40, 40) == nullptr);
}

static void test_sizing() {
  Node t = make_test_node(1, ShapeType::Text, 0, 0, 10, 1);
  t.text = "Hello\nab";
  fit_text_node(t);
  assert(t.width == 5 && t.height == 2);
  t.text = "";
  fit_text_node(t);
  assert(t.width == 3 && t.height == 1);

  Node b = make_test_node(2, ShapeType::Box, 0, 0, 20, 5);
  b.text = "a very long line of text";
  fit_text_node(b);
  assert(b.width == 20 && b.height == 5);

  Node small = make_test_node(3, ShapeType::Box, 0, 0, 4, 2);
  resize_node(small, -2, -1);
  assert(small.width == 3 && small.height == 1);
  resize_node(small, 2, 1);
  assert(small.width == 5 && small.height == 2);
}

static void test_anchors() {
  Node src = make_test_node(1, ShapeType::Box, 0, 0, 10, 4);
  Node below = make_test_node(2, ShapeType::Box, 0, 10, 10, 4);
  AnchorPair a = heuristic_anchors(src, below);
  assert(a.from_offset == (Point{5, 3}));
  assert(a.to_offset == (Point{5, 0}));

  Node right = make_test_node(3, ShapeType::Box, 20, 0, 10, 4);
  a = heuristic_anchors(src, right);
  assert(a.from_offset == (Point{9, 2}));
  assert(a.to_offset == (Point{0, 2}));

  a = heuristic_anchors(below, src);
  assert(a.from_offset == (Point{5, 0}));
  assert(a.to_offset == (Point{5, 3}));

  a = heuristic_anchors(right, src);
  assert(a.from_offset == (Point{0, 2}));
  assert(a.to_offset == (Point{9, 2}));

  assert(vertical_first(src, {5, 0}));
  assert(vertical_first(src, {5, 3}));
  assert(!vertical_first(src, {0, 2}));

  assert(snap_border_anchor(src, {3, 0}) == (Point{5, 0}));
  assert(snap_border_anchor(src, {0, 2}) == (Point{0, 2}));
  assert(snap_border_anchor(src, {9, 1}) == (Point{9, 2}));
  assert(nearest_edge_anchor(src, 9, 2) == (Point{9, 2}));
  assert(nearest_edge_anchor(src, 1, 1) == (Point{5, 0}));
  assert(nearest_edge_anchor(src, 4, 3) == (Point{5, 3}));

  assert(anchor_side(src, {5, 0}) == Side::Top);
  assert(anchor_side(src, {0, 2}) == Side::Left);
  assert(!anchor_side(src, {3, 2}));
}

static void test_connection_hit() {
  std::vector<Node> nodes = {
    make_test_node(1, ShapeType::Box, 0, 0, 10, 4),
    make_test_node(2, ShapeType::Box, 0, 10, 10, 4),
  };
  std::vector<Connection> conns = {{1, {5, 3}, 2, {5, 0}, false}};
  assert(conns[0].contains(5, 6, nodes));
  assert(conns[0].contains(5, 10, nodes));
  assert(!conns[0].contains(7, 6, nodes));
  assert(topmost_connection_at(conns, nodes, 5, 7) == std::optional<size_t>(0));
  assert(!topmost_connection_at(conns, nodes, 8, 7));
}

int main() {
  test_make_and_ids();
  test_remove_cascade();
  test_z_order();
  test_sizing();
  test_anchors();
  test_connection_hit();
  return 0;
}
