#pragma once
/*
 * Diagram
 *
 * Purpose: diagram data model (Node/Connection/Diagram) and the geometric
 * predicates and id/z-order helpers the editor builds on.
 * Design: connections reference nodes by id; removing a node cascades to
 * every connection that names it. Vector order is z-order (back to front).
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

enum class ShapeType { Box, Diamond, Text, Frame };

const char* shape_name(ShapeType s);
std::optional<ShapeType> shape_from_name(const std::string& s);

constexpr int kMinNodeWidth = 3;
constexpr int kMinNodeHeight = 1;

struct Node {
  int id = 0;
  ShapeType shape = ShapeType::Box;
  int x = 0;
  int y = 0;
  int width = kMinNodeWidth;
  int height = kMinNodeHeight;
  std::string text;
  bool selected = false;

  bool contains(int px, int py) const {
    return px >= x && px < x + width && py >= y && py < y + height;
  }
};

// Route through the mid row (vertical-first) or mid column of two points.
struct Route {
  Point from;
  Point to;
  bool vertical_first = true;
  int mid() const { return vertical_first ? (from.y + to.y) / 2 : (from.x + to.x) / 2; }
  bool passes(int x, int y) const;
};

struct Connection {
  int from_id = 0;
  Point from_offset;
  int to_id = 0;
  Point to_offset;
  bool has_arrow = false;

  // Hit test against the rendered route in world coordinates.
  bool contains(int x, int y, const std::vector<Node>& nodes) const;
};

struct PartialConnection {
  int from_id = 0;
  Point from_offset;
  Point current_pos;
};

struct Diagram {
  std::string title;
  std::vector<Node> nodes;
  std::vector<Connection> connections;
};

enum class Side { Top, Bottom, Left, Right };

struct AnchorPair {
  Point from_offset;
  Point to_offset;
};

Node make_node(int id, ShapeType shape, int x, int y);
int next_node_id(const std::vector<Node>& nodes);

const Node* find_node(const std::vector<Node>& nodes, int id);
Node* find_node(std::vector<Node>& nodes, int id);
std::optional<size_t> node_index(const std::vector<Node>& nodes, int id);
const Node* topmost_node_at(const std::vector<Node>& nodes, int x, int y);
std::optional<size_t> topmost_connection_at(const std::vector<Connection>& conns,
                                            const std::vector<Node>& nodes, int x, int y);

// Returns the number of connections dropped along with the node.
size_t remove_node(std::vector<Node>& nodes, std::vector<Connection>& conns, int id);
void raise_node(std::vector<Node>& nodes, int id);

void fit_text_node(Node& n);
void resize_node(Node& n, int dw, int dh);

bool vertical_first(const Node& from, Point from_offset);
Point anchor_offset(const Node& n, Side side);
std::optional<Side> anchor_side(const Node& n, Point offset);
AnchorPair heuristic_anchors(const Node& src, const Node& dst);
Point snap_border_anchor(const Node& n, Point local);
Point nearest_edge_anchor(const Node& n, int x, int y);
