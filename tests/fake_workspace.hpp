#pragma once
#include <string>
#include "iworkspace.hpp"

// Records what the editor asked to persist/copy instead of touching disk.
struct FakeWorkspace : IWorkspace {
  bool ok = true;
  int saves = 0;
  int copies = 0;
  Diagram last_diagram;
  std::string last_ascii;

  bool save(const Diagram& d, const std::string& ascii, std::string& msg) override {
    saves++;
    last_diagram = d;
    last_ascii = ascii;
    msg = ok ? "Saved " + d.title + ".txt and " + d.title + ".json!" : "write file failed: " + d.title + ".txt";
    return ok;
  }
  bool copy_text(const std::string& ascii, std::string& msg) override {
    copies++;
    last_ascii = ascii;
    msg = ok ? "Copied to clipboard!" : "clipboard unavailable";
    return ok;
  }
};

inline Node make_test_node(int id, ShapeType shape, int x, int y, int w, int h, bool selected = false) {
  Node n;
  n.id = id;
  n.shape = shape;
  n.x = x;
  n.y = y;
  n.width = w;
  n.height = h;
  n.selected = selected;
  return n;
}
