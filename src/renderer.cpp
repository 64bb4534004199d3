#include "renderer.hpp"
#include <algorithm>
#include "canvas.hpp"
#include "context_menu.hpp"

static const char* const kLeaderLines[] = {
  "  n -> New Box",
  "  d -> New Diamond",
  "  t -> New Text",
  "  f -> New Frame",
  nullptr,  // write line, carries the title
  "  c -> Copy to Clipboard",
  "  h -> Help Menu",
  "  q -> Quit",
  "",
  "  <Esc> -> Cancel",
};

static const char* const kHelpLines[] = {
  "--- NAVIGATION & SELECTION ---",
  "  Tab / BackTab   : Cycle through shapes",
  "  Arrows          : Move shape or pan canvas",
  "  Esc             : Clear selection / Back to Normal",
  "",
  "--- EDITING ---",
  "  i               : Enter Insert mode (Edit text)",
  "  r               : Enter Resize mode (+/- to scale)",
  "  Del / Backspace : Delete selected shape/connection",
  "",
  "--- CONNECTORS ---",
  "  c               : Start plain connector from shape",
  "  a               : Start arrow connector from shape",
  "  Enter           : Finish connector on target shape",
  "  a (on conn)     : Toggle arrow on selection",
  "",
  "--- COMMANDS (<Leader> = Space) ---",
  "  <Leader> + n    : Create new Box",
  "  <Leader> + d    : Create new Diamond",
  "  <Leader> + t    : Create new Text",
  "  <Leader> + f    : Create new Frame",
  "  <Leader> + w    : Save (.json and .txt)",
  "  <Leader> + c    : Copy ASCII to clipboard",
  "",
  "  Press <Esc> or <Space> to close Help",
};

static int mode_pair(const Mode& m) {
  return kPairNormal + static_cast<int>(m.index());
}

static std::string clip(const std::string& s, int width) {
  if (width <= 0) return {};
  return s.size() > static_cast<size_t>(width) ? s.substr(0, static_cast<size_t>(width)) : s;
}

ScreenLayout compute_layout(TermSize sz, int display_width) {
  ScreenLayout l;
  int w = std::min(std::max(0, display_width), std::max(0, sz.cols));
  l.display = {0, (sz.cols - w) / 2, std::max(0, sz.rows), w};
  l.status_row = std::max(0, sz.rows - 1);
  l.canvas = {1, l.display.col + 1, std::max(0, sz.rows - 3), std::max(0, w - 2)};
  return l;
}

void Renderer::render(ITerminal& term, const Editor& ed, const ScreenLayout& layout) {
  TermSize sz = term.getSize();
  const EditorState& st = ed.state();
  term.clear();

  int main_h = layout.display.height - 1;
  if (main_h >= 2 && layout.display.width >= 2) {
    term.draw_frame(0, layout.display.col, main_h, layout.display.width, mode_pair(st.mode));
    std::string title = clip(" " + st.title + " ", layout.display.width - 2);
    term.draw_colored(0, layout.display.col + 1, title, mode_pair(st.mode));
  }
  if (layout.canvas.width > 0 && layout.canvas.height > 0) {
    Canvas canvas = render_diagram(st, layout.canvas.width, layout.canvas.height);
    for (int y = 0; y < canvas.height(); ++y) {
      term.draw_text(layout.canvas.row + y, layout.canvas.col, canvas.row(y));
    }
  }
  draw_status(term, ed, layout);

  std::visit(Overloaded{
    [&](const LeaderMode&) { draw_leader_popup(term, ed, sz); },
    [&](const HelpMode&) { draw_help_popup(term, sz); },
    [&](const ContextMenuMode& m) { draw_context_menu(term, m, layout); },
    [](const auto&) {},
  }, st.mode);

  place_caret(term, ed, layout);
  term.refresh();
}

void Renderer::draw_status(ITerminal& term, const Editor& ed, const ScreenLayout& layout) {
  if (layout.display.width <= 0) return;
  const Mode& m = ed.state().mode;
  std::string label = std::string(" ") + mode_name(m) + " ";
  std::string rest = " | " + ed.message();
  int col = layout.display.col;
  int w = layout.display.width;
  term.draw_colored(layout.status_row, col, std::string(static_cast<size_t>(w), ' '), kPairStatus);
  term.draw_colored(layout.status_row, col, clip(label, w), kPairLabelNormal + static_cast<int>(m.index()));
  int lw = static_cast<int>(label.size());
  if (lw < w) term.draw_colored(layout.status_row, col + lw, clip(rest, w - lw), kPairStatus);
}

void Renderer::draw_leader_popup(ITerminal& term, const Editor& ed, TermSize sz) {
  const int w = 30, h = 12;
  int row = std::max(0, sz.rows / 2 - 5);
  int col = std::max(0, sz.cols / 2 - 15);
  term.draw_frame(row, col, h, w, kPairLeader);
  term.draw_colored(row, col + 1, " Commands ", kPairLeader);
  int r = row + 1;
  for (const char* line : kLeaderLines) {
    std::string s = line ? line : "  w -> Write (" + ed.state().title + ".txt/.json)";
    term.draw_text(r++, col + 1, clip(s, w - 2));
  }
}

void Renderer::draw_help_popup(ITerminal& term, TermSize sz) {
  const int w = 54, h = 27;
  int row = std::max(0, sz.rows / 2 - h / 2);
  int col = std::max(0, sz.cols / 2 - w / 2);
  term.draw_frame(row, col, h, w, kPairHelp);
  term.draw_colored(row, col + 1, " Full Command Reference ", kPairHelp);
  int r = row + 1;
  for (const char* line : kHelpLines) {
    if (line[0] == '-') term.draw_colored(r, col + 1, clip(line, w - 2), kPairHelp);
    else term.draw_text(r, col + 1, clip(line, w - 2));
    r++;
  }
}

void Renderer::draw_context_menu(ITerminal& term, const ContextMenuMode& m, const ScreenLayout& layout) {
  MenuRect mr = menu_rect(m, layout.canvas.width, layout.canvas.height);
  int row = layout.canvas.row + mr.y;
  int col = layout.canvas.col + mr.x;
  term.draw_frame(row, col, mr.height, mr.width, kPairMenu);
  for (int i = 0; i < kMenuItemCount; ++i) {
    std::string label = kMenuItems[static_cast<size_t>(i)].label;
    if (i == m.selected_index) term.draw_reversed(row + 1 + i, col + 1, clip("> " + label, mr.width - 2));
    else term.draw_text(row + 1 + i, col + 1, clip("  " + label, mr.width - 2));
  }
}

void Renderer::place_caret(ITerminal& term, const Editor& ed, const ScreenLayout& layout) {
  const EditorState& st = ed.state();
  const auto* ins = std::get_if<InsertMode>(&st.mode);
  const Node* n = ins ? find_node(st.nodes, ins->node_id) : nullptr;
  if (!n) { term.show_cursor(false); return; }
  Node view = *n;
  view.x = std::max(0, view.x - st.camera.x);
  view.y = std::max(0, view.y - st.camera.y);
  Point p = text_caret(view);
  if (p.x < 0 || p.y < 0 || p.x >= layout.canvas.width || p.y >= layout.canvas.height) {
    term.show_cursor(false);
    return;
  }
  term.move_cursor(layout.canvas.row + p.y, layout.canvas.col + p.x);
  term.show_cursor(true);
}
