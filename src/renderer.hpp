#pragma once
/*
 * Renderer
 *
 * Purpose: lay out and draw one frame: the bordered canvas view, the status
 * bar, the Leader/Help/context-menu popups and the insert caret.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; reads the Editor snapshot it is given.
 */
#include <string>
#include "editor.hpp"
#include "iterminal.hpp"

struct Rect { int row = 0; int col = 0; int height = 0; int width = 0; };

struct ScreenLayout {
  Rect display;   // centred column holding the view and status bar
  Rect canvas;    // interior of the titled border
  int status_row = 0;
};

// Display is at most display_width columns, centred in the terminal.
ScreenLayout compute_layout(TermSize sz, int display_width);

class Renderer {
public:
  void render(ITerminal& term, const Editor& ed, const ScreenLayout& layout);
private:
  void draw_status(ITerminal& term, const Editor& ed, const ScreenLayout& layout);
  void draw_leader_popup(ITerminal& term, const Editor& ed, TermSize sz);
  void draw_help_popup(ITerminal& term, TermSize sz);
  void draw_context_menu(ITerminal& term, const ContextMenuMode& m, const ScreenLayout& layout);
  void place_caret(ITerminal& term, const Editor& ed, const ScreenLayout& layout);
};
