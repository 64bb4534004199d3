#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper; this
 * class only owns colour pairs and the key/mouse decoding.
 */
#include <deque>
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(bool color);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void draw_frame(int row, int col, int height, int width, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  std::optional<InputEvent> poll_event(int timeout_ms) override;
private:
  std::optional<InputEvent> decode_key(int ch);
  std::optional<InputEvent> decode_mouse();
  bool color_ = false;
  bool left_down_ = false;
  std::deque<InputEvent> pending_;
};
