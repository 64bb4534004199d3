#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh,
 * input polling).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <optional>
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

// Colour pairs: borders use the mode colour, labels are black on it.
enum ColorPair : int {
  kPairDefault = 0,
  kPairNormal = 1,
  kPairInsert,
  kPairLeader,
  kPairResize,
  kPairHelp,
  kPairMenu,
  kPairLabelNormal = 11,
  kPairLabelInsert,
  kPairLabelLeader,
  kPairLabelResize,
  kPairLabelHelp,
  kPairLabelMenu,
  kPairStatus = 20,
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void draw_reversed(int row, int col, const std::string& text) = 0;
  // Bordered rectangle; the interior is blanked.
  virtual void draw_frame(int row, int col, int height, int width, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  // nullopt when nothing arrived within timeout_ms.
  virtual std::optional<InputEvent> poll_event(int timeout_ms) = 0;
};
