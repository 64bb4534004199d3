#include "ncurses_terminal.hpp"

NcursesTerminal::NcursesTerminal(bool color) {
  color_ = color && has_colors();
  if (!color_) return;
  start_color();
  bool dflt = use_default_colors() == OK;
  short bg = dflt ? -1 : COLOR_BLACK;
  const short mode_colors[] = {COLOR_BLUE, COLOR_GREEN, COLOR_YELLOW, COLOR_MAGENTA, COLOR_CYAN, COLOR_WHITE};
  for (short i = 0; i < 6; ++i) {
    init_pair(static_cast<short>(kPairNormal + i), mode_colors[i], bg);
    init_pair(static_cast<short>(kPairLabelNormal + i), COLOR_BLACK, mode_colors[i]);
  }
  init_pair(kPairStatus, COLOR_WHITE, COLOR_BLACK);
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (color_ && color_pair_id > 0) attron(COLOR_PAIR(color_pair_id));
  bool label = color_pair_id >= kPairLabelNormal && color_pair_id <= kPairLabelMenu;
  if (label) attron(A_BOLD);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (label) attroff(A_BOLD);
  if (color_ && color_pair_id > 0) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_frame(int row, int col, int height, int width, int color_pair_id) {
  if (height < 2 || width < 2) return;
  if (color_ && color_pair_id > 0) attron(COLOR_PAIR(color_pair_id));
  mvaddch(row, col, ACS_ULCORNER);
  mvhline(row, col + 1, ACS_HLINE, width - 2);
  mvaddch(row, col + width - 1, ACS_URCORNER);
  for (int r = row + 1; r < row + height - 1; ++r) {
    mvaddch(r, col, ACS_VLINE);
    mvhline(r, col + 1, ' ', width - 2);
    mvaddch(r, col + width - 1, ACS_VLINE);
  }
  mvaddch(row + height - 1, col, ACS_LLCORNER);
  mvhline(row + height - 1, col + 1, ACS_HLINE, width - 2);
  mvaddch(row + height - 1, col + width - 1, ACS_LRCORNER);
  if (color_ && color_pair_id > 0) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

std::optional<InputEvent> NcursesTerminal::poll_event(int timeout_ms) {
  if (!pending_.empty()) {
    InputEvent ev = pending_.front();
    pending_.pop_front();
    return ev;
  }
  timeout(timeout_ms);
  int ch = getch();
  if (ch == ERR) return std::nullopt;
  if (ch == KEY_MOUSE) return decode_mouse();
  return decode_key(ch);
}

std::optional<InputEvent> NcursesTerminal::decode_key(int ch) {
  switch (ch) {
    case 27: return key(Key::Esc);
    case '\t': return key(Key::Tab);
    case KEY_BTAB: return key(Key::BackTab);
    case KEY_BACKSPACE: case 127: case 8: return key(Key::Backspace);
    case KEY_DC: return key(Key::Delete);
    case KEY_ENTER: case '\n': case '\r': return key(Key::Enter);
    case KEY_UP: return key(Key::Up);
    case KEY_DOWN: return key(Key::Down);
    case KEY_LEFT: return key(Key::Left);
    case KEY_RIGHT: return key(Key::Right);
    default: break;
  }
  if (ch >= 32 && ch <= 126) return key_char(static_cast<char>(ch));
  return std::nullopt;
}

std::optional<InputEvent> NcursesTerminal::decode_mouse() {
  MEVENT me;
  if (getmouse(&me) != OK) return std::nullopt;
  MouseEvent ev;
  ev.col = me.x;
  ev.row = me.y;
  if (me.bstate & BUTTON1_PRESSED) {
    left_down_ = true;
    ev.action = MouseAction::Down;
    ev.button = MouseButton::Left;
  } else if (me.bstate & BUTTON1_RELEASED) {
    left_down_ = false;
    ev.action = MouseAction::Up;
    ev.button = MouseButton::Left;
  } else if (me.bstate & BUTTON1_CLICKED) {
    ev.action = MouseAction::Down;
    ev.button = MouseButton::Left;
    MouseEvent up = ev;
    up.action = MouseAction::Up;
    pending_.push_back(up);
  } else if (me.bstate & (BUTTON3_PRESSED | BUTTON3_CLICKED)) {
    ev.action = MouseAction::Down;
    ev.button = MouseButton::Right;
  } else if (me.bstate & REPORT_MOUSE_POSITION) {
    ev.action = left_down_ ? MouseAction::Drag : MouseAction::Move;
    ev.button = left_down_ ? MouseButton::Left : MouseButton::None;
  } else {
    return std::nullopt;
  }
  return ev;
}
