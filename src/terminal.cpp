#include "terminal.hpp"
#include <cstdio>
#include <locale.h>

Terminal::Terminal(bool mouse) : mouse_(mouse) {
  setlocale(LC_ALL, "");
  if (!initscr()) return;
  ok_ = true;
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  curs_set(0);
  if (mouse_) {
    mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
    mouseinterval(0);
    // button-event tracking so drags report motion
    std::printf("\033[?1002h");
    std::fflush(stdout);
  }
}

Terminal::~Terminal() {
  if (!ok_) return;
  if (mouse_) {
    std::printf("\033[?1002l");
    std::fflush(stdout);
  }
  curs_set(1);
  endwin();
}
