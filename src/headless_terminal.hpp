#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests: records every cell drawn and
 * replays queued input events.
 * Note: colour is dropped; reversed text and frames are plain characters.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override { grid_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' ')); }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text); }
  void draw_colored(int row, int col, const std::string& text, int) override { put(row, col, text); }
  void draw_reversed(int row, int col, const std::string& text) override { put(row, col, text); }
  void draw_frame(int row, int col, int height, int width, int) override {
    if (height < 2 || width < 2) return;
    std::string edge = "+" + std::string(static_cast<size_t>(width - 2), '-') + "+";
    std::string mid = "|" + std::string(static_cast<size_t>(width - 2), ' ') + "|";
    put(row, col, edge);
    for (int r = 1; r < height - 1; ++r) put(row + r, col, mid);
    put(row + height - 1, col, edge);
  }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refreshes_++; }
  std::optional<InputEvent> poll_event(int) override {
    if (input_.empty()) return std::nullopt;
    InputEvent ev = input_.front();
    input_.pop_front();
    return ev;
  }

  void push_event(const InputEvent& ev) { input_.push_back(ev); }
  const std::string& line(int row) const { return grid_[static_cast<size_t>(row)]; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c >= 0 && c < cols_) grid_[static_cast<size_t>(row)][static_cast<size_t>(c)] = text[i];
    }
  }

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::deque<InputEvent> input_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = false;
  int refreshes_ = 0;
};
