#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Point/Mode/input events).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <variant>

struct Point {
  int x = 0;
  int y = 0;
  bool operator==(const Point&) const = default;
};

struct NormalMode {};
struct InsertMode { int node_id = 0; };
struct LeaderMode {};
struct ResizeMode { int node_id = 0; };
struct HelpMode {};
struct ContextMenuMode { int x = 0; int y = 0; int selected_index = 0; };

using Mode = std::variant<NormalMode, InsertMode, LeaderMode, ResizeMode, HelpMode, ContextMenuMode>;

template <class... Fs> struct Overloaded : Fs... { using Fs::operator()...; };
template <class... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;

const char* mode_name(const Mode& m);

enum class Key { Char, Enter, Esc, Tab, BackTab, Backspace, Delete, Up, Down, Left, Right };

struct KeyEvent {
  Key key = Key::Char;
  char ch = 0;
};

enum class MouseAction { Down, Drag, Up, Move };
enum class MouseButton { None, Left, Right };

// Coordinates are screen cells relative to whoever consumes the event.
struct MouseEvent {
  MouseAction action = MouseAction::Move;
  MouseButton button = MouseButton::None;
  int col = 0;
  int row = 0;
};

using InputEvent = std::variant<KeyEvent, MouseEvent>;

inline KeyEvent key_char(char c) { return KeyEvent{Key::Char, c}; }
inline KeyEvent key(Key k) { return KeyEvent{k, 0}; }
