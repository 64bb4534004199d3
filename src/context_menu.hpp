#pragma once
/*
 * ContextMenu
 *
 * Purpose: the right-click menu's fixed item table and its on-screen
 * rectangle, shared by the editor (hit testing) and the screen (drawing).
 */
#include <array>
#include <cstddef>
#include "types.hpp"

enum class MenuAction { NewBox, NewDiamond, NewText, NewFrame, Separator,
                        StartConnector, StartArrow, Delete, Cancel };

struct MenuItem {
  const char* label;
  MenuAction action;
};

inline constexpr std::array<MenuItem, 10> kMenuItems{{
  {" New Box ", MenuAction::NewBox},
  {" New Diamond ", MenuAction::NewDiamond},
  {" New Text ", MenuAction::NewText},
  {" New Frame ", MenuAction::NewFrame},
  {"---------", MenuAction::Separator},
  {" Start Connector ", MenuAction::StartConnector},
  {" Start Arrow ", MenuAction::StartArrow},
  {" Delete ", MenuAction::Delete},
  {"---------", MenuAction::Separator},
  {" Cancel ", MenuAction::Cancel},
}};

inline constexpr int kMenuItemCount = static_cast<int>(kMenuItems.size());
inline constexpr int kMenuWidth = 21;
inline constexpr int kMenuHeight = kMenuItemCount + 2;

inline bool menu_is_separator(int index) {
  return index >= 0 && index < kMenuItemCount &&
         kMenuItems[static_cast<std::size_t>(index)].action == MenuAction::Separator;
}

struct MenuRect { int x; int y; int width; int height; };

// Anchored at (x, y), pushed left/up so it stays inside the viewport.
inline MenuRect menu_rect(const ContextMenuMode& m, int view_cols, int view_rows) {
  int mx = m.x + kMenuWidth > view_cols ? view_cols - kMenuWidth : m.x;
  int my = m.y + kMenuHeight > view_rows ? view_rows - kMenuHeight : m.y;
  if (mx < 0) mx = 0;
  if (my < 0) my = 0;
  return {mx, my, kMenuWidth, kMenuHeight};
}
