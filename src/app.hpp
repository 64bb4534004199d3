#pragma once
/*
 * App
 *
 * Purpose: the event loop. Renders a frame, waits up to kPollMs for input,
 * maps mouse cells into canvas-local ones and feeds the Editor.
 */
#include "config.hpp"
#include "editor.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"

class App {
public:
  static constexpr int kPollMs = 16;

  App(ITerminal& term, Editor& editor, const Settings& settings)
      : term_(term), editor_(editor), settings_(settings) {}

  void run();
  // One render + poll + dispatch round; false once the editor wants to quit.
  bool step();
  void dispatch(const InputEvent& ev, const ScreenLayout& layout);

private:
  ITerminal& term_;
  Editor& editor_;
  const Settings& settings_;
  Renderer renderer_;
};
