#include "app.hpp"
#include <spdlog/spdlog.h>

void App::run() {
  spdlog::info("editing '{}'", editor_.state().title);
  while (step()) {}
  spdlog::info("quit");
}

bool App::step() {
  if (editor_.should_quit()) return false;
  ScreenLayout layout = compute_layout(term_.getSize(), settings_.display_width);
  editor_.set_viewport(layout.canvas.width, layout.canvas.height);
  renderer_.render(term_, editor_, layout);
  if (auto ev = term_.poll_event(kPollMs)) dispatch(*ev, layout);
  return !editor_.should_quit();
}

void App::dispatch(const InputEvent& ev, const ScreenLayout& layout) {
  if (auto* m = std::get_if<MouseEvent>(&ev)) {
    if (!settings_.mouse) return;
    MouseEvent me = *m;
    me.col -= layout.canvas.col;
    me.row -= layout.canvas.row;
    if (me.col < 0 || me.row < 0) return;
    editor_.handle_event(me);
    return;
  }
  editor_.handle_event(ev);
}
