#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "diagram_file.hpp"
#include "editor.hpp"
#include "logging.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"
#include "workspace.hpp"
#include <csignal>
#include <cstdio>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  Config config;
  std::string rc_msg;
  bool rc_ok = true;
  if (auto rc = Config::default_rc_path()) rc_ok = config.load_rc(*rc, rc_msg);
  const Settings& settings = config.settings();

  std::string log_msg;
  init_logging(settings.log_file, settings.log_level, log_msg);
  if (!rc_ok) spdlog::warn("{}", rc_msg);

  CliRequest req = parse_cli(std::vector<std::string>(argv + 1, argv + argc));
  Diagram diagram;
  std::string msg;
  switch (req.action) {
    case CliAction::Usage:
      std::cout << "Usage: mgram open <title>" << std::endl;
      return 0;
    case CliAction::Prompt: {
      std::cout << "Enter a title for your diagram:" << std::endl;
      std::string line;
      std::getline(std::cin, line);
      diagram.title = title_or_default(line);
      break;
    }
    case CliAction::New:
      diagram.title = req.title;
      break;
    case CliAction::Open:
      if (!open_or_create(req.title, settings.save_dir, diagram, msg)) std::cout << "Error: " << msg << std::endl;
      break;
    case CliAction::Auto:
      if (!open_or_create(req.title, settings.save_dir, diagram, msg)) spdlog::info("{}", msg);
      break;
  }

  FileWorkspace workspace(settings.save_dir);
  Editor editor(EditorState::from_diagram(std::move(diagram)), workspace, settings);
  if (!rc_ok) editor.set_message(rc_msg);

  Terminal term(settings.mouse);
  if (!term.ok()) {
    std::fprintf(stderr, "mgram: can not initialise terminal\n");
    return 1;
  }
  NcursesTerminal nterm(settings.color);
  App app(nterm, editor, settings);
  app.run();
  return 0;
}
