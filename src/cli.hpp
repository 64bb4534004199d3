#pragma once
/*
 * Cli
 *
 * Purpose: turn argv into what to open: prompt for a title, start new,
 * open strictly, or open-if-present.
 */
#include <string>
#include <vector>

#define MGRAM_DEFAULT_TITLE "Untitled Diagram"

enum class CliAction { Prompt, New, Open, Auto, Usage };

struct CliRequest {
  CliAction action = CliAction::Prompt;
  std::string title;
};

// args excludes argv[0].
CliRequest parse_cli(const std::vector<std::string>& args);
std::string title_or_default(const std::string& input);
