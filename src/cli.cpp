#include "cli.hpp"
#include <cctype>

static std::string join(const std::vector<std::string>& parts, size_t from) {
  std::string out;
  for (size_t i = from; i < parts.size(); ++i) {
    if (i > from) out += ' ';
    out += parts[i];
  }
  return out;
}

CliRequest parse_cli(const std::vector<std::string>& args) {
  if (args.empty()) return {CliAction::Prompt, {}};
  if (args[0] == "new") {
    return {CliAction::New, args.size() > 1 ? join(args, 1) : MGRAM_DEFAULT_TITLE};
  }
  if (args[0] == "open") {
    if (args.size() < 2) return {CliAction::Usage, {}};
    return {CliAction::Open, join(args, 1)};
  }
  return {CliAction::Auto, join(args, 0)};
}

std::string title_or_default(const std::string& input) {
  size_t i = 0, j = input.size();
  while (i < j && std::isspace(static_cast<unsigned char>(input[i]))) i++;
  while (j > i && std::isspace(static_cast<unsigned char>(input[j - 1]))) j--;
  if (i == j) return MGRAM_DEFAULT_TITLE;
  return input.substr(i, j - i);
}
