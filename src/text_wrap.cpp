#include "text_wrap.hpp"

// Split after every space so the space stays with the word before it.
static std::vector<std::string_view> split_after_spaces(std::string_view para) {
  std::vector<std::string_view> words;
  size_t start = 0;
  for (size_t i = 0; i < para.size(); ++i) {
    if (para[i] == ' ') {
      words.push_back(para.substr(start, i + 1 - start));
      start = i + 1;
    }
  }
  if (start < para.size()) words.push_back(para.substr(start));
  return words;
}

static void wrap_paragraph(std::string_view para, size_t max, std::vector<std::string>& out) {
  std::vector<std::string> lines;
  std::string cur;
  for (std::string_view w : split_after_spaces(para)) {
    if (cur.size() + w.size() > max && !cur.empty()) {
      lines.push_back(std::move(cur));
      cur.clear();
    }
    while (w.size() > max) {
      lines.emplace_back(w.substr(0, max));
      w.remove_prefix(max);
    }
    cur.append(w);
  }
  if (!cur.empty()) lines.push_back(std::move(cur));
  if (lines.empty()) lines.emplace_back();
  for (auto& l : lines) out.push_back(std::move(l));
}

std::vector<std::string> wrap_text(std::string_view text, int max_width) {
  std::vector<std::string> out;
  if (max_width <= 0) return out;
  size_t max = static_cast<size_t>(max_width);
  size_t st = 0;
  while (true) {
    size_t pos = text.find('\n', st);
    if (pos == std::string_view::npos) { wrap_paragraph(text.substr(st), max, out); break; }
    wrap_paragraph(text.substr(st, pos - st), max, out);
    st = pos + 1;
  }
  return out;
}
