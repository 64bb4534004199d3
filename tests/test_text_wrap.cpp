#include "text_wrap.hpp"
#include <cassert>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

static size_t count_paragraphs(const std::string& s) {
  size_t n = 1;
  for (char c : s) if (c == '\n') n++;
  return n;
}

int main() {
  assert(wrap_text("anything", 0).empty());
  assert(wrap_text("", 5) == Lines{""});
  assert(wrap_text("a\n\nb", 5) == (Lines{"a", "", "b"}));

  // trailing spaces stay with the word before them
  assert(wrap_text("the quick brown", 10) == (Lines{"the quick ", "brown"}));
  assert(wrap_text("ab cd", 10) == Lines{"ab cd"});

  // long words are cut into width-sized chunks
  assert(wrap_text("abcdefgh", 3) == (Lines{"abc", "def", "gh"}));
  assert(wrap_text("hello world", 5) == (Lines{"hello", " ", "world"}));

  const std::string samples[] = {
    "Start", "Process the order\nthen ship", "a b c d e f g", "supercalifragilistic word",
    "\n\n", "trailing space ", "x\ny\nz",
  };
  for (const auto& s : samples) {
    for (int w = 1; w <= 12; ++w) {
      Lines out = wrap_text(s, w);
      for (const auto& l : out) assert(static_cast<int>(l.size()) <= w);
      assert(out.size() >= count_paragraphs(s));
      assert(wrap_text(s, w) == out);
    }
  }
  return 0;
}
