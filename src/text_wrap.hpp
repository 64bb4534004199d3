#pragma once
/*
 * TextWrap
 *
 * Purpose: greedy word wrap used by the canvas and by the insert caret.
 * Rule: each '\n' paragraph wraps on its own and yields at least one line;
 * words keep their trailing space; words wider than the limit are cut into
 * max_width chunks. max_width == 0 yields no lines.
 */
#include <string>
#include <string_view>
#include <vector>

std::vector<std::string> wrap_text(std::string_view text, int max_width);
