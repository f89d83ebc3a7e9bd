#include "terminal.hpp"

#include <string>

namespace fsutils {
namespace terminal {

std::string highlight(const std::string& text) {
  return std::string(green) + text + reset;
}

std::string highlight_all(const std::string& text, const std::string& term) {
  if (term.empty()) {
    return text;
  }

  std::string result;
  size_t pos = 0;
  size_t match;
  while ((match = text.find(term, pos)) != std::string::npos) {
    result.append(text, pos, match - pos);
    result += highlight(term);
    pos = match + term.size();
  }
  result.append(text, pos, std::string::npos);
  return result;
}

std::string strip_escapes(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      // Skip parameters up to and including the final byte
      size_t j = i + 2;
      while (j < text.size() && !(text[j] >= 0x40 && text[j] <= 0x7e)) {
        ++j;
      }
      i = j;
      continue;
    }
    result += text[i];
  }
  return result;
}

size_t display_width(const std::string& text) {
  size_t width = 0;
  for (unsigned char c : strip_escapes(text)) {
    // Continuation bytes belong to the previous character
    if ((c & 0xC0) != 0x80) {
      ++width;
    }
  }
  return width;
}

}  // namespace terminal
}  // namespace fsutils
