#pragma once

#include <string>

namespace fsutils {
namespace terminal {

constexpr const char* green = "\x1b[32m";
constexpr const char* reset = "\x1b[0m";

// Wraps the whole text in green
std::string highlight(const std::string& text);

// Wraps every literal occurrence of term inside text in green.
// An empty term leaves the text unchanged.
std::string highlight_all(const std::string& text, const std::string& term);

// Removes CSI escape sequences ("ESC [ ... letter")
std::string strip_escapes(const std::string& text);

// Number of characters a terminal shows for the text: escape sequences are
// not counted and a multi-byte UTF-8 sequence counts once.
size_t display_width(const std::string& text);

}  // namespace terminal
}  // namespace fsutils
