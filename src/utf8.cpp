#include "utf8.hpp"

#include <string>

namespace fsutils {
namespace utf8 {

namespace {

// Length of the valid sequence starting at index, or the number of bytes in
// the invalid prefix (negated) when the sequence is ill-formed.
int sequence_length(const std::string& text, size_t index) {
  unsigned char lead = static_cast<unsigned char>(text[index]);
  if (lead < 0x80) {
    return 1;
  }

  int length;
  unsigned char lower = 0x80;
  unsigned char upper = 0xBF;

  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  }
  else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) lower = 0xA0;  // overlong
    if (lead == 0xED) upper = 0x9F;  // surrogates
  }
  else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) lower = 0x90;  // overlong
    if (lead == 0xF4) upper = 0x8F;  // above U+10FFFF
  }
  else {
    return -1;
  }

  size_t remaining = text.size() - index;
  for (int i = 1; i < length; ++i) {
    if (static_cast<size_t>(i) >= remaining) {
      return -i;
    }
    unsigned char b = static_cast<unsigned char>(text[index + i]);
    if (i == 1 ? (b < lower || b > upper) : (b & 0xC0) != 0x80) {
      return -i;
    }
  }
  return length;
}

}  // namespace

std::string decode_lossy(const std::string& bytes) {
  std::string output;
  output.reserve(bytes.size());

  size_t index = 0;
  while (index < bytes.size()) {
    int length = sequence_length(bytes, index);
    if (length > 0) {
      output.append(bytes, index, static_cast<size_t>(length));
      index += static_cast<size_t>(length);
    }
    else {
      output += replacement;
      index += static_cast<size_t>(-length);
    }
  }
  return output;
}

bool is_valid(const std::string& bytes) {
  size_t index = 0;
  while (index < bytes.size()) {
    int length = sequence_length(bytes, index);
    if (length < 0) {
      return false;
    }
    index += static_cast<size_t>(length);
  }
  return true;
}

}  // namespace utf8
}  // namespace fsutils
