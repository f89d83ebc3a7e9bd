#pragma once

#include <string>

namespace fsutils {
namespace utf8 {

// U+FFFD REPLACEMENT CHARACTER
constexpr const char* replacement = "\xEF\xBF\xBD";

// Returns the input with every ill-formed UTF-8 sequence replaced by U+FFFD.
// Each maximal invalid subpart is replaced by a single replacement character.
std::string decode_lossy(const std::string& bytes);

// Returns true if the input is well-formed UTF-8
bool is_valid(const std::string& bytes);

}  // namespace utf8
}  // namespace fsutils
