#pragma once

#include <string>
#include <vector>

namespace vecsearch {

// Lowercased runs of word characters (ASCII letters, digits, '_') and
// apostrophes, in order of appearance.
std::vector<std::string> tokenize(const std::string& text);

} // namespace vecsearch
