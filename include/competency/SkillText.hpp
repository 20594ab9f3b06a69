#pragma once
#include <string>
#include <vector>

namespace competency {

// trim ASCII whitespace, lowercase ASCII, collapse inner whitespace runs to one space
std::string normalize_skill(const std::string& s);

// normalize every entry, drop empties, collapse duplicates keeping first-seen order
std::vector<std::string> normalize_skill_list(const std::vector<std::string>& raw);

}  // namespace competency
