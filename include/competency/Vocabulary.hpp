#pragma once

#include <string>
#include <utility>
#include <vector>

#include "competency/Models.hpp"

namespace competency {

using RawCategory = std::pair<std::string, std::vector<std::string>>;

// Validates and normalizes a raw vocabulary. Throws ConfigurationError on an empty
// vocabulary, an empty or duplicate category name, or a category with no usable skills.
CategoryVocabulary build_vocabulary(const std::vector<RawCategory>& raw);

// Built-in seven-category vocabulary used when no vocabulary file is configured.
const CategoryVocabulary& default_vocabulary();

}  // namespace competency
