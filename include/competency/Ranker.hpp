#pragma once

#include <map>
#include <string>
#include <vector>

#include "competency/Models.hpp"

namespace competency {

// Every category, score descending, equal scores by name ascending.
// Callers truncate for display; the ranking itself is never cut.
std::vector<RankedCategory> rank_categories(const std::map<std::string, CategoryScore>& analysis);

}  // namespace competency
