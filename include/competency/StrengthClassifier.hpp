#pragma once

#include "competency/Config.hpp"
#include "competency/Models.hpp"

namespace competency {

// Lower bound of each band is inclusive. Total over every double; NaN maps to Weak.
Strength classify_strength(double score, const StrengthThresholds& t = {});

// Weak < Moderate < Strong
int strength_rank(Strength s);

}  // namespace competency
