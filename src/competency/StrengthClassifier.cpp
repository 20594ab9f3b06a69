#include "competency/StrengthClassifier.hpp"

namespace competency {

Strength classify_strength(double score, const StrengthThresholds& t) {
    if (score >= t.strong) return Strength::Strong;
    if (score >= t.moderate) return Strength::Moderate;
    return Strength::Weak;
}

int strength_rank(Strength s) {
    switch (s) {
        case Strength::Weak: return 0;
        case Strength::Moderate: return 1;
        case Strength::Strong: return 2;
    }
    return 0;
}

const char* strength_str(Strength s) {
    switch (s) {
        case Strength::Weak: return "Weak";
        case Strength::Moderate: return "Moderate";
        case Strength::Strong: return "Strong";
        default: return "unknown";
    }
}

}  // namespace competency
