#include "competency/SkillText.hpp"

#include <cctype>
#include <unordered_set>

namespace competency {

static bool is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string normalize_skill(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;

    for (unsigned char ch : s) {
        if (is_ws(ch)) {
            // leading whitespace never emits a separator
            if (!out.empty()) pending_space = true;
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
    }

    return out;
}

std::vector<std::string> normalize_skill_list(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    out.reserve(raw.size());

    std::unordered_set<std::string> seen;
    seen.reserve(raw.size() * 2 + 8);

    for (const auto& r : raw) {
        std::string s = normalize_skill(r);
        if (s.empty()) continue;
        if (!seen.insert(s).second) continue;
        out.push_back(std::move(s));
    }

    return out;
}

}  // namespace competency
