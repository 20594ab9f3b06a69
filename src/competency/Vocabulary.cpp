#include "competency/Vocabulary.hpp"

#include <unordered_set>

#include "competency/Errors.hpp"
#include "competency/SkillText.hpp"

namespace competency {

CategoryVocabulary build_vocabulary(const std::vector<RawCategory>& raw) {
    if (raw.empty()) {
        throw ConfigurationError("vocabulary has no categories");
    }

    CategoryVocabulary vocab;
    vocab.categories.reserve(raw.size());

    std::unordered_set<std::string> names;

    for (const auto& [raw_name, raw_skills] : raw) {
        // category names are display labels: trim only, keep case
        const std::string name = [&] {
            size_t a = raw_name.find_first_not_of(" \t\r\n");
            if (a == std::string::npos) return std::string();
            size_t b = raw_name.find_last_not_of(" \t\r\n");
            return raw_name.substr(a, b - a + 1);
        }();

        if (name.empty()) {
            throw ConfigurationError("vocabulary contains a category with an empty name");
        }
        if (!names.insert(name).second) {
            throw ConfigurationError("vocabulary contains duplicate category: " + name);
        }

        CategoryDefinition def;
        def.name = name;

        std::unordered_set<std::string> keys;
        for (const auto& s : raw_skills) {
            std::string key = normalize_skill(s);
            if (key.empty()) continue;
            if (!keys.insert(key).second) continue;

            size_t a = s.find_first_not_of(" \t\r\n");
            size_t b = s.find_last_not_of(" \t\r\n");
            def.skills.push_back(CanonicalSkill{s.substr(a, b - a + 1), std::move(key)});
        }

        if (def.skills.empty()) {
            throw ConfigurationError("category has no canonical skills: " + name);
        }

        vocab.categories.push_back(std::move(def));
    }

    return vocab;
}

const CategoryVocabulary& default_vocabulary() {
    static const CategoryVocabulary vocab = build_vocabulary({
        {"Programming Languages", {"Python", "Java", "JavaScript", "TypeScript", "C++", "Go", "Rust", "Swift", "Kotlin"}},
        {"Frontend",              {"React", "Vue", "Angular", "HTML", "CSS", "Tailwind CSS", "Next.js", "Redux"}},
        {"Backend",               {"Node.js", "Django", "Flask", "FastAPI", "Spring Boot", "Express.js", "REST API", "GraphQL"}},
        {"Databases",             {"PostgreSQL", "MongoDB", "MySQL", "Redis", "Elasticsearch", "SQL", "NoSQL"}},
        {"Cloud & DevOps",        {"AWS", "Azure", "GCP", "Docker", "Kubernetes", "Terraform", "CI/CD", "Jenkins", "Git"}},
        {"Data Science",          {"Machine Learning", "Deep Learning", "Data Science", "AI", "NLP", "TensorFlow", "PyTorch", "Pandas"}},
        {"Tools & Others",        {"Git", "Linux", "Agile", "Scrum", "Microservices", "System Design"}},
    });
    return vocab;
}

}  // namespace competency
