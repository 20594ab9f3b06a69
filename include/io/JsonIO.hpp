#pragma once
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "competency/Config.hpp"
#include "competency/Models.hpp"

// {"categories":[{"name":"...","skills":["..."]}]}. Throws competency::ConfigurationError.
competency::CategoryVocabulary loadVocabulary(const std::string& path);
competency::CategoryVocabulary parseVocabulary(const nlohmann::json& j);
nlohmann::json vocabularyToJson(const competency::CategoryVocabulary& vocab);

// {"skills":[...]}. A missing "skills" field gives nullopt; a wrong type throws
// competency::ValidationError.
std::optional<std::vector<std::string>> loadSkillRequest(const std::string& path);
std::optional<std::vector<std::string>> parseSkillRequest(const nlohmann::json& j);

// Overlays the keys present in the file onto cfg. Throws competency::ConfigurationError.
void loadAnalyzerConfig(const std::string& path, competency::AnalyzerConfig& cfg);
void applyAnalyzerConfig(const nlohmann::json& j, competency::AnalyzerConfig& cfg);
