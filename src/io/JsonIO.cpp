#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

#include "competency/Errors.hpp"
#include "competency/Vocabulary.hpp"

using json = nlohmann::json;
using competency::ConfigurationError;
using competency::ValidationError;

static json read_json_file(const std::string& path, const std::string& what) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("failed to open " + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("failed to parse " + what + " JSON (" + path + "): " + e.what());
    }
    return j;
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ConfigurationError(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigurationError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw ConfigurationError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ConfigurationError(where + " missing required field: " + std::string(key));
    }
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw ConfigurationError(where + "." + std::string(key) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw ConfigurationError(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

// ---------- vocabulary ----------

competency::CategoryVocabulary parseVocabulary(const json& j) {
    require_object(j, "vocabulary");

    if (!j.contains("categories") || !j.at("categories").is_array()) {
        throw ConfigurationError("vocabulary.categories must be an array");
    }
    const json& cats = j.at("categories");

    std::vector<competency::RawCategory> raw;
    raw.reserve(cats.size());
    for (size_t i = 0; i < cats.size(); ++i) {
        std::ostringstream oss;
        oss << "vocabulary.categories[" << i << "]";
        const std::string where = oss.str();

        require_object(cats.at(i), where);
        raw.emplace_back(require_string(cats.at(i), "name", where),
                         require_string_array(cats.at(i), "skills", where));
    }

    return competency::build_vocabulary(raw);
}

competency::CategoryVocabulary loadVocabulary(const std::string& path) {
    return parseVocabulary(read_json_file(path, "vocabulary"));
}

json vocabularyToJson(const competency::CategoryVocabulary& vocab) {
    json cats = json::array();
    for (const auto& c : vocab.categories) {
        json skills = json::array();
        for (const auto& s : c.skills) skills.push_back(s.display);
        cats.push_back({{"name", c.name}, {"skills", skills}});
    }
    return {{"categories", cats}};
}

// ---------- request ----------

std::optional<std::vector<std::string>> parseSkillRequest(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("request must be an object");
    }
    if (!j.contains("skills") || j.at("skills").is_null()) {
        return std::nullopt;
    }

    const json& arr = j.at("skills");
    if (!arr.is_array()) {
        throw ValidationError("request.skills must be an array");
    }

    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            throw ValidationError("request.skills[" + std::to_string(i) + "] must be a string");
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

std::optional<std::vector<std::string>> loadSkillRequest(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("failed to open request file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("failed to parse request JSON: ") + e.what());
    }
    return parseSkillRequest(j);
}

// ---------- config ----------

template <typename T>
static void read_number(const json& obj, const char* key, const std::string& where, T& out) {
    if (!obj.contains(key)) return;
    const json& v = obj.at(key);
    if (!v.is_number()) {
        throw ConfigurationError(where + "." + key + " must be a number");
    }
    if constexpr (std::is_unsigned_v<T>) {
        if (!v.is_number_unsigned()) {
            throw ConfigurationError(where + "." + key + " must be a non-negative integer");
        }
        if (v.get<uint64_t>() > (uint64_t)std::numeric_limits<T>::max()) {
            throw ConfigurationError(where + "." + key + " is out of range");
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (!v.is_number_integer()) {
            throw ConfigurationError(where + "." + key + " must be an integer");
        }
        // unsigned JSON values above int64 max cannot fit any signed target
        if (v.is_number_unsigned() && v.get<uint64_t>() > (uint64_t)std::numeric_limits<int64_t>::max()) {
            throw ConfigurationError(where + "." + key + " is out of range");
        }
        const int64_t x = v.get<int64_t>();
        if (x < (int64_t)std::numeric_limits<T>::min() || x > (int64_t)std::numeric_limits<T>::max()) {
            throw ConfigurationError(where + "." + key + " is out of range");
        }
    }
    out = v.get<T>();
}

static void read_string(const json& obj, const char* key, const std::string& where, std::string& out) {
    if (!obj.contains(key)) return;
    if (!obj.at(key).is_string()) {
        throw ConfigurationError(where + "." + key + " must be a string");
    }
    out = obj.at(key).get<std::string>();
}

static const json* section(const json& j, const char* key) {
    if (!j.contains(key)) return nullptr;
    const json& s = j.at(key);
    require_object(s, std::string("config.") + key);
    return &s;
}

void applyAnalyzerConfig(const json& j, competency::AnalyzerConfig& cfg) {
    require_object(j, "config");

    if (const json* s = section(j, "scoring")) {
        read_number(*s, "top_k", "config.scoring", cfg.scoring.top_k);
    }
    if (const json* s = section(j, "thresholds")) {
        read_number(*s, "moderate", "config.thresholds", cfg.thresholds.moderate);
        read_number(*s, "strong", "config.thresholds", cfg.thresholds.strong);
    }
    if (const json* s = section(j, "recommendation")) {
        read_number(*s, "max_recommendations", "config.recommendation", cfg.recommendation.max_recommendations);
    }
    if (const json* s = section(j, "batch")) {
        read_number(*s, "max_concurrency", "config.batch", cfg.batch.max_concurrency);
        read_number(*s, "max_attempts", "config.batch", cfg.batch.max_attempts);
        read_number(*s, "initial_backoff_ms", "config.batch", cfg.batch.initial_backoff_ms);
        read_number(*s, "max_backoff_ms", "config.batch", cfg.batch.max_backoff_ms);
        read_number(*s, "request_timeout_ms", "config.batch", cfg.batch.request_timeout_ms);
    }
    if (const json* s = section(j, "provider")) {
        read_string(*s, "backend", "config.provider", cfg.provider.backend);
        read_string(*s, "model_path", "config.provider", cfg.provider.model_path);
        read_string(*s, "vocab_path", "config.provider", cfg.provider.vocab_path);
        read_number(*s, "max_len", "config.provider", cfg.provider.max_len);
        read_string(*s, "ollama_model", "config.provider", cfg.provider.ollama_model);
        read_string(*s, "ollama_endpoint", "config.provider", cfg.provider.ollama_endpoint);
        read_number(*s, "call_timeout_ms", "config.provider", cfg.provider.call_timeout_ms);
        read_number(*s, "hash_dim", "config.provider", cfg.provider.hash_dim);
    }

    read_number(j, "top_categories_display", "config", cfg.top_categories_display);
    read_string(j, "centroid_cache", "config", cfg.centroid_cache_path);

    competency::validate_config(cfg);
}

void loadAnalyzerConfig(const std::string& path, competency::AnalyzerConfig& cfg) {
    applyAnalyzerConfig(read_json_file(path, "config"), cfg);
}
