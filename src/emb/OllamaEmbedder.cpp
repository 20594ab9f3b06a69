#include "emb/OllamaEmbedder.hpp"

#include <nlohmann/json.hpp>
#include <curl/curl.h>

#include "competency/Errors.hpp"

using json = nlohmann::json;
using competency::ProviderError;

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

OllamaEmbedder::OllamaEmbedder(const std::string& model, const std::string& endpoint, long timeout_ms)
    : m_model(model), m_endpoint(endpoint), m_timeout_ms(timeout_ms) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OllamaEmbedder::~OllamaEmbedder() {
    curl_global_cleanup();
}

std::string OllamaEmbedder::name() const {
    return "ollama:" + m_model;
}

std::string OllamaEmbedder::cache_key() const {
    return name() + "@" + m_endpoint;
}

std::vector<float> OllamaEmbedder::parse_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw ProviderError(std::string("OllamaEmbedder: malformed response: ") + e.what(), false);
    }

    if (!j.is_object() || !j.contains("embedding") || !j["embedding"].is_array()) {
        throw ProviderError("OllamaEmbedder: response has no embedding array", false);
    }

    const json& arr = j["embedding"];
    if (arr.empty()) {
        throw ProviderError("OllamaEmbedder: empty embedding", false);
    }

    std::vector<float> out;
    out.reserve(arr.size());
    for (const auto& x : arr) {
        if (!x.is_number()) {
            throw ProviderError("OllamaEmbedder: non-numeric embedding value", false);
        }
        out.push_back(x.get<float>());
    }
    return out;
}

std::vector<float> OllamaEmbedder::embed(const std::string& text) const {
    const std::string payload = json{{"model", m_model}, {"prompt", text}}
        .dump(-1, ' ', false, json::error_handler_t::replace);

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ProviderError("OllamaEmbedder: curl_easy_init failed", true);
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, m_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // required for timeouts off the main thread

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw ProviderError(std::string("OllamaEmbedder: request failed: ") + curl_easy_strerror(res), true);
    }
    if (status == 429 || status >= 500) {
        throw ProviderError("OllamaEmbedder: HTTP " + std::to_string(status), true);
    }
    if (status != 200) {
        throw ProviderError("OllamaEmbedder: HTTP " + std::to_string(status) + ": " + response, false);
    }

    return parse_response(response);
}
