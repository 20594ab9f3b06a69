#pragma once

#include <stdexcept>
#include <string>

namespace competency {

// Vocabulary or settings are unusable. Fatal at startup.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Embedding provider failed for one input. transient() == true means a retry may succeed
// (unreachable endpoint, 429/5xx); false means the output was unusable.
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& what, bool transient)
        : std::runtime_error(what), m_transient(transient) {}

    bool transient() const { return m_transient; }

private:
    bool m_transient = false;
};

// Request input rejected before scoring.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Embedding did not finish before the request deadline.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace competency
