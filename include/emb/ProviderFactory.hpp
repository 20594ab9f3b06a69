#pragma once
#include <memory>

#include "competency/Config.hpp"
#include "emb/EmbeddingProvider.hpp"

// Builds the configured backend (onnx | ollama | hash). Throws competency::ConfigurationError
// if the backend is unknown or fails to initialize.
std::shared_ptr<const EmbeddingProvider> create_embedding_provider(const competency::ProviderConfig& cfg);
