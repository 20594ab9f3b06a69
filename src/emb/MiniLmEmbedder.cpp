#include "emb/MiniLmEmbedder.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

#include "competency/Errors.hpp"
#include "competency/VectorMath.hpp"

// "<size>-<mtime ticks>", empty if the file cannot be stat'ed
static std::string file_stamp(const std::string& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return "";
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return std::to_string(size);
    return std::to_string(size) + "-" + std::to_string((long long)mtime.time_since_epoch().count());
}

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path) {
    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "MiniLmEmbedder: failed to load vocab: " << vocab_path << "\n";
        return false;
    }
    if (!std::filesystem::exists(model_path)) {
        std::cerr << "MiniLmEmbedder: model not found: " << model_path << "\n";
        return false;
    }

    try {
        // embed() is called from several worker threads; keep each run single-threaded
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(model_path.begin(), model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        auto name_alloc = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = name_alloc.get();

        // some exports drop token_type_ids
        m_num_inputs = m_session->GetInputCount();
        if (m_num_inputs < 2 || m_num_inputs > 3) {
            std::cerr << "MiniLmEmbedder: unexpected input count " << m_num_inputs << "\n";
            m_session.reset();
            return false;
        }
        auto in0 = m_session->GetInputNameAllocated(0, allocator);
        auto in1 = m_session->GetInputNameAllocated(1, allocator);
        m_in_ids = in0.get();
        m_in_mask = in1.get();
        if (m_num_inputs == 3) {
            auto in2 = m_session->GetInputNameAllocated(2, allocator);
            m_in_type = in2.get();
        }

        m_model_path = model_path;
        m_cache_key = name() + ":" + file_stamp(model_path) + ":" + file_stamp(vocab_path);
        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        m_session.reset();
        return false;
    }
}

std::string MiniLmEmbedder::name() const {
    return "onnx:" + std::filesystem::path(m_model_path).filename().string();
}

std::string MiniLmEmbedder::cache_key() const {
    return m_cache_key.empty() ? name() : m_cache_key;
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!m_session) {
        throw competency::ProviderError("MiniLmEmbedder: not initialized", false);
    }

    WordPieceEncoding enc = m_tok.encode(text, m_max_len);
    const size_t seq_len = enc.ids.size();

    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> in_vals;
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, enc.ids.data(), enc.ids.size(), shape.data(), shape.size()));
    in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, enc.attention.data(), enc.attention.size(), shape.data(), shape.size()));
    if (m_num_inputs == 3) {
        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, enc.type_ids.data(), enc.type_ids.size(), shape.data(), shape.size()));
    }

    const char* in_names[3] = { m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, in_vals.data(), in_vals.size(), out_names, 1);
    } catch (const Ort::Exception& e) {
        throw competency::ProviderError(std::string("MiniLmEmbedder: run failed: ") + e.what(), false);
    }

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[2] <= 0) {
        throw competency::ProviderError("MiniLmEmbedder: unexpected output rank", false);
    }

    const int64_t hidden = shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled((size_t)hidden, 0.0f);
    double denom = 0.0;

    // output is contiguous as [1, seq_len, hidden]
    for (size_t t = 0; t < seq_len; ++t) {
        if (enc.attention[t] == 0) continue;
        denom += 1.0;
        const float* row = data + (t * (size_t)hidden);
        for (size_t j = 0; j < (size_t)hidden; ++j) pooled[j] += row[j];
    }

    if (denom > 0.0) {
        float inv = (float)(1.0 / denom);
        for (float& x : pooled) x *= inv;
    }

    competency::l2_normalize(pooled);
    return pooled;
}
