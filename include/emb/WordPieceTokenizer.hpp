#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct WordPieceEncoding {
    std::vector<int64_t> ids;         // [CLS] ... [SEP]
    std::vector<int64_t> attention;   // 1 per real token
    std::vector<int64_t> type_ids;    // single segment, all 0
};

class WordPieceTokenizer {
public:
    bool load_vocab(const std::string& vocab_path);

    // Uncased BERT tokenization truncated to max_len (including [CLS]/[SEP]).
    WordPieceEncoding encode(const std::string& text, size_t max_len) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t unk_id() const { return id_or(0, "[UNK]"); }
    int64_t cls_id() const { return id_or(101, "[CLS]"); }
    int64_t sep_id() const { return id_or(102, "[SEP]"); }

private:
    // BERT refuses to split words longer than this and emits [UNK] instead
    static constexpr size_t kMaxCharsPerWord = 100;

    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    static bool is_ws(unsigned char c);
    static bool is_punct(unsigned char c);

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    std::vector<int64_t> wordpiece(const std::string& word) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};
