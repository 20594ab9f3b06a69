#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }

    // a vocab without the special tokens cannot frame a sequence
    return !m_id_to_tok.empty() &&
           m_tok_to_id.count("[CLS]") && m_tok_to_id.count("[SEP]") && m_tok_to_id.count("[UNK]");
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

bool WordPieceTokenizer::is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool WordPieceTokenizer::is_punct(unsigned char c) {
    return ((c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
            (c >= 91 && c <= 96) || (c >= 123 && c <= 126));
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]() {
        if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    };

    for (unsigned char c : text) {
        if (is_ws(c)) {
            flush();
        } else if (is_punct(c)) {
            // "c++" -> "c", "+", "+"; "ci/cd" -> "ci", "/", "cd"
            flush();
            out.emplace_back(1, (char)c);
        } else if (c < 0x80) {
            cur.push_back((char)std::tolower(c));
        } else {
            // UTF-8 continuation and lead bytes pass through unchanged
            cur.push_back((char)c);
        }
    }
    flush();
    return out;
}

std::vector<int64_t> WordPieceTokenizer::wordpiece(const std::string& word) const {
    const int64_t unk = unk_id();
    if (word.empty() || word.size() > kMaxCharsPerWord) return {unk};

    std::vector<int64_t> pieces;
    size_t start = 0;

    while (start < word.size()) {
        size_t end = word.size();
        int64_t found = -1;

        while (end > start) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub = "##" + sub;

            auto it = m_tok_to_id.find(sub);
            if (it != m_tok_to_id.end()) {
                found = it->second;
                break;
            }
            --end;
        }

        if (found < 0) return {unk};
        pieces.push_back(found);
        start = end;
    }

    return pieces;
}

WordPieceEncoding WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    WordPieceEncoding enc;
    if (max_len < 2) max_len = 2;

    enc.ids.reserve(max_len);
    enc.ids.push_back(cls_id());

    for (const auto& w : basic_tokenize(text)) {
        for (int64_t id : wordpiece(w)) {
            if (enc.ids.size() + 1 >= max_len) break; // keep room for [SEP]
            enc.ids.push_back(id);
        }
        if (enc.ids.size() + 1 >= max_len) break;
    }

    enc.ids.push_back(sep_id());
    enc.attention.assign(enc.ids.size(), 1);
    enc.type_ids.assign(enc.ids.size(), 0);
    return enc;
}
