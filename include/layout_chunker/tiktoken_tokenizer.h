/**
 * @file tiktoken_tokenizer.h
 * @brief Greedy longest-match tokenizer over a tiktoken vocabulary file
 *
 * Counts tokens the way chunk budgets need them counted: close to OpenAI's
 * tiktoken (cl100k_base and friends) without the BPE merge machinery.
 *
 * VOCABULARY:
 * The vocabulary is read at runtime from a `.tiktoken` file, one
 * "base64_token token_id" pair per line (the format published with tiktoken).
 * Each file is parsed once per process and shared by every tokenizer built
 * from the same path.
 *
 * ALGORITHM:
 * At each position the longest vocabulary entry (up to 20 bytes) wins; bytes
 * with no entry fall back to their byte value as token id. Real tiktoken picks
 * between competing splits by merge rank, so counts can drift by 1-3% on
 * punctuation-heavy or unusual Unicode text. That is well within what the
 * 32/1024 merge thresholds care about.
 *
 * USAGE:
 *   layout_chunker::TiktokenTokenizer tokenizer("cl100k_base.tiktoken");
 *   size_t n = tokenizer.count_tokens("Hello, world!");
 */

#pragma once

#include "layout_chunker/tokenizer.h"
#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace layout_chunker {

class TiktokenTokenizer : public Tokenizer {
private:
    struct Vocabulary {
        std::unordered_map<std::string, int> encoder;
        std::unordered_map<int, std::string> decoder;
        size_t max_token_bytes = 0;
    };

    static std::string base64_decode(const std::string& encoded) {
        static const std::string base64_chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string decoded;
        decoded.reserve(encoded.size() * 3 / 4);

        int val = 0;
        int valb = -8;
        for (unsigned char c : encoded) {
            if (c == '=') break;

            auto pos = base64_chars.find(c);
            if (pos == std::string::npos) continue;

            val = (val << 6) + static_cast<int>(pos);
            valb += 6;
            if (valb >= 0) {
                decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        return decoded;
    }

    static std::shared_ptr<const Vocabulary> parse_vocabulary(std::istream& stream) {
        auto vocab = std::make_shared<Vocabulary>();
        std::string line;

        while (std::getline(stream, line)) {
            size_t space_pos = line.find(' ');
            if (space_pos == std::string::npos) continue;

            std::string token = base64_decode(line.substr(0, space_pos));
            int token_id = std::stoi(line.substr(space_pos + 1));

            vocab->max_token_bytes = std::max(vocab->max_token_bytes, token.size());
            vocab->decoder[token_id] = token;
            vocab->encoder[std::move(token)] = token_id;
        }

        if (vocab->encoder.empty()) {
            throw std::runtime_error("tiktoken vocabulary is empty");
        }
        return vocab;
    }

    // Loaded once per path and shared across tokenizer instances
    static std::shared_ptr<const Vocabulary> load_vocabulary(const std::string& path) {
        static std::mutex cache_mutex;
        static std::map<std::string, std::shared_ptr<const Vocabulary>> cache;

        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = cache.find(path);
        if (it != cache.end()) return it->second;

        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Cannot open tiktoken vocabulary: " + path);
        }
        auto vocab = parse_vocabulary(file);
        cache.emplace(path, vocab);
        return vocab;
    }

    std::shared_ptr<const Vocabulary> vocab_;

public:
    explicit TiktokenTokenizer(const std::string& vocabulary_path)
        : vocab_(load_vocabulary(vocabulary_path)) {}

    std::vector<int> encode(const std::string& text) const {
        std::vector<int> tokens;
        size_t pos = 0;
        const size_t longest = std::min(vocab_->max_token_bytes, size_t(20));

        while (pos < text.length()) {
            size_t best_len = 0;
            int best_token = -1;

            size_t max_len = std::min(text.length() - pos, longest);
            for (size_t len = max_len; len > 0; --len) {
                auto it = vocab_->encoder.find(text.substr(pos, len));
                if (it != vocab_->encoder.end()) {
                    best_len = len;
                    best_token = it->second;
                    break;
                }
            }

            if (best_len > 0) {
                tokens.push_back(best_token);
                pos += best_len;
            } else {
                // Byte fallback (ids 0-255)
                tokens.push_back(static_cast<int>(static_cast<unsigned char>(text[pos])));
                pos++;
            }
        }

        return tokens;
    }

    std::string decode(const std::vector<int>& tokens) const {
        std::string result;
        for (int token : tokens) {
            auto it = vocab_->decoder.find(token);
            if (it != vocab_->decoder.end()) {
                result += it->second;
            } else if (token >= 0 && token < 256) {
                result += static_cast<char>(token);
            }
        }
        return result;
    }

    size_t count_tokens(const std::string& text) const override {
        return encode(text).size();
    }

    size_t vocabulary_size() const {
        return vocab_->encoder.size();
    }
};

} // namespace layout_chunker
