#pragma once

#include <string>

namespace layout_chunker {

// Counts sub-word units; only the count is used by the chunking core
class Tokenizer {
public:
    virtual ~Tokenizer() = default;
    virtual size_t count_tokens(const std::string& text) const = 0;
};

// ~4 characters per token. Used when no vocabulary file is configured.
class EstimatingTokenizer : public Tokenizer {
public:
    size_t count_tokens(const std::string& text) const override {
        return (text.length() + 3) / 4;
    }
};

} // namespace layout_chunker
