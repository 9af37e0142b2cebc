#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "application_record.hpp"

namespace app_retrieval {

constexpr int kDefaultEmbeddingDims = 1536;

// Offline feature-hashing embedder. Unigrams and adjacent bigrams are hashed
// with BLAKE2b into `dims` buckets and the result is L2-normalized.
class HashingEmbedder {
public:
    explicit HashingEmbedder(int dims = kDefaultEmbeddingDims);

    int dims() const { return dims_; }

    // Lowercased whitespace tokens followed by "a_b" bigrams.
    static std::vector<std::string> tokenize(const std::string& text);

    // Little-endian value of the first 8 bytes of BLAKE2b-512(token).
    static uint64_t hash_token(const std::string& token);

    std::vector<float> embed(const std::string& text) const;

    // Field-boosted document embedding for an indexed application.
    std::vector<float> embed_record(const ApplicationRecord& rec) const;
    static std::string boosted_document_text(const ApplicationRecord& rec);

private:
    int dims_;
};

std::vector<float> embed(const std::string& text, int dims = kDefaultEmbeddingDims);

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace app_retrieval
