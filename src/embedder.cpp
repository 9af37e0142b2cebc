#include "embedder.hpp"
#include "text_utils.hpp"
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/opensslv.h>
#include <openssl/params.h>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace app_retrieval {

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) {
        EVP_MD_CTX_free(ctx);
    }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

static DigestCtx make_digest_ctx() {
    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    return ctx;
}

// Little-endian BLAKE2b with an 8-byte digest. OpenSSL before 3.2 cannot
// shorten the digest, so there the first 8 bytes of BLAKE2b-512 are used.
static uint64_t blake2b_u64(EVP_MD_CTX* ctx, const std::string& token) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
#if OPENSSL_VERSION_PREREQ(3, 2)
    size_t digest_size = 8;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_DIGEST_PARAM_SIZE, &digest_size),
        OSSL_PARAM_construct_end()
    };
    int ok = EVP_DigestInit_ex2(ctx, EVP_blake2b512(), params);
#else
    int ok = EVP_DigestInit_ex(ctx, EVP_blake2b512(), nullptr);
#endif
    if (ok != 1 ||
        EVP_DigestUpdate(ctx, token.data(), token.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest, &len) != 1 || len < 8) {
        throw std::runtime_error("BLAKE2b digest failed");
    }
    uint64_t h = 0;
    for (int i = 7; i >= 0; --i) {
        h = (h << 8) | digest[i];
    }
    return h;
}

HashingEmbedder::HashingEmbedder(int dims) : dims_(dims) {
    if (dims_ <= 0) throw std::invalid_argument("embedding dims must be positive");
}

std::vector<std::string> HashingEmbedder::tokenize(const std::string& text) {
    auto tokens = split_whitespace(to_lower_ascii(text));
    size_t unigrams = tokens.size();
    for (size_t i = 0; i + 1 < unigrams; ++i) {
        tokens.push_back(tokens[i] + "_" + tokens[i + 1]);
    }
    return tokens;
}

uint64_t HashingEmbedder::hash_token(const std::string& token) {
    auto ctx = make_digest_ctx();
    return blake2b_u64(ctx.get(), token);
}

std::vector<float> HashingEmbedder::embed(const std::string& text) const {
    std::vector<float> vec(static_cast<size_t>(dims_), 0.0f);
    auto ctx = make_digest_ctx();
    for (const auto& tok : tokenize(text)) {
        uint64_t bucket = blake2b_u64(ctx.get(), tok) % static_cast<uint64_t>(dims_);
        vec[bucket] += 1.0f;
    }

    double norm2 = 0.0;
    for (float v : vec) norm2 += static_cast<double>(v) * v;
    if (norm2 > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm2));
        for (auto& v : vec) v *= inv;
    }
    return vec;
}

std::string HashingEmbedder::boosted_document_text(const ApplicationRecord& rec) {
    std::vector<std::string> parts;
    auto repeat = [&parts](const std::string& s, int times) {
        for (int i = 0; i < times; ++i) parts.push_back(s);
    };

    repeat(rec.company, 5);
    repeat(rec.role, 4);
    for (int i = 0; i < 3; ++i) {
        for (const auto& tag : rec.tags) parts.push_back(tag);
    }
    repeat(rec.application_method, 2);
    repeat(rec.status, 2);
    repeat(rec.context_bundle_text, 2);
    repeat(rec.notes, 1);
    repeat(rec.rag_text, 1);
    return join(parts, " ");
}

std::vector<float> HashingEmbedder::embed_record(const ApplicationRecord& rec) const {
    return embed(boosted_document_text(rec));
}

std::vector<float> embed(const std::string& text, int dims) {
    return HashingEmbedder(dims).embed(text);
}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

} // namespace app_retrieval
