#include "lexical_index.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace app_retrieval {

namespace {

const std::vector<std::string> kIndexedFields = {
    "text", "context_bundle_text", "company", "role", "notes"
};

} // namespace

std::vector<std::string> LexicalIndex::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c >= 0x80 || std::isalnum(c)) {
            current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

const std::string* LexicalIndex::field_text(const ApplicationRecord& rec, const std::string& field) {
    if (field == "text") return &rec.rag_text;
    if (field == "context_bundle_text") return &rec.context_bundle_text;
    if (field == "company") return &rec.company;
    if (field == "role") return &rec.role;
    if (field == "notes") return &rec.notes;
    return nullptr;
}

bool LexicalIndex::is_known_field(const std::string& field) {
    return std::find(kIndexedFields.begin(), kIndexedFields.end(), field) != kIndexedFields.end();
}

void LexicalIndex::rebuild(const std::vector<std::shared_ptr<ApplicationRecord>>& records) {
    docs_.clear();
    docs_.reserve(records.size());
    for (const auto& rec : records) {
        Document doc;
        doc.record = rec;
        for (const auto& field : kIndexedFields) {
            FieldStats stats;
            for (auto& tok : tokenize(*field_text(*rec, field))) {
                ++stats.tf[tok];
                ++stats.length;
            }
            doc.fields.emplace(field, std::move(stats));
        }
        docs_.push_back(std::move(doc));
    }
    spdlog::debug("BM25 index rebuilt over {} records", docs_.size());
}

std::vector<LexicalHit> LexicalIndex::search(const std::string& query,
                                             const std::vector<std::string>& fields,
                                             int limit) const {
    if (docs_.empty() || limit <= 0) return {};

    std::vector<std::string> active;
    for (const auto& f : fields) {
        if (is_known_field(f)) active.push_back(f);
        else spdlog::debug("BM25: ignoring unknown field '{}'", f);
    }
    if (active.empty()) return {};

    // Distinct query terms, first-seen order.
    std::vector<std::string> terms;
    std::unordered_set<std::string> seen;
    for (auto& tok : tokenize(query)) {
        if (seen.insert(tok).second) terms.push_back(std::move(tok));
    }
    if (terms.empty()) return {};

    const size_t n = docs_.size();
    std::vector<int> doc_len(n, 0);
    std::vector<TermFreqs> doc_tf(n);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& f : active) {
            const auto& stats = docs_[i].fields.at(f);
            doc_len[i] += stats.length;
            for (const auto& term : terms) {
                auto it = stats.tf.find(term);
                if (it != stats.tf.end()) doc_tf[i][term] += it->second;
            }
        }
    }

    double avg_len = static_cast<double>(std::accumulate(doc_len.begin(), doc_len.end(), 0LL)) / n;
    if (avg_len <= 0.0) return {};

    std::unordered_map<std::string, int> df;
    for (const auto& tfs : doc_tf) {
        for (const auto& [term, count] : tfs) {
            if (count > 0) ++df[term];
        }
    }

    std::vector<LexicalHit> hits;
    for (size_t i = 0; i < n; ++i) {
        if (doc_tf[i].empty()) continue;
        double norm = 1.0 - params_.b + params_.b * (doc_len[i] / avg_len);
        double score = 0.0;
        for (const auto& [term, tf] : doc_tf[i]) {
            double d = df[term];
            // IDF = log(1 + (N - df + 0.5) / (df + 0.5))
            double idf = std::log(1.0 + (n - d + 0.5) / (d + 0.5));
            score += idf * (tf * (params_.k1 + 1.0)) / (tf + params_.k1 * norm);
        }
        hits.push_back({docs_[i].record, score});
    }

    std::stable_sort(hits.begin(), hits.end(), [](const LexicalHit& a, const LexicalHit& b) {
        return a.score > b.score;
    });
    if (hits.size() > static_cast<size_t>(limit)) hits.resize(limit);
    return hits;
}

} // namespace app_retrieval
