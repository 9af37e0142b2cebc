#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "application_record.hpp"

namespace app_retrieval {

struct Bm25Params {
    double k1 = 1.2;
    double b = 0.75;
};

struct LexicalHit {
    std::shared_ptr<ApplicationRecord> record;
    double score;
};

// In-memory BM25 over a fixed set of record fields. Scoring runs over the
// concatenation of whichever fields a query names.
class LexicalIndex {
public:
    explicit LexicalIndex(Bm25Params params = {}) : params_(params) {}

    void rebuild(const std::vector<std::shared_ptr<ApplicationRecord>>& records);

    std::vector<LexicalHit> search(const std::string& query,
                                   const std::vector<std::string>& fields,
                                   int limit) const;

    size_t size() const { return docs_.size(); }

    // Lowercased alphanumeric runs; bytes >= 0x80 stay inside a term.
    static std::vector<std::string> tokenize(const std::string& text);

    // "text" addresses the full document text (rag_text).
    static const std::string* field_text(const ApplicationRecord& rec, const std::string& field);
    static bool is_known_field(const std::string& field);

private:
    using TermFreqs = std::unordered_map<std::string, int>;

    struct FieldStats {
        TermFreqs tf;
        int length = 0;
    };

    struct Document {
        std::shared_ptr<ApplicationRecord> record;
        std::unordered_map<std::string, FieldStats> fields;
    };

    Bm25Params params_;
    std::vector<Document> docs_;
};

} // namespace app_retrieval
