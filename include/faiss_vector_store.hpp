#pragma once

#include "application_record.hpp"
#include <string>
#include <vector>
#include <memory>
#include <faiss/utils/distances.h>

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace app_retrieval {

struct FaissSearchResult {
    std::shared_ptr<ApplicationRecord> record;
    float faiss_score; // inner product of unit vectors
};

class FaissVectorStore {
public:
    explicit FaissVectorStore(int dimension);
    ~FaissVectorStore(); // Destructor must be defined in .cpp

    int dimension() const { return dimension_; }

    void add_records(const std::vector<std::shared_ptr<ApplicationRecord>>& records,
                     const std::vector<std::vector<float>>& vectors);
    std::vector<FaissSearchResult> search(const std::vector<float>& query_vector, int k) const;

    // Drops every vector and record.
    void reset();

    void save(const std::string& path) const;
    void load(const std::string& path);

    size_t size() const;
    const std::vector<std::shared_ptr<ApplicationRecord>>& get_all_records() const;

private:
    int dimension_;
    std::unique_ptr<faiss::Index> index_;

    std::vector<std::shared_ptr<ApplicationRecord>> records_list_;
};

} // namespace app_retrieval
