#pragma once

#include <QString>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace sl {

// HNSW inner-product index over unit vectors. One per publisher corpus;
// labels are the chunk i64 ids stored alongside in meta.sqlite.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f; // 1 - inner product
    };

    // Contents of index.meta.json.
    struct IndexMetadata {
        int dimensions = 0;
        QString modelId = QStringLiteral("unknown");
        int totalElements = 0;
        uint64_t nextLabel = 0;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;

    VectorIndex();
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Builders, used when assembling a corpus.
    bool create(int dimensions, const QString& modelId, int capacity);
    bool addVector(uint64_t label, const std::vector<float>& embedding);
    bool save(const QString& indexPath, const QString& metaPath);

    bool load(const QString& indexPath, const QString& metaPath, QString* errorOut = nullptr);

    std::vector<KnnResult> search(const std::vector<float>& query, int k) const;

    // Stored vector for a label, nullopt if the label is unknown.
    std::optional<std::vector<float>> vectorForLabel(uint64_t label) const;

    bool isAvailable() const;
    int totalElements() const;
    int dimensions() const;
    const IndexMetadata& metadata() const;

    static std::optional<IndexMetadata> readMetadata(const QString& metaPath,
                                                     QString* errorOut = nullptr);

private:
    IndexMetadata m_metadata;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    mutable std::mutex m_mutex;
};

} // namespace sl
