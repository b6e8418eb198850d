#include "core/retrieval/dense_retriever.h"

#include "core/corpus/corpus_registry.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace sl {

DenseRetriever::Result DenseRetriever::retrieve(const std::vector<float>& queryVector,
                                                const CorpusHandle& corpus, int k, double minScore)
{
    Result result;
    if (!corpus.denseEnabled() || queryVector.empty() || k <= 0) {
        return result;
    }

    const std::vector<VectorIndex::KnnResult> knn = corpus.index->search(queryVector, k);

    std::vector<int64_t> labels;
    labels.reserve(knn.size());
    for (const VectorIndex::KnnResult& entry : knn) {
        if (1.0 - static_cast<double>(entry.distance) >= minScore) {
            labels.push_back(static_cast<int64_t>(entry.label));
        } else {
            ++result.belowThreshold;
        }
    }

    const auto rows = corpus.store->chunksByLabels(labels);
    for (const VectorIndex::KnnResult& entry : knn) {
        const double similarity = 1.0 - static_cast<double>(entry.distance);
        if (similarity < minScore) {
            continue;
        }
        auto it = rows.find(static_cast<int64_t>(entry.label));
        if (it == rows.end()) {
            ++result.missingRows;
            continue;
        }
        ScoredChunk hit;
        hit.chunk = it->second;
        hit.score = similarity;
        hit.normalized = std::clamp(similarity, 0.0, 1.0);
        result.hits.push_back(std::move(hit));
    }

    if (result.missingRows > 0) {
        LOG_WARN(slRetrieval, "dense %s: %d labels without store rows",
                 qPrintable(corpus.publisher), result.missingRows);
    }
    return result;
}

} // namespace sl
