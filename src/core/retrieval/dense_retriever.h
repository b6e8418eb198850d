#pragma once

#include "core/shared/evidence.h"

#include <vector>

namespace sl {

struct CorpusHandle;

// kNN over a corpus' vector index with the query already embedded.
class DenseRetriever {
public:
    struct Result {
        std::vector<ScoredChunk> hits; // best first, all >= minScore
        int belowThreshold = 0;
        int missingRows = 0;           // labels with no row in the store
    };

    // `score` is 1 - distance, `normalized` the same clamped to [0,1].
    // A corpus without a dense index yields an empty result.
    static Result retrieve(const std::vector<float>& queryVector, const CorpusHandle& corpus,
                           int k, double minScore);
};

} // namespace sl
