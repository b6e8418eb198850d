#pragma once

#include "core/shared/evidence.h"

#include <vector>

namespace sl {

struct FusionConfig {
    int rrfK = 60;
    double denseWeight = 1.0;
    double lexicalWeight = 1.0;
};

// Reciprocal rank fusion of the dense and lexical lists of one corpus.
class RankFusion {
public:
    // score = sum over lists of weight / (rrfK + rank), rank 1-based.
    // Each list is deduplicated by (book, chunk_idx) first. The result is
    // ordered by fused score (ties: chunk_idx, book, publisher), capped at
    // `cap`, and carries 1-based fusedRank.
    static std::vector<Candidate> fuse(const std::vector<ScoredChunk>& dense,
                                       const std::vector<ScoredChunk>& lexical,
                                       const FusionConfig& config, int cap);

    // Best attainable fused score: first in every list.
    static double maxFusedScore(const FusionConfig& config);

    // Merges per-corpus fused lists into one ranking by f_score.
    static std::vector<Candidate> mergeCorpora(const std::vector<std::vector<Candidate>>& lists, int cap);

    static bool fusedBefore(const Candidate& a, const Candidate& b);
};

} // namespace sl
