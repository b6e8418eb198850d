#pragma once

#include "core/shared/evidence.h"

#include <vector>

namespace sl {

// Greedy maximal marginal relevance over fused candidates.
class DiversitySelector {
public:
    // Picks up to finalK candidates maximizing
    //   lambda * f_score - (1 - lambda) * max similarity to the picked set.
    // Input must be in fused order; ties go to the earlier candidate.
    static std::vector<Candidate> select(const std::vector<Candidate>& candidates, int finalK,
                                         double lambda);

    // Cosine of stored embeddings when both are present, otherwise 1.0 for
    // the same book and section, 0.5 for the same book and 0 across books.
    static double similarity(const Candidate& a, const Candidate& b);
};

} // namespace sl
