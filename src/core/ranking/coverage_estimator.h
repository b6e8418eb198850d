#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/evidence.h"

#include <vector>

namespace sl {

struct Estimate {
    std::vector<EvidenceHit> hits;      // judge01 >= jmin
    std::vector<EvidenceHit> nearMiss;  // just under jmin, disjoint from hits
    Coverage coverage = Coverage::Low;
    double confidence = 0.0;
    bool noEvidence = true;
};

class CoverageEstimator {
public:
    struct Options {
        double jmin = 0.3;
        SortKey sortKey = SortKey::Judge;
        double nearMissFraction = 0.5;
        int nearMissMax = 6;
    };

    // Attaches judge scores and tiers to candidates (same order).
    static std::vector<EvidenceHit> grade(const std::vector<Candidate>& candidates,
                                          const std::vector<double>& scores,
                                          const TierThresholds& tiers);

    // Splits graded hits at jmin, sorts both sides by the sort key and
    // derives coverage and confidence.
    static Estimate estimate(const std::vector<EvidenceHit>& graded, const Options& options);
};

} // namespace sl
