#include "core/ranking/coverage_estimator.h"

#include <algorithm>

namespace sl {

std::vector<EvidenceHit> CoverageEstimator::grade(const std::vector<Candidate>& candidates,
                                                  const std::vector<double>& scores,
                                                  const TierThresholds& tiers)
{
    std::vector<EvidenceHit> out;
    out.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        EvidenceHit hit;
        hit.candidate = candidates[i];
        hit.candidate.judgeScore = i < scores.size() ? std::clamp(scores[i], 0.0, 1.0) : 0.0;
        hit.tier = tiers.tierFor(hit.candidate.judgeScore);
        out.push_back(std::move(hit));
    }
    return out;
}

Estimate CoverageEstimator::estimate(const std::vector<EvidenceHit>& graded, const Options& options)
{
    Estimate est;
    const double floor = options.nearMissFraction * options.jmin;
    for (const EvidenceHit& hit : graded) {
        const double j = hit.candidate.judgeScore;
        if (j >= options.jmin) {
            est.hits.push_back(hit);
        } else if (j >= floor) {
            est.nearMiss.push_back(hit);
        }
    }

    const auto byKey = [&options](const EvidenceHit& a, const EvidenceHit& b) {
        return hitLess(a, b, options.sortKey);
    };
    std::stable_sort(est.hits.begin(), est.hits.end(), byKey);
    std::stable_sort(est.nearMiss.begin(), est.nearMiss.end(), byKey);
    if (static_cast<int>(est.nearMiss.size()) > std::max(options.nearMissMax, 0)) {
        est.nearMiss.resize(static_cast<size_t>(std::max(options.nearMissMax, 0)));
    }

    est.noEvidence = est.hits.empty();
    est.confidence = est.hits.empty() ? 0.0 : est.hits.front().candidate.judgeScore;

    const bool anyGood = std::any_of(est.hits.begin(), est.hits.end(), [](const EvidenceHit& h) {
        return h.tier == Tier::Strong || h.tier == Tier::Solid;
    });
    if (est.hits.size() >= 3 && anyGood) {
        est.coverage = Coverage::High;
    } else if (!est.hits.empty()) {
        est.coverage = Coverage::Medium;
    } else {
        est.coverage = Coverage::Low;
    }
    return est;
}

} // namespace sl
