#include "core/ranking/judge.h"

#include <algorithm>

namespace sl {

ProxyJudge::ProxyJudge(double semanticWeight, double lexicalWeight)
    : m_semanticWeight(semanticWeight)
    , m_lexicalWeight(lexicalWeight)
{
}

double ProxyJudge::scoreOne(const Candidate& candidate) const
{
    const double blend = m_semanticWeight * candidate.sScore + m_lexicalWeight * candidate.lScore;
    return std::clamp(std::max(candidate.fScore, blend), 0.0, 1.0);
}

std::optional<std::vector<double>> ProxyJudge::score(const QString& /*query*/,
                                                     const std::vector<Candidate>& candidates,
                                                     QString* /*errorOut*/)
{
    std::vector<double> scores;
    scores.reserve(candidates.size());
    for (const Candidate& c : candidates) {
        scores.push_back(scoreOne(c));
    }
    return scores;
}

std::optional<std::vector<double>> OffJudge::score(const QString& /*query*/,
                                                   const std::vector<Candidate>& candidates,
                                                   QString* /*errorOut*/)
{
    std::vector<double> scores;
    scores.reserve(candidates.size());
    for (const Candidate& c : candidates) {
        scores.push_back(c.fScore);
    }
    return scores;
}

} // namespace sl
