#include "core/ranking/diversity_selector.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace sl {

namespace {

double cosine(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        na += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        nb += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }
    if (na <= 0.0 || nb <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

} // namespace

double DiversitySelector::similarity(const Candidate& a, const Candidate& b)
{
    if (a.embedding && b.embedding) {
        return cosine(a.embedding.value(), b.embedding.value());
    }
    if (a.chunk.publisher != b.chunk.publisher || a.chunk.book != b.chunk.book) {
        return 0.0;
    }
    return a.chunk.section == b.chunk.section ? 1.0 : 0.5;
}

std::vector<Candidate> DiversitySelector::select(const std::vector<Candidate>& candidates, int finalK,
                                                 double lambda)
{
    std::vector<Candidate> picked;
    if (finalK <= 0 || candidates.empty()) {
        return picked;
    }

    // Drop duplicate keys up front so the selection can never repeat one.
    std::vector<const Candidate*> pool;
    std::unordered_set<ChunkKey, ChunkKeyHash> seen;
    for (const Candidate& c : candidates) {
        if (seen.insert(keyOf(c.chunk)).second) {
            pool.push_back(&c);
        }
    }

    const double lam = std::clamp(lambda, 0.0, 1.0);
    std::vector<double> maxSim(pool.size(), 0.0);
    std::vector<bool> taken(pool.size(), false);
    const size_t target = std::min(pool.size(), static_cast<size_t>(finalK));

    while (picked.size() < target) {
        size_t best = pool.size();
        double bestScore = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < pool.size(); ++i) {
            if (taken[i]) {
                continue;
            }
            const double score = lam * pool[i]->fScore - (1.0 - lam) * maxSim[i];
            // Strict comparison keeps the earlier fused rank on ties.
            if (score > bestScore) {
                bestScore = score;
                best = i;
            }
        }
        if (best == pool.size()) {
            break;
        }

        taken[best] = true;
        picked.push_back(*pool[best]);
        for (size_t i = 0; i < pool.size(); ++i) {
            if (!taken[i]) {
                maxSim[i] = std::max(maxSim[i], similarity(*pool[i], *pool[best]));
            }
        }
    }
    return picked;
}

} // namespace sl
