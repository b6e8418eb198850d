#include "core/ranking/rank_fusion.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace sl {

namespace {

double rrfContribution(double weight, int rank, int rrfK)
{
    if (rank <= 0) {
        return 0.0;
    }
    return weight / static_cast<double>(std::max(1, rrfK) + rank);
}

// First occurrence of each (book, chunk_idx) wins.
std::vector<const ScoredChunk*> dedup(const std::vector<ScoredChunk>& list)
{
    std::vector<const ScoredChunk*> out;
    out.reserve(list.size());
    std::unordered_set<ChunkKey, ChunkKeyHash> seen;
    for (const ScoredChunk& item : list) {
        if (seen.insert(keyOf(item.chunk)).second) {
            out.push_back(&item);
        }
    }
    return out;
}

void finalizeOrder(std::vector<Candidate>& candidates, int cap)
{
    std::stable_sort(candidates.begin(), candidates.end(), &RankFusion::fusedBefore);
    if (cap >= 0 && static_cast<int>(candidates.size()) > cap) {
        candidates.resize(static_cast<size_t>(cap));
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].fusedRank = static_cast<int>(i) + 1;
    }
}

} // namespace

bool RankFusion::fusedBefore(const Candidate& a, const Candidate& b)
{
    if (a.fusedScore != b.fusedScore) {
        return a.fusedScore > b.fusedScore;
    }
    if (a.chunk.chunkIdx != b.chunk.chunkIdx) {
        return a.chunk.chunkIdx < b.chunk.chunkIdx;
    }
    if (a.chunk.book != b.chunk.book) {
        return a.chunk.book < b.chunk.book;
    }
    return a.chunk.publisher < b.chunk.publisher;
}

double RankFusion::maxFusedScore(const FusionConfig& config)
{
    return rrfContribution(config.denseWeight, 1, config.rrfK)
         + rrfContribution(config.lexicalWeight, 1, config.rrfK);
}

std::vector<Candidate> RankFusion::fuse(const std::vector<ScoredChunk>& dense,
                                        const std::vector<ScoredChunk>& lexical,
                                        const FusionConfig& config, int cap)
{
    std::vector<Candidate> candidates;
    std::unordered_map<ChunkKey, size_t, ChunkKeyHash> index;

    auto candidateFor = [&](const ScoredChunk& item) -> Candidate& {
        const ChunkKey key = keyOf(item.chunk);
        auto it = index.find(key);
        if (it != index.end()) {
            return candidates[it->second];
        }
        index.emplace(key, candidates.size());
        Candidate candidate;
        candidate.chunk = item.chunk;
        candidates.push_back(std::move(candidate));
        return candidates.back();
    };

    const std::vector<const ScoredChunk*> denseList = dedup(dense);
    for (size_t i = 0; i < denseList.size(); ++i) {
        Candidate& c = candidateFor(*denseList[i]);
        c.denseRank = static_cast<int>(i) + 1;
        c.sScore = denseList[i]->normalized;
        c.fusedScore += rrfContribution(config.denseWeight, c.denseRank, config.rrfK);
    }

    const std::vector<const ScoredChunk*> lexicalList = dedup(lexical);
    for (size_t i = 0; i < lexicalList.size(); ++i) {
        Candidate& c = candidateFor(*lexicalList[i]);
        c.lexicalRank = static_cast<int>(i) + 1;
        c.lScore = lexicalList[i]->normalized;
        c.fusedScore += rrfContribution(config.lexicalWeight, c.lexicalRank, config.rrfK);
    }

    const double maxScore = maxFusedScore(config);
    for (Candidate& c : candidates) {
        c.fScore = maxScore > 0.0 ? std::clamp(c.fusedScore / maxScore, 0.0, 1.0) : 0.0;
    }

    finalizeOrder(candidates, cap);
    return candidates;
}

std::vector<Candidate> RankFusion::mergeCorpora(const std::vector<std::vector<Candidate>>& lists, int cap)
{
    std::vector<Candidate> merged;
    for (const std::vector<Candidate>& list : lists) {
        merged.insert(merged.end(), list.begin(), list.end());
    }
    finalizeOrder(merged, cap);
    return merged;
}

} // namespace sl
