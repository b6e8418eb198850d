#pragma once

#include <QHash>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace sl {

// One retrievable chunk as stored in a publisher's metadata store.
struct ChunkRecord {
    QString cid;
    QString filePath;      // "fp" column
    QString section;
    int chunkIdx = -1;
    QString text;
    int64_t label = -1;    // vector index label ("i64" column)
    QString book;          // stem of filePath
    QString title;         // book stem made readable
    QString publisher;
};

// Stable identity used for dedup across retrieval paths and publishers.
struct ChunkKey {
    QString publisher;
    QString book;
    int chunkIdx = -1;

    bool operator==(const ChunkKey& other) const
    {
        return chunkIdx == other.chunkIdx && book == other.book && publisher == other.publisher;
    }
    bool operator!=(const ChunkKey& other) const { return !(*this == other); }
};

inline ChunkKey keyOf(const ChunkRecord& chunk)
{
    return ChunkKey{chunk.publisher, chunk.book, chunk.chunkIdx};
}

struct ChunkKeyHash {
    size_t operator()(const ChunkKey& key) const
    {
        return qHash(key.publisher) ^ (qHash(key.book) << 1) ^ (static_cast<size_t>(key.chunkIdx) << 2);
    }
};

// Output of either retriever. `score` is the raw retrieval score (cosine
// similarity or negated bm25), `normalized` the [0,1] value surfaced to callers.
struct ScoredChunk {
    ChunkRecord chunk;
    double score = 0.0;
    double normalized = 0.0;
};

// A fused candidate flowing through selection, judging and estimation.
struct Candidate {
    ChunkRecord chunk;
    double fusedScore = 0.0;   // raw RRF sum
    double fScore = 0.0;       // fusedScore over the best attainable RRF sum
    double sScore = 0.0;
    double lScore = 0.0;
    int denseRank = 0;         // 1-based, 0 when absent from the dense list
    int lexicalRank = 0;
    int fusedRank = 0;
    double judgeScore = 0.0;
    std::optional<std::vector<float>> embedding;
};

enum class Tier {
    Strong,
    Solid,
    Weak,
    Poor,
};

QString tierToString(Tier tier);

// Lower rank value means a better tier.
inline int tierRank(Tier tier)
{
    return static_cast<int>(tier);
}

enum class Coverage {
    High,
    Medium,
    Low,
};

QString coverageToString(Coverage coverage);

enum class SortKey {
    Judge,
    Semantic,
};

std::optional<SortKey> sortKeyFromString(const QString& value);
QString sortKeyToString(SortKey key);

enum class JudgeMode {
    Real,
    Proxy,
    Off,
};

std::optional<JudgeMode> judgeModeFromString(const QString& value);
QString judgeModeToString(JudgeMode mode);

// A judged candidate with its tier, as returned to callers.
struct EvidenceHit {
    Candidate candidate;
    Tier tier = Tier::Poor;
};

// Sort-key value used for ordering hits and near-misses.
double sortValue(const EvidenceHit& hit, SortKey key);

// Descending by the sort key, ties broken by chunk_idx then book then publisher.
bool hitLess(const EvidenceHit& lhs, const EvidenceHit& rhs, SortKey key);

} // namespace sl
