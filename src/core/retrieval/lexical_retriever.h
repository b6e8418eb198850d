#pragma once

#include "core/shared/evidence.h"

#include <QString>

#include <optional>
#include <vector>

namespace sl {

struct CorpusHandle;

// BM25 retrieval over a corpus' FTS5 table.
class LexicalRetriever {
public:
    // Builds a safe FTS5 OR-expression: alphanumeric tokens of two or more
    // characters, case-insensitively deduplicated, with quoted phrases kept
    // as phrase terms. Returns an empty string when nothing usable remains.
    static QString escapeFtsQuery(const QString& query);

    // Min-max normalizes `score` into `normalized` across the list. A
    // degenerate range maps every item to 1.0.
    static void normalizeScores(std::vector<ScoredChunk>& hits);

    // Returns nullopt (and fills errorOut) on a store error. No match is an
    // empty list. Results are ordered by bm25, best first.
    static std::optional<std::vector<ScoredChunk>> retrieve(const QString& query,
                                                            const CorpusHandle& corpus, int k,
                                                            QString* errorOut = nullptr);
};

} // namespace sl
