#include "core/retrieval/lexical_retriever.h"

#include "core/corpus/corpus_registry.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <algorithm>

namespace sl {

namespace {

QStringList ftsTokens(const QString& text)
{
    static const QRegularExpression tokenRe(QStringLiteral("[A-Za-z0-9]+"));
    QStringList out;
    for (auto it = tokenRe.globalMatch(text); it.hasNext();) {
        const QString token = it.next().captured(0);
        if (token.size() >= 2) {
            out << token;
        }
    }
    return out;
}

} // namespace

QString LexicalRetriever::escapeFtsQuery(const QString& query)
{
    const QString q = query.trimmed();
    if (q.isEmpty()) {
        return QString();
    }

    static const QRegularExpression phraseRe(QStringLiteral("\"([^\"]+)\"|'([^']+)'"));
    QStringList phrases;
    QString remainder;
    int last = 0;
    for (auto it = phraseRe.globalMatch(q); it.hasNext();) {
        const QRegularExpressionMatch match = it.next();
        remainder += q.mid(last, match.capturedStart() - last) + QLatin1Char(' ');
        const QString phrase = match.captured(1).isEmpty() ? match.captured(2) : match.captured(1);
        if (!phrase.isEmpty()) {
            phrases << phrase;
        }
        last = match.capturedEnd();
    }
    remainder += q.mid(last);

    QStringList terms;
    QSet<QString> seen;
    for (const QString& token : ftsTokens(remainder)) {
        const QString key = token.toLower();
        if (!seen.contains(key)) {
            seen.insert(key);
            terms << token;
        }
    }

    for (const QString& phrase : phrases) {
        const QStringList phraseTokens = ftsTokens(phrase);
        if (phraseTokens.isEmpty()) {
            continue;
        }
        const QString text = phraseTokens.join(QLatin1Char(' '));
        const QString key = text.toLower();
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        // Tokens are alphanumeric, so the phrase needs no inner escaping.
        terms << (phraseTokens.size() == 1 ? text : QLatin1Char('"') + text + QLatin1Char('"'));
    }

    return terms.join(QStringLiteral(" OR "));
}

void LexicalRetriever::normalizeScores(std::vector<ScoredChunk>& hits)
{
    if (hits.empty()) {
        return;
    }
    const auto bounds = std::minmax_element(hits.begin(), hits.end(),
        [](const ScoredChunk& a, const ScoredChunk& b) { return a.score < b.score; });
    const double lo = bounds.first->score;
    const double range = bounds.second->score - lo;
    for (ScoredChunk& hit : hits) {
        hit.normalized = range < 1e-9 ? 1.0 : (hit.score - lo) / range;
    }
}

std::optional<std::vector<ScoredChunk>> LexicalRetriever::retrieve(const QString& query,
                                                                   const CorpusHandle& corpus, int k,
                                                                   QString* errorOut)
{
    std::vector<ScoredChunk> hits;
    const QString match = escapeFtsQuery(query);
    if (match.isEmpty() || k <= 0 || !corpus.store) {
        return hits;
    }

    std::optional<std::vector<ChunkStore::FtsRow>> rows = corpus.store->searchFts(match, k, errorOut);
    if (!rows) {
        return std::nullopt;
    }

    QSet<QString> seenCids;
    hits.reserve(rows->size());
    for (ChunkStore::FtsRow& row : rows.value()) {
        if (seenCids.contains(row.chunk.cid)) {
            continue;
        }
        seenCids.insert(row.chunk.cid);
        ScoredChunk hit;
        hit.chunk = std::move(row.chunk);
        hit.score = -row.bm25;
        hits.push_back(std::move(hit));
    }
    normalizeScores(hits);

    LOG_DEBUG(slRetrieval, "lexical %s: %zu hits for '%s'", qPrintable(corpus.publisher),
              hits.size(), qPrintable(match));
    return hits;
}

} // namespace sl
