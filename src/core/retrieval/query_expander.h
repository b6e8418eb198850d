#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace sl {

// Result of rewriting and expanding a query for lexical retrieval.
struct QueryExpansion {
    QString original;
    QString rewritten;        // after phrase rewrites
    QString expanded;         // rewritten + appended synonyms
    QStringList rewrites;     // rewrite targets that fired, in order
    QStringList expansions;   // synonyms appended, in order

    QJsonObject toJson() const;
};

// Rule-based rewrite ("what is" -> "definition of", ...) followed by a
// small acronym synonym table. Only the lexical path consumes the result;
// dense retrieval always embeds the original text.
class QueryExpander {
public:
    static QueryExpansion expand(const QString& query);
};

} // namespace sl
