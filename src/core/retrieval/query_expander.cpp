#include "core/retrieval/query_expander.h"

#include <QJsonArray>
#include <QRegularExpression>
#include <QSet>

#include <utility>
#include <vector>

namespace sl {

namespace {

struct RewriteRule {
    QRegularExpression pattern;
    QString replacement;
};

const std::vector<RewriteRule>& rewriteRules()
{
    static const std::vector<RewriteRule> rules = {
        {QRegularExpression(QStringLiteral("\\bwhat\\s+is\\b"), QRegularExpression::CaseInsensitiveOption),
         QStringLiteral("definition of")},
        {QRegularExpression(QStringLiteral("\\bdefine\\b"), QRegularExpression::CaseInsensitiveOption),
         QStringLiteral("definition of")},
        {QRegularExpression(QStringLiteral("\\bmeaning\\s+of\\b"), QRegularExpression::CaseInsensitiveOption),
         QStringLiteral("definition of")},
        {QRegularExpression(QStringLiteral("\\bhow\\s+to\\b"), QRegularExpression::CaseInsensitiveOption),
         QStringLiteral("guide to")},
        {QRegularExpression(QStringLiteral("\\bvs\\b\\.?"), QRegularExpression::CaseInsensitiveOption),
         QStringLiteral("versus")},
    };
    return rules;
}

const std::vector<std::pair<QString, QStringList>>& synonymTable()
{
    static const std::vector<std::pair<QString, QStringList>> table = {
        {QStringLiteral("ai"), {QStringLiteral("artificial intelligence")}},
        {QStringLiteral("ml"), {QStringLiteral("machine learning")}},
        {QStringLiteral("nlp"), {QStringLiteral("natural language processing")}},
        {QStringLiteral("llm"), {QStringLiteral("large language model"), QStringLiteral("large language models")}},
        {QStringLiteral("rag"), {QStringLiteral("retrieval augmented generation"),
                                 QStringLiteral("retrieval-augmented generation")}},
    };
    return table;
}

} // namespace

QJsonObject QueryExpansion::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("query_rewritten")] = rewritten;
    json[QStringLiteral("rewrites")] = QJsonArray::fromStringList(rewrites);
    json[QStringLiteral("expansions")] = QJsonArray::fromStringList(expansions);
    return json;
}

QueryExpansion QueryExpander::expand(const QString& query)
{
    QueryExpansion out;
    out.original = query.trimmed();
    if (out.original.isEmpty()) {
        return out;
    }

    out.rewritten = out.original;
    for (const RewriteRule& rule : rewriteRules()) {
        if (rule.pattern.match(out.rewritten).hasMatch()) {
            out.rewritten.replace(rule.pattern, rule.replacement);
            out.rewrites << rule.replacement;
        }
    }

    static const QRegularExpression tokenRe(QStringLiteral("[A-Za-z0-9]+"));
    QStringList tokens;
    QSet<QString> seen;
    for (auto it = tokenRe.globalMatch(out.original); it.hasNext();) {
        const QString token = it.next().captured(0).toLower();
        tokens << token;
        seen.insert(token);
    }

    for (const QString& token : tokens) {
        for (const auto& entry : synonymTable()) {
            if (entry.first != token) {
                continue;
            }
            for (const QString& synonym : entry.second) {
                if (seen.contains(synonym)) {
                    continue;
                }
                seen.insert(synonym);
                out.expansions << synonym;
            }
        }
    }

    out.expanded = out.expansions.isEmpty()
        ? out.rewritten
        : out.rewritten + QLatin1Char(' ') + out.expansions.join(QLatin1Char(' '));
    return out;
}

} // namespace sl
