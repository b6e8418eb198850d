#include "core/embedding/tokenizer.h"

#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

namespace sl {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSeqLength)
    : m_maxSeqLength(std::clamp(maxSeqLength, 8, 512))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(slCore, "WordPieceTokenizer: cannot open vocab %s", qPrintable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int64_t id = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), id);
        }
        ++id;
    }

    m_loaded = !m_vocab.empty();
    if (!m_loaded) {
        LOG_WARN(slCore, "WordPieceTokenizer: empty vocab %s", qPrintable(vocabPath));
    }
}

std::unique_ptr<WordPieceTokenizer> WordPieceTokenizer::fromManifest(
    const ModelManifestEntry& entry, const QString& modelsDir)
{
    if (entry.tokenizer != QLatin1String("wordpiece")) {
        LOG_WARN(slCore, "WordPieceTokenizer: unsupported tokenizer '%s' for '%s'",
                 qPrintable(entry.tokenizer), qPrintable(entry.name));
        return nullptr;
    }
    if (entry.vocab.isEmpty()) {
        LOG_WARN(slCore, "WordPieceTokenizer: '%s' names no vocab", qPrintable(entry.name));
        return nullptr;
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(
        QDir(modelsDir).filePath(entry.vocab), entry.maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return nullptr;
    }
    return tokenizer;
}

QString WordPieceTokenizer::normalize(const QString& text)
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QString out;
    out.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        switch (ch.category()) {
        case QChar::Mark_NonSpacing:
        case QChar::Mark_SpacingCombining:
        case QChar::Mark_Enclosing:
            break;
        case QChar::Punctuation_Connector:
        case QChar::Punctuation_Dash:
        case QChar::Punctuation_Open:
        case QChar::Punctuation_Close:
        case QChar::Punctuation_InitialQuote:
        case QChar::Punctuation_FinalQuote:
        case QChar::Punctuation_Other:
            // BERT splits punctuation into its own token.
            out.append(QLatin1Char(' '));
            out.append(ch);
            out.append(QLatin1Char(' '));
            break;
        default:
            out.append(ch);
            break;
        }
    }

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    out.replace(whitespace, QStringLiteral(" "));
    return out.trimmed();
}

bool WordPieceTokenizer::appendWord(const QString& word, std::vector<int64_t>& out) const
{
    std::vector<int64_t> pieces;
    int start = 0;
    while (start < word.size()) {
        int end = word.size();
        int64_t matched = -1;
        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matched = it->second;
                break;
            }
            --end;
        }
        if (matched < 0) {
            out.push_back(kUnkId);
            return false;
        }
        pieces.push_back(matched);
        start = end;
    }
    out.insert(out.end(), pieces.begin(), pieces.end());
    return true;
}

std::vector<int64_t> WordPieceTokenizer::wordPieces(const QString& text, int limit) const
{
    std::vector<int64_t> out;
    const QStringList words = normalize(text).split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (static_cast<int>(out.size()) >= limit) {
            break;
        }
        appendWord(word, out);
    }
    if (static_cast<int>(out.size()) > limit) {
        out.resize(static_cast<size_t>(limit));
    }
    return out;
}

Encoding WordPieceTokenizer::encode(const QString& text) const
{
    Encoding enc;
    if (!m_loaded) {
        return enc;
    }

    const std::vector<int64_t> content = wordPieces(text, m_maxSeqLength - 2);
    enc.inputIds.push_back(kClsId);
    enc.inputIds.insert(enc.inputIds.end(), content.begin(), content.end());
    enc.inputIds.push_back(kSepId);

    enc.rows = 1;
    enc.seqLength = static_cast<int>(enc.inputIds.size());
    enc.attentionMask.assign(enc.inputIds.size(), 1);
    enc.tokenTypeIds.assign(enc.inputIds.size(), 0);
    return enc;
}

Encoding WordPieceTokenizer::encodePairs(
    const std::vector<std::pair<QString, QString>>& pairs) const
{
    Encoding enc;
    if (!m_loaded || pairs.empty()) {
        return enc;
    }

    const int budget = m_maxSeqLength - 3;
    std::vector<std::pair<std::vector<int64_t>, std::vector<int64_t>>> rows;
    rows.reserve(pairs.size());
    int longest = 0;
    for (const auto& pair : pairs) {
        std::vector<int64_t> a = wordPieces(pair.first, budget);
        std::vector<int64_t> b = wordPieces(pair.second, budget);
        const int overflow = static_cast<int>(a.size() + b.size()) - budget;
        if (overflow > 0) {
            const int keepB = std::max(budget / 2, static_cast<int>(b.size()) - overflow);
            b.resize(std::min(b.size(), static_cast<size_t>(keepB)));
            const int keepA = budget - static_cast<int>(b.size());
            a.resize(std::min(a.size(), static_cast<size_t>(keepA)));
        }
        longest = std::max(longest, static_cast<int>(a.size() + b.size()) + 3);
        rows.emplace_back(std::move(a), std::move(b));
    }

    enc.rows = static_cast<int>(rows.size());
    enc.seqLength = longest;
    const size_t total = static_cast<size_t>(enc.rows) * static_cast<size_t>(longest);
    enc.inputIds.assign(total, kPadId);
    enc.attentionMask.assign(total, 0);
    enc.tokenTypeIds.assign(total, 0);

    for (size_t r = 0; r < rows.size(); ++r) {
        const auto& a = rows[r].first;
        const auto& b = rows[r].second;
        size_t pos = r * static_cast<size_t>(longest);
        auto put = [&](int64_t id, int64_t segment) {
            enc.inputIds[pos] = id;
            enc.attentionMask[pos] = 1;
            enc.tokenTypeIds[pos] = segment;
            ++pos;
        };
        put(kClsId, 0);
        for (int64_t id : a) {
            put(id, 0);
        }
        put(kSepId, 0);
        for (int64_t id : b) {
            put(id, 1);
        }
        put(kSepId, 1);
    }
    return enc;
}

} // namespace sl
