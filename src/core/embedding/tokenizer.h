#pragma once

#include "core/models/model_manifest.h"

#include <QString>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sl {

// Row-major [rows x seqLength] tensors ready to feed a BERT-style graph.
struct Encoding {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int rows = 0;
    int seqLength = 0;
};

// Lower-cased, accent-stripped WordPiece tokenizer over a BERT vocab.txt.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSeqLength = 512);

    // Resolves the vocab named by a manifest entry under modelsDir.
    // Returns nullptr if the entry is not a wordpiece model or the vocab
    // cannot be loaded.
    static std::unique_ptr<WordPieceTokenizer> fromManifest(const ModelManifestEntry& entry,
                                                            const QString& modelsDir);

    bool isLoaded() const { return m_loaded; }
    int vocabSize() const { return static_cast<int>(m_vocab.size()); }
    int maxSeqLength() const { return m_maxSeqLength; }

    // [CLS] text [SEP], one row.
    Encoding encode(const QString& text) const;

    // [CLS] a [SEP] b [SEP] per pair, padded to the longest row. The second
    // segment is truncated before the first when the pair is too long.
    Encoding encodePairs(const std::vector<std::pair<QString, QString>>& pairs) const;

    static constexpr int64_t kPadId = 0;
    static constexpr int64_t kUnkId = 100;
    static constexpr int64_t kClsId = 101;
    static constexpr int64_t kSepId = 102;

private:
    static QString normalize(const QString& text);
    std::vector<int64_t> wordPieces(const QString& text, int limit) const;
    bool appendWord(const QString& word, std::vector<int64_t>& out) const;

    std::unordered_map<std::string, int64_t> m_vocab;
    int m_maxSeqLength = 512;
    bool m_loaded = false;
};

} // namespace sl
