#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

namespace sl {

// <dataRoot>/<Publisher>/manifest.json, written when the corpus was built.
struct CorpusManifest {
    QString publisher;
    QString embeddingModel;
    int dimensions = 0;
    int chunkCount = 0;
    QString builtAt;

    QJsonObject toJson() const;
    static std::optional<CorpusManifest> fromJson(const QJsonObject& json, QString* errorOut = nullptr);

    static std::optional<CorpusManifest> loadFromFile(const QString& path, QString* errorOut = nullptr);
    bool save(const QString& path) const;
};

} // namespace sl
