#include "core/corpus/corpus_manifest.h"

#include <QFile>
#include <QJsonDocument>

namespace sl {

QJsonObject CorpusManifest::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("publisher")] = publisher;
    json[QStringLiteral("embedding_model")] = embeddingModel;
    json[QStringLiteral("dimensions")] = dimensions;
    json[QStringLiteral("chunk_count")] = chunkCount;
    json[QStringLiteral("built_at")] = builtAt;
    return json;
}

std::optional<CorpusManifest> CorpusManifest::fromJson(const QJsonObject& json, QString* errorOut)
{
    const QStringList required = {
        QStringLiteral("embedding_model"), QStringLiteral("dimensions"), QStringLiteral("chunk_count"),
    };
    for (const QString& key : required) {
        if (!json.contains(key)) {
            if (errorOut) {
                *errorOut = QStringLiteral("manifest missing '%1'").arg(key);
            }
            return std::nullopt;
        }
    }

    CorpusManifest manifest;
    manifest.publisher = json.value(QStringLiteral("publisher")).toString();
    manifest.embeddingModel = json.value(QStringLiteral("embedding_model")).toString();
    manifest.dimensions = json.value(QStringLiteral("dimensions")).toInt(0);
    manifest.chunkCount = json.value(QStringLiteral("chunk_count")).toInt(-1);
    manifest.builtAt = json.value(QStringLiteral("built_at")).toString();

    if (manifest.dimensions <= 0 || manifest.chunkCount < 0) {
        if (errorOut) {
            *errorOut = QStringLiteral("manifest has invalid dimensions or chunk_count");
        }
        return std::nullopt;
    }
    return manifest;
}

std::optional<CorpusManifest> CorpusManifest::loadFromFile(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorOut) {
            *errorOut = QStringLiteral("cannot open %1").arg(path);
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("manifest is not valid JSON: %1").arg(parseError.errorString());
        }
        return std::nullopt;
    }
    return fromJson(doc.object(), errorOut);
}

bool CorpusManifest::save(const QString& path) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented)) >= 0;
}

} // namespace sl
