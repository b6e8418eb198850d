#include "core/models/model_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace sl {

namespace {

std::vector<QString> stringList(const QJsonValue& value)
{
    std::vector<QString> out;
    const QJsonArray array = value.toArray();
    out.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& item : array) {
        out.push_back(item.toString());
    }
    return out;
}

std::optional<ModelManifestEntry> parseEntry(const QJsonObject& obj)
{
    const QString file = obj.value(QStringLiteral("file")).toString();
    if (file.isEmpty()) {
        return std::nullopt;
    }

    ModelManifestEntry entry;
    entry.file = file;
    entry.name = obj.value(QStringLiteral("name")).toString(file);
    entry.vocab = obj.value(QStringLiteral("vocab")).toString();
    entry.modelId = obj.value(QStringLiteral("modelId")).toString(entry.name);
    entry.tokenizer = obj.value(QStringLiteral("tokenizer")).toString(entry.tokenizer);
    entry.queryPrefix = obj.value(QStringLiteral("queryPrefix")).toString();
    entry.poolingStrategy = obj.value(QStringLiteral("poolingStrategy"))
                                .toString(entry.poolingStrategy).toLower();
    entry.dimensions = obj.value(QStringLiteral("dimensions")).toInt(0);
    entry.maxSeqLength = obj.value(QStringLiteral("maxSeqLength")).toInt(entry.maxSeqLength);
    entry.inputs = stringList(obj.value(QStringLiteral("inputs")));
    entry.outputs = stringList(obj.value(QStringLiteral("outputs")));
    return entry;
}

} // namespace

std::optional<ModelManifest> ModelManifest::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(slCore, "ModelManifest: cannot open %s", qPrintable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(slCore, "ModelManifest: invalid JSON in %s: %s",
                 qPrintable(path), qPrintable(parseError.errorString()));
        return std::nullopt;
    }

    return loadFromJson(doc.object());
}

std::optional<ModelManifest> ModelManifest::loadFromJson(const QJsonObject& root)
{
    const QJsonValue modelsValue = root.value(QStringLiteral("models"));
    if (!modelsValue.isObject()) {
        LOG_WARN(slCore, "ModelManifest: missing 'models' object");
        return std::nullopt;
    }

    ModelManifest manifest;
    const QJsonObject models = modelsValue.toObject();
    for (auto it = models.begin(); it != models.end(); ++it) {
        std::optional<ModelManifestEntry> entry = parseEntry(it.value().toObject());
        if (!entry.has_value()) {
            LOG_WARN(slCore, "ModelManifest: role '%s' has no model file, skipping",
                     qPrintable(it.key()));
            continue;
        }
        manifest.models[it.key().toStdString()] = std::move(entry.value());
    }
    return manifest;
}

} // namespace sl
