#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sl {

// One model role from <modelsDir>/manifest.json, e.g.
//   "bi-encoder":    {"name": "...", "file": "embed.onnx", "vocab": "vocab.txt",
//                     "modelId": "all-MiniLM-L6-v2", "dimensions": 384, ...}
//   "cross-encoder": {"name": "...", "file": "judge.onnx", ...}
struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    QString tokenizer = QStringLiteral("wordpiece");
    QString queryPrefix;
    QString poolingStrategy = QStringLiteral("mean"); // "mean" or "cls"
    int dimensions = 0;
    int maxSeqLength = 512;
    std::vector<QString> inputs;
    std::vector<QString> outputs;
};

struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace sl
