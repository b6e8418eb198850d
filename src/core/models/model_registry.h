#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sl {

// Loads <modelsDir>/manifest.json and hands out one lazily created
// ModelSession per role ("bi-encoder", "cross-encoder").
class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    // Returns nullptr if the role is unknown or its session fails to
    // initialize. A failed role is not retried.
    ModelSession* getSession(const std::string& role);

    bool hasModel(const std::string& role) const;
    const ModelManifestEntry* entry(const std::string& role) const;

    const ModelManifest& manifest() const;
    const QString& modelsDir() const;

    static constexpr const char* kBiEncoderRole = "bi-encoder";
    static constexpr const char* kCrossEncoderRole = "cross-encoder";

private:
    QString m_modelsDir;
    ModelManifest m_manifest;
    std::unordered_map<std::string, std::unique_ptr<ModelSession>> m_sessions;
    std::unordered_map<std::string, bool> m_failed;
    mutable std::mutex m_mutex;
};

} // namespace sl
