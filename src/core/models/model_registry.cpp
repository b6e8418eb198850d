#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QDir>

namespace sl {

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(modelsDir)
{
    const QString manifestPath = QDir(m_modelsDir).filePath(QStringLiteral("manifest.json"));
    std::optional<ModelManifest> loaded = ModelManifest::loadFromFile(manifestPath);
    if (loaded.has_value()) {
        m_manifest = std::move(loaded.value());
        LOG_INFO(slCore, "ModelRegistry: %zu model role(s) in %s",
                 m_manifest.models.size(), qPrintable(manifestPath));
    } else {
        LOG_WARN(slCore, "ModelRegistry: no usable manifest at %s", qPrintable(manifestPath));
    }
}

ModelRegistry::~ModelRegistry() = default;

ModelSession* ModelRegistry::getSession(const std::string& role)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto sessionIt = m_sessions.find(role);
    if (sessionIt != m_sessions.end()) {
        return sessionIt->second.get();
    }
    if (m_failed.count(role) > 0) {
        return nullptr;
    }

    auto manifestIt = m_manifest.models.find(role);
    if (manifestIt == m_manifest.models.end()) {
        LOG_DEBUG(slCore, "ModelRegistry: no manifest entry for role '%s'", role.c_str());
        m_failed[role] = true;
        return nullptr;
    }

    const ModelManifestEntry& manifestEntry = manifestIt->second;
    auto session = std::make_unique<ModelSession>(manifestEntry);
    if (!session->initialize(QDir(m_modelsDir).filePath(manifestEntry.file))) {
        LOG_WARN(slCore, "ModelRegistry: role '%s' unavailable", role.c_str());
        m_failed[role] = true;
        return nullptr;
    }

    ModelSession* raw = session.get();
    m_sessions[role] = std::move(session);
    return raw;
}

bool ModelRegistry::hasModel(const std::string& role) const
{
    return m_manifest.models.find(role) != m_manifest.models.end();
}

const ModelManifestEntry* ModelRegistry::entry(const std::string& role) const
{
    auto it = m_manifest.models.find(role);
    return it == m_manifest.models.end() ? nullptr : &it->second;
}

const ModelManifest& ModelRegistry::manifest() const
{
    return m_manifest;
}

const QString& ModelRegistry::modelsDir() const
{
    return m_modelsDir;
}

} // namespace sl
