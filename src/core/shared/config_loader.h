#pragma once

#include "core/shared/engine_config.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace sl {

// ConfigLoader -- JSON load/save for the engine configuration.
//
// Resolution order for the file: $SOURCELIGHT_CONFIG, then
// <dataRoot>/engine.json. A missing file yields defaults; environment
// variables (SOURCELIGHT_DATA_DIR, SOURCELIGHT_MODELS_DIR,
// SOURCELIGHT_RECENT_LOG) override whatever the file says.
class ConfigLoader {
public:
    // Returns nullopt when a config file exists but cannot be parsed or
    // fails validation.
    static std::optional<EngineConfig> load(QString* errorOut = nullptr);

    static std::optional<EngineConfig> loadFromFile(const QString& path, QString* errorOut = nullptr);
    static bool save(const EngineConfig& config, const QString& path);

    static QString defaultDataRoot();
    static QString configFilePath(const QString& dataRoot);

    static QJsonObject toJson(const EngineConfig& config);
    static EngineConfig fromJson(const QJsonObject& json);

    static void applyEnvironment(EngineConfig& config);
    static bool validate(const EngineConfig& config, QString* errorOut = nullptr);
};

} // namespace sl
