#include "core/shared/config_loader.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace sl {

namespace {

QString envValue(const char* name)
{
    return qEnvironmentVariable(name).trimmed();
}

QJsonObject profileToJson(const ModeProfile& profile)
{
    QJsonObject json;
    json.insert(QStringLiteral("final_k"), profile.finalK);
    json.insert(QStringLiteral("mmr_k"), profile.mmrK);
    json.insert(QStringLiteral("dense_k"), profile.denseK);
    json.insert(QStringLiteral("lex_k"), profile.lexK);
    json.insert(QStringLiteral("lambda"), profile.mmrLambda);
    json.insert(QStringLiteral("judge_mode"), judgeModeToString(profile.defaultJudgeMode));
    return json;
}

ModeProfile profileFromJson(const QJsonObject& json, ModeProfile profile)
{
    profile.finalK = json.value(QStringLiteral("final_k")).toInt(profile.finalK);
    profile.mmrK = json.value(QStringLiteral("mmr_k")).toInt(profile.mmrK);
    profile.denseK = json.value(QStringLiteral("dense_k")).toInt(profile.denseK);
    profile.lexK = json.value(QStringLiteral("lex_k")).toInt(profile.lexK);
    profile.mmrLambda = json.value(QStringLiteral("lambda")).toDouble(profile.mmrLambda);
    if (json.contains(QStringLiteral("judge_mode"))) {
        const auto mode = judgeModeFromString(json.value(QStringLiteral("judge_mode")).toString());
        if (mode.has_value()) {
            profile.defaultJudgeMode = mode.value();
        } else {
            LOG_WARN(slCore, "Ignoring unknown judge_mode in mode profile");
        }
    }
    return profile;
}

} // namespace

std::optional<EngineConfig> ConfigLoader::load(QString* errorOut)
{
    const QString dataRoot = envValue("SOURCELIGHT_DATA_DIR").isEmpty()
        ? defaultDataRoot()
        : QDir::cleanPath(envValue("SOURCELIGHT_DATA_DIR"));
    const QString envConfig = envValue("SOURCELIGHT_CONFIG");
    const QString path = envConfig.isEmpty() ? configFilePath(dataRoot) : QDir::cleanPath(envConfig);

    if (!QFileInfo::exists(path)) {
        if (!envConfig.isEmpty()) {
            if (errorOut) {
                *errorOut = QStringLiteral("Config file not found: %1").arg(path);
            }
            return std::nullopt;
        }
        LOG_INFO(slCore, "No config file at %s, using defaults", qUtf8Printable(path));
        EngineConfig config;
        config.dataRoot = dataRoot;
        applyEnvironment(config);
        if (!validate(config, errorOut)) {
            return std::nullopt;
        }
        return config;
    }

    return loadFromFile(path, errorOut);
}

std::optional<EngineConfig> ConfigLoader::loadFromFile(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(slCore, "Failed to open config file for read: %s", qUtf8Printable(path));
        if (errorOut) {
            *errorOut = QStringLiteral("Cannot open config file: %1").arg(path);
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(slCore, "Failed to parse config JSON (%s): %s",
                 qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        if (errorOut) {
            *errorOut = QStringLiteral("Invalid config JSON in %1: %2")
                            .arg(path, parseError.errorString());
        }
        return std::nullopt;
    }

    EngineConfig config = fromJson(doc.object());
    if (config.dataRoot.isEmpty()) {
        config.dataRoot = QFileInfo(path).absolutePath();
    }
    applyEnvironment(config);
    if (!validate(config, errorOut)) {
        return std::nullopt;
    }
    return config;
}

bool ConfigLoader::save(const EngineConfig& config, const QString& path)
{
    const QString parentDir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(slCore, "Failed to create config directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(slCore, "Failed to open config file for write: %s", qUtf8Printable(path));
        return false;
    }

    const qint64 written = file.write(QJsonDocument(toJson(config)).toJson(QJsonDocument::Indented));
    if (written < 0) {
        LOG_ERROR(slCore, "Failed to write config file: %s", qUtf8Printable(path));
        return false;
    }
    return true;
}

QString ConfigLoader::defaultDataRoot()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/sourcelight");
}

QString ConfigLoader::configFilePath(const QString& dataRoot)
{
    return QDir::cleanPath(dataRoot + QStringLiteral("/engine.json"));
}

QJsonObject ConfigLoader::toJson(const EngineConfig& config)
{
    QJsonObject json;
    json.insert(QStringLiteral("dataRoot"), config.dataRoot);
    json.insert(QStringLiteral("publishers"), QJsonArray::fromStringList(config.publishers));
    json.insert(QStringLiteral("modelsDir"), config.modelsDir);
    json.insert(QStringLiteral("minDenseScore"), config.minDenseScore);
    json.insert(QStringLiteral("embedCacheSize"), config.embedCacheSize);
    json.insert(QStringLiteral("retrievalWorkers"), config.retrievalWorkers);
    json.insert(QStringLiteral("rrfK"), config.rrfK);
    json.insert(QStringLiteral("denseWeight"), config.denseWeight);
    json.insert(QStringLiteral("lexicalWeight"), config.lexicalWeight);

    QJsonObject tiers;
    tiers.insert(QStringLiteral("strong"), config.tiers.strong);
    tiers.insert(QStringLiteral("solid"), config.tiers.solid);
    tiers.insert(QStringLiteral("weak"), config.tiers.weak);
    json.insert(QStringLiteral("tiers"), tiers);

    json.insert(QStringLiteral("judgeTopK"), config.judgeTopK);
    json.insert(QStringLiteral("judgeBudgetMs"), config.judgeBudgetMs);
    json.insert(QStringLiteral("judgeWorkers"), config.judgeWorkers);
    json.insert(QStringLiteral("judgeQueueLimit"), config.judgeQueueLimit);
    json.insert(QStringLiteral("judgeCacheSize"), config.judgeCacheSize);
    json.insert(QStringLiteral("judgeCacheTtlSec"), config.judgeCacheTtlSec);
    json.insert(QStringLiteral("proxySemanticWeight"), config.proxySemanticWeight);
    json.insert(QStringLiteral("proxyLexicalWeight"), config.proxyLexicalWeight);
    json.insert(QStringLiteral("defaultJmin"), config.defaultJmin);
    json.insert(QStringLiteral("nearMissFraction"), config.nearMissFraction);
    json.insert(QStringLiteral("nearMissMax"), config.nearMissMax);
    json.insert(QStringLiteral("queryTimeoutMs"), config.queryTimeoutMs);

    QJsonObject modes;
    for (QueryMode mode : ModeTable::kAllModes) {
        modes.insert(queryModeToString(mode), profileToJson(config.modes.profile(mode)));
    }
    json.insert(QStringLiteral("modes"), modes);

    json.insert(QStringLiteral("snippetChars"), config.snippetChars);
    json.insert(QStringLiteral("maxSnippetChars"), config.maxSnippetChars);
    json.insert(QStringLiteral("maxTextChars"), config.maxTextChars);
    json.insert(QStringLiteral("recentQueryLog"), config.recentQueryLog);
    json.insert(QStringLiteral("recentQueryLimit"), config.recentQueryLimit);
    return json;
}

EngineConfig ConfigLoader::fromJson(const QJsonObject& json)
{
    EngineConfig config;

    config.dataRoot = json.value(QStringLiteral("dataRoot")).toString(config.dataRoot);
    if (json.contains(QStringLiteral("publishers"))) {
        config.publishers.clear();
        for (const QJsonValue& value : json.value(QStringLiteral("publishers")).toArray()) {
            const QString publisher = value.toString().trimmed();
            if (!publisher.isEmpty() && !config.publishers.contains(publisher)) {
                config.publishers.append(publisher);
            }
        }
    }
    config.modelsDir = json.value(QStringLiteral("modelsDir")).toString(config.modelsDir);

    config.minDenseScore = json.value(QStringLiteral("minDenseScore")).toDouble(config.minDenseScore);
    config.embedCacheSize = json.value(QStringLiteral("embedCacheSize")).toInt(config.embedCacheSize);
    config.retrievalWorkers = json.value(QStringLiteral("retrievalWorkers")).toInt(config.retrievalWorkers);
    config.rrfK = json.value(QStringLiteral("rrfK")).toInt(config.rrfK);
    config.denseWeight = json.value(QStringLiteral("denseWeight")).toDouble(config.denseWeight);
    config.lexicalWeight = json.value(QStringLiteral("lexicalWeight")).toDouble(config.lexicalWeight);

    const QJsonObject tiers = json.value(QStringLiteral("tiers")).toObject();
    config.tiers.strong = tiers.value(QStringLiteral("strong")).toDouble(config.tiers.strong);
    config.tiers.solid = tiers.value(QStringLiteral("solid")).toDouble(config.tiers.solid);
    config.tiers.weak = tiers.value(QStringLiteral("weak")).toDouble(config.tiers.weak);

    config.judgeTopK = json.value(QStringLiteral("judgeTopK")).toInt(config.judgeTopK);
    config.judgeBudgetMs = json.value(QStringLiteral("judgeBudgetMs")).toInt(config.judgeBudgetMs);
    config.judgeWorkers = json.value(QStringLiteral("judgeWorkers")).toInt(config.judgeWorkers);
    config.judgeQueueLimit = json.value(QStringLiteral("judgeQueueLimit")).toInt(config.judgeQueueLimit);
    config.judgeCacheSize = json.value(QStringLiteral("judgeCacheSize")).toInt(config.judgeCacheSize);
    config.judgeCacheTtlSec = json.value(QStringLiteral("judgeCacheTtlSec")).toInt(config.judgeCacheTtlSec);
    config.proxySemanticWeight = json.value(QStringLiteral("proxySemanticWeight"))
                                     .toDouble(config.proxySemanticWeight);
    config.proxyLexicalWeight = json.value(QStringLiteral("proxyLexicalWeight"))
                                    .toDouble(config.proxyLexicalWeight);
    config.defaultJmin = json.value(QStringLiteral("defaultJmin")).toDouble(config.defaultJmin);
    config.nearMissFraction = json.value(QStringLiteral("nearMissFraction"))
                                  .toDouble(config.nearMissFraction);
    config.nearMissMax = json.value(QStringLiteral("nearMissMax")).toInt(config.nearMissMax);
    config.queryTimeoutMs = json.value(QStringLiteral("queryTimeoutMs")).toInt(config.queryTimeoutMs);

    const QJsonObject modes = json.value(QStringLiteral("modes")).toObject();
    for (QueryMode mode : ModeTable::kAllModes) {
        const QString name = queryModeToString(mode);
        if (modes.contains(name)) {
            config.modes.setProfile(
                mode, profileFromJson(modes.value(name).toObject(), config.modes.profile(mode)));
        }
    }

    config.snippetChars = json.value(QStringLiteral("snippetChars")).toInt(config.snippetChars);
    config.maxSnippetChars = json.value(QStringLiteral("maxSnippetChars")).toInt(config.maxSnippetChars);
    config.maxTextChars = json.value(QStringLiteral("maxTextChars")).toInt(config.maxTextChars);
    config.recentQueryLog = json.value(QStringLiteral("recentQueryLog")).toString(config.recentQueryLog);
    config.recentQueryLimit = json.value(QStringLiteral("recentQueryLimit")).toInt(config.recentQueryLimit);
    return config;
}

void ConfigLoader::applyEnvironment(EngineConfig& config)
{
    const QString dataDir = envValue("SOURCELIGHT_DATA_DIR");
    if (!dataDir.isEmpty()) {
        config.dataRoot = QDir::cleanPath(dataDir);
    }
    if (config.dataRoot.isEmpty()) {
        config.dataRoot = defaultDataRoot();
    }

    const QString modelsDir = envValue("SOURCELIGHT_MODELS_DIR");
    if (!modelsDir.isEmpty()) {
        config.modelsDir = QDir::cleanPath(modelsDir);
    }
    if (config.modelsDir.isEmpty()) {
        config.modelsDir = QDir::cleanPath(config.dataRoot + QStringLiteral("/models"));
    }

    const QString recentLog = envValue("SOURCELIGHT_RECENT_LOG");
    if (!recentLog.isEmpty()) {
        config.recentQueryLog = QDir::cleanPath(recentLog);
    }
    if (config.recentQueryLog.isEmpty()) {
        config.recentQueryLog = QDir::cleanPath(config.dataRoot + QStringLiteral("/recent_queries.json"));
    }
}

bool ConfigLoader::validate(const EngineConfig& config, QString* errorOut)
{
    QStringList problems;

    if (config.publishers.isEmpty()) {
        problems << QStringLiteral("publishers must not be empty");
    }
    const TierThresholds& t = config.tiers;
    if (!(t.strong <= 1.0 && t.strong > t.solid && t.solid > t.weak && t.weak >= 0.0)) {
        problems << QStringLiteral("tiers must satisfy 1 >= strong > solid > weak >= 0");
    }
    if (config.rrfK < 1) {
        problems << QStringLiteral("rrfK must be >= 1");
    }
    if (config.denseWeight < 0.0 || config.lexicalWeight < 0.0
        || config.denseWeight + config.lexicalWeight <= 0.0) {
        problems << QStringLiteral("fusion weights must be non-negative with a positive sum");
    }
    if (config.nearMissFraction < 0.0 || config.nearMissFraction > 1.0) {
        problems << QStringLiteral("nearMissFraction must be within [0,1]");
    }
    if (config.judgeWorkers < 1 || config.judgeQueueLimit < 1 || config.retrievalWorkers < 1) {
        problems << QStringLiteral("worker and queue sizes must be >= 1");
    }
    if (config.judgeBudgetMs < 1 || config.queryTimeoutMs < 1) {
        problems << QStringLiteral("timeouts must be >= 1 ms");
    }
    for (QueryMode mode : ModeTable::kAllModes) {
        const ModeProfile& p = config.modes.profile(mode);
        if (p.finalK < 1 || p.mmrK < 1 || p.denseK < 1 || p.lexK < 1) {
            problems << QStringLiteral("mode '%1' budgets must be >= 1").arg(queryModeToString(mode));
        }
        if (p.mmrLambda < 0.0 || p.mmrLambda > 1.0) {
            problems << QStringLiteral("mode '%1' lambda must be within [0,1]").arg(queryModeToString(mode));
        }
    }

    if (problems.isEmpty()) {
        return true;
    }

    const QString message = problems.join(QStringLiteral("; "));
    LOG_WARN(slCore, "Invalid engine config: %s", qUtf8Printable(message));
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

} // namespace sl
