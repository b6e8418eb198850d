#include "rag_service.h"

#include "core/embedding/embedding_manager.h"
#include "core/models/model_registry.h"
#include "core/ranking/cross_encoder_judge.h"
#include "core/shared/config_loader.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDir>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sourcelight-rag"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QString configError;
    const std::optional<sl::EngineConfig> config = sl::ConfigLoader::load(&configError);
    if (!config) {
        LOG_ERROR(slCore, "Configuration error: %s", qUtf8Printable(configError));
        return 2;
    }

    const QString modelsDir = config->modelsDir.isEmpty()
        ? QDir(config->dataRoot).filePath(QStringLiteral("models"))
        : config->modelsDir;
    sl::ModelRegistry models(modelsDir);

    auto embedder = std::make_shared<sl::EmbeddingManager>(&models);
    if (!embedder->initialize()) {
        LOG_WARN(slCore, "Query embedder unavailable, corpora load lexical-only");
    }

    sl::CrossEncoderJudgeConfig judgeConfig;
    judgeConfig.topK = config->judgeTopK;
    judgeConfig.cacheSize = config->judgeCacheSize;
    judgeConfig.cacheTtlSec = config->judgeCacheTtlSec;
    judgeConfig.proxySemanticWeight = config->proxySemanticWeight;
    judgeConfig.proxyLexicalWeight = config->proxyLexicalWeight;
    auto judge = std::make_shared<sl::CrossEncoderJudge>(&models, judgeConfig);
    if (!judge->initialize()) {
        LOG_WARN(slCore, "Cross-encoder unavailable, real judging falls back to proxy");
    }

    auto orchestrator = std::make_unique<sl::QueryOrchestrator>(
        *config, sl::QueryOrchestrator::Dependencies{embedder, judge});
    QString initError;
    if (!orchestrator->initialize(&initError)) {
        LOG_WARN(slCore, "%s", qUtf8Printable(initError));
    }

    sl::RagService service(std::move(orchestrator));
    return service.run();
}
