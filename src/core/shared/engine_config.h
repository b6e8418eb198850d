#pragma once

#include "core/shared/query_mode.h"

#include <QString>
#include <QStringList>

namespace sl {

// Threshold ladder mapping a judge score to a tier. Must satisfy
// 1 >= strong > solid > weak >= 0.
struct TierThresholds {
    double strong = 0.75;
    double solid = 0.55;
    double weak = 0.35;

    Tier tierFor(double score) const
    {
        if (score >= strong) {
            return Tier::Strong;
        }
        if (score >= solid) {
            return Tier::Solid;
        }
        if (score >= weak) {
            return Tier::Weak;
        }
        return Tier::Poor;
    }
};

struct EngineConfig {
    // Corpora
    QString dataRoot;
    QStringList publishers = {
        QStringLiteral("OReilly"), QStringLiteral("Manning"), QStringLiteral("Pearson"),
    };
    QString modelsDir;

    // Retrieval
    double minDenseScore = 0.18;
    int embedCacheSize = 512;
    int retrievalWorkers = 4;

    // Fusion
    int rrfK = 60;
    double denseWeight = 1.0;
    double lexicalWeight = 1.0;

    // Judge
    TierThresholds tiers;
    int judgeTopK = 12;
    int judgeBudgetMs = 1500;
    int judgeWorkers = 1;
    int judgeQueueLimit = 8;
    int judgeCacheSize = 256;
    int judgeCacheTtlSec = 600;
    double proxySemanticWeight = 0.6;
    double proxyLexicalWeight = 0.4;

    // Estimation
    double defaultJmin = 0.3;
    double nearMissFraction = 0.5;
    int nearMissMax = 6;

    // Orchestration
    int queryTimeoutMs = 8000;
    ModeTable modes;

    // Presentation
    int snippetChars = 200;
    int maxSnippetChars = 850;
    int maxTextChars = 4000;

    // Recent queries
    QString recentQueryLog;
    int recentQueryLimit = 12;
};

} // namespace sl
