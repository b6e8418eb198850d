#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/evidence.h"
#include "core/shared/query_mode.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace sl {

// A validated search call. Built only through fromJson().
struct SearchRequest {
    QString query;
    QStringList pubs;                    // empty = every configured publisher
    double jmin = 0.3;
    SortKey sort = SortKey::Judge;
    QueryMode mode = QueryMode::Balanced;
    std::optional<JudgeMode> judgeMode;  // unset = the mode's default
    bool showNearMiss = true;
    int page = 1;
    int pageSize = 20;

    static constexpr int kMaxPageSize = 50;

    // Returns nullopt when any field is invalid; `fieldErrors` then maps
    // each offending field to a message.
    static std::optional<SearchRequest> fromJson(const QJsonObject& params, const EngineConfig& config,
                                                 QJsonObject* fieldErrors);

    JudgeMode effectiveJudgeMode(const ModeTable& modes) const;
    QStringList effectivePublishers(const EngineConfig& config) const;
    QJsonObject toJson() const;
};

} // namespace sl
