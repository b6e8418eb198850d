#include "core/query/search_request.h"

#include <QJsonArray>

namespace sl {

std::optional<SearchRequest> SearchRequest::fromJson(const QJsonObject& params,
                                                     const EngineConfig& config,
                                                     QJsonObject* fieldErrors)
{
    SearchRequest request;
    request.jmin = config.defaultJmin;
    QJsonObject errors;

    request.query = params.value(QStringLiteral("query")).toString().trimmed();
    if (request.query.isEmpty()) {
        errors[QStringLiteral("query")] = QStringLiteral("must be a non-empty string");
    }

    const QJsonValue jmin = params.value(QStringLiteral("jmin"));
    if (!jmin.isUndefined() && !jmin.isNull()) {
        if (!jmin.isDouble() || jmin.toDouble() < 0.0 || jmin.toDouble() > 1.0) {
            errors[QStringLiteral("jmin")] = QStringLiteral("must be a number in [0, 1]");
        } else {
            request.jmin = jmin.toDouble();
        }
    }

    const QJsonValue sort = params.value(QStringLiteral("sort"));
    if (!sort.isUndefined() && !sort.isNull()) {
        const std::optional<SortKey> key = sortKeyFromString(sort.toString());
        if (!key) {
            errors[QStringLiteral("sort")] = QStringLiteral("must be one of Judge, Semantic");
        } else {
            request.sort = key.value();
        }
    }

    const QJsonValue mode = params.value(QStringLiteral("mode"));
    if (!mode.isUndefined() && !mode.isNull()) {
        const std::optional<QueryMode> parsed = queryModeFromString(mode.toString());
        if (!parsed) {
            errors[QStringLiteral("mode")] = QStringLiteral("must be one of quick, balanced, thorough");
        } else {
            request.mode = parsed.value();
        }
    }

    const QJsonValue judgeMode = params.value(QStringLiteral("judge_mode"));
    if (!judgeMode.isUndefined() && !judgeMode.isNull()) {
        const std::optional<JudgeMode> parsed = judgeModeFromString(judgeMode.toString());
        if (!parsed) {
            errors[QStringLiteral("judge_mode")] = QStringLiteral("must be one of real, proxy, off");
        } else {
            request.judgeMode = parsed;
        }
    }

    request.showNearMiss = params.value(QStringLiteral("show_near_miss")).toBool(true);

    const QJsonValue page = params.value(QStringLiteral("page"));
    if (!page.isUndefined() && !page.isNull()) {
        if (!page.isDouble() || page.toInt(0) < 1 || page.toDouble() != page.toInt(0)) {
            errors[QStringLiteral("page")] = QStringLiteral("must be an integer >= 1");
        } else {
            request.page = page.toInt();
        }
    }

    const QJsonValue pageSize = params.value(QStringLiteral("page_size"));
    if (!pageSize.isUndefined() && !pageSize.isNull()) {
        const int size = pageSize.toInt(0);
        if (!pageSize.isDouble() || size < 1 || size > kMaxPageSize || pageSize.toDouble() != size) {
            errors[QStringLiteral("page_size")] =
                QStringLiteral("must be an integer in [1, %1]").arg(kMaxPageSize);
        } else {
            request.pageSize = size;
        }
    }

    const QJsonValue pubs = params.value(QStringLiteral("pubs"));
    if (!pubs.isUndefined() && !pubs.isNull()) {
        if (!pubs.isArray()) {
            errors[QStringLiteral("pubs")] = QStringLiteral("must be an array of publisher names");
        } else {
            QStringList unknown;
            for (const QJsonValue& value : pubs.toArray()) {
                const QString name = value.toString().trimmed();
                if (name.isEmpty() || !config.publishers.contains(name)) {
                    unknown << (name.isEmpty() ? QStringLiteral("<empty>") : name);
                } else if (!request.pubs.contains(name)) {
                    request.pubs << name;
                }
            }
            if (!unknown.isEmpty()) {
                errors[QStringLiteral("pubs")] = QStringLiteral("unknown publisher(s): %1; expected subset of %2")
                                                     .arg(unknown.join(QStringLiteral(", ")),
                                                          config.publishers.join(QStringLiteral(", ")));
            }
        }
    }

    if (!errors.isEmpty()) {
        if (fieldErrors) {
            *fieldErrors = errors;
        }
        return std::nullopt;
    }
    return request;
}

JudgeMode SearchRequest::effectiveJudgeMode(const ModeTable& modes) const
{
    return judgeMode.value_or(modes.profile(mode).defaultJudgeMode);
}

QStringList SearchRequest::effectivePublishers(const EngineConfig& config) const
{
    return pubs.isEmpty() ? config.publishers : pubs;
}

QJsonObject SearchRequest::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("query")] = query;
    json[QStringLiteral("pubs")] = QJsonArray::fromStringList(pubs);
    json[QStringLiteral("jmin")] = jmin;
    json[QStringLiteral("sort")] = sortKeyToString(sort);
    json[QStringLiteral("mode")] = queryModeToString(mode);
    if (judgeMode) {
        json[QStringLiteral("judge_mode")] = judgeModeToString(judgeMode.value());
    }
    json[QStringLiteral("show_near_miss")] = showNearMiss;
    json[QStringLiteral("page")] = page;
    json[QStringLiteral("page_size")] = pageSize;
    return json;
}

} // namespace sl
