#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(slCore)
Q_DECLARE_LOGGING_CATEGORY(slCorpus)
Q_DECLARE_LOGGING_CATEGORY(slRetrieval)
Q_DECLARE_LOGGING_CATEGORY(slRanking)
Q_DECLARE_LOGGING_CATEGORY(slIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
